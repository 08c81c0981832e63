/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

/*
 * Built against the header-only codec target alone: it does not link the tooling library,
 * so it fails to link if a codec header starts depending on the exceptions or the logger.
 */

#include <array>
#include <cstdint>
#include <string_view>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <sc/cbor/decoder.hpp>
#include <sc/cbor/encoder.hpp>

using namespace boost::ut;
using namespace static_cbor;
using namespace static_cbor::cbor;

#ifdef STATIC_CBOR_COMMON_ERROR_HPP
#   error "the codec headers must not include sc/common/error.hpp"
#endif
#ifdef STATIC_CBOR_COMMON_BYTES_HPP
#   error "the codec headers must not include sc/common/bytes.hpp"
#endif

suite codec_only_suite = [] {
    "codec without the tooling layer"_test = [] {
        "decode and re-encode"_test = [] {
            // [1, {"a": "b"}, h'0102'] followed by one trailing byte
            static constexpr std::array<uint8_t, 11> data { 0x83, 0x01, 0xA1, 0x61, 0x61, 0x61, 0x62, 0x42, 0x01, 0x02, 0xF6 };
            std::array<value, 8> arena {};
            const auto res = decode(buffer { data.data(), data.size() }, arena);
            expect(res.has_value() >> fatal);
            expect(res.value().bytes_consumed == 10);
            const auto items = res.value().root.array();
            expect(items.has_value() >> fatal);
            expect(items.value().size() == 3);
            expect(items.value()[0].uint().value() == 1);
            const auto m = items.value()[1].map();
            expect(m.has_value() >> fatal);
            expect(m.value().key(0).text().value() == std::string_view { "a" });

            std::array<uint8_t, 16> out {};
            const auto enc = encode(res.value().root, write_buffer { out.data(), out.size() });
            expect(enc.has_value() >> fatal);
            expect(enc.value() == 10);
            expect(buffer { out.data(), enc.value() } == buffer { data.data(), 10 });
        };
        "slicing with buffer constructors"_test = [] {
            static constexpr std::array<uint8_t, 3> data { 0x18, 0x2A, 0x07 };
            const buffer all { data.data(), data.size() };
            const buffer tail { all.data() + 2, all.size() - 2 };
            std::array<value, 1> arena {};
            const auto res = decode(tail, arena);
            expect(res.has_value() >> fatal);
            expect(res.value().root.uint().value() == 7);
            expect(decode(buffer { all.data(), 1 }, arena).error() == errc::buffer_overflow);
        };
        "encoder errors are results"_test = [] {
            std::array<uint8_t, 1> out {};
            const auto res = encode(value::from_uint(1000), write_buffer { out.data(), out.size() });
            expect(res.has_error());
            expect(res.error() == errc::buffer_overflow);
        };
    };
};

int main()
{
    // the default runner executes the suites on destruction and exits with a non-zero code on failures
    return 0;
}
