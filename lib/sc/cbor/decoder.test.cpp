/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <sc/common/test.hpp>
#include <sc/cbor/decoder.hpp>

using namespace static_cbor;
using namespace static_cbor::cbor;

namespace {
    struct parsed {
        uint8_vector data {};
        std::vector<value> arena {};
        result<decoded> res;

        explicit parsed(const std::string_view hex, const size_t arena_size=256):
            data { uint8_vector::from_hex(hex) }, arena(arena_size), res { decode(data, arena) }
        {
        }

        const value &root() const
        {
            return res.value().root;
        }
    };

    std::string repeat(const std::string_view s, const size_t n)
    {
        std::string res {};
        for (size_t i = 0; i < n; ++i)
            res += s;
        return res;
    }
}

suite cbor_decoder_suite = [] {
    "cbor::decoder"_test = [] {
        "uint"_test = [] {
            test_same(parsed { "00" }.root().uint().value(), 0);
            test_same(parsed { "17" }.root().uint().value(), 23);
            test_same(parsed { "182A" }.root().uint().value(), 42);
            test_same(parsed { "1903E8" }.root().uint().value(), 1000);
            test_same(parsed { "1A000F4240" }.root().uint().value(), 1000000);
            test_same(parsed { "1BFFFFFFFFFFFFFFFF" }.root().uint().value(), 0xFFFFFFFFFFFFFFFFULL);
            // non-shortest forms are accepted
            test_same(parsed { "1800" }.root().uint().value(), 0);
        };
        "nint"_test = [] {
            test_same(parsed { "20" }.root().nint().value(), 0);
            test_same(parsed { "3863" }.root().nint().value(), 99);
            test_same(parsed { "3BFFFFFFFFFFFFFFFF" }.root().nint().value(), 0xFFFFFFFFFFFFFFFFULL);
        };
        "strings"_test = [] {
            const parsed t { "6449455446" };
            test_same(t.root().text().value(), std::string_view { "IETF" });
            // strings point into the input
            expect(t.root().text().value().data() == reinterpret_cast<const char *>(t.data.data() + 1));
            test_same(parsed { "4401020304" }.root().bytes().value(), buffer { uint8_vector::from_hex("01020304") });
            test_same(parsed { "62C3BC" }.root().text().value(), std::string_view { "\xC3\xBC" });
            test_same(parsed { "60" }.root().size().value(), 0);
        };
        "invalid utf8"_test = [] {
            expect_error(parsed { "62C328" }.res, errc::invalid_type);
            // overlong encoding of '/'
            expect_error(parsed { "62C0AF" }.res, errc::invalid_type);
            // UTF-16 surrogate
            expect_error(parsed { "63EDA080" }.res, errc::invalid_type);
            // above U+10FFFF
            expect_error(parsed { "64F4908080" }.res, errc::invalid_type);
            // bytes are not validated
            expect(parsed { "42C328" }.res.has_value());
        };
        "floats"_test = [] {
            test_same(parsed { "F93C00" }.root().float64().value(), 1.0);
            test_same(parsed { "F9C400" }.root().float64().value(), -4.0);
            test_same(parsed { "F97BFF" }.root().float64().value(), 65504.0);
            test_same(parsed { "F90001" }.root().float64().value(), std::ldexp(1.0, -24));
            test_same(parsed { "F97C00" }.root().float64().value(), std::numeric_limits<double>::infinity());
            test_same(parsed { "F9FC00" }.root().float64().value(), -std::numeric_limits<double>::infinity());
            expect(std::isnan(parsed { "F97E00" }.root().float64().value()));
            expect(std::signbit(parsed { "F98000" }.root().float64().value()));
            test_same(parsed { "FA47C35000" }.root().float64().value(), 100000.0);
            test_same(parsed { "FB3FF199999999999A" }.root().float64().value(), 1.1);
        };
        "simple"_test = [] {
            test_same(parsed { "F4" }.root().boolean().value(), false);
            test_same(parsed { "F5" }.root().boolean().value(), true);
            expect(parsed { "F6" }.root().is_null());
            expect(parsed { "F7" }.root().is_undefined());
            // unassigned and one-byte simple values
            expect_error(parsed { "F0" }.res, errc::invalid_type);
            expect_error(parsed { "F820" }.res, errc::invalid_type);
            expect_error(parsed { "FF" }.res, errc::invalid_type);
        };
        "reserved additional info"_test = [] {
            for (const auto *hex: { "1C", "1D", "1E", "3C", "5C", "7D", "9E", "BC", "DC", "FC", "FD", "FE" })
                expect_error(parsed { hex }.res, errc::invalid_type);
            // indefinite integers and tags
            for (const auto *hex: { "1F", "3F", "DF" })
                expect_error(parsed { hex }.res, errc::invalid_type);
        };
        "arrays"_test = [] {
            const parsed p { "8301820203820405" };
            const auto &dec = p.res.value();
            test_same(dec.bytes_consumed, 8);
            test_same(dec.arena_used, 7);
            const auto items = dec.root.array().value();
            test_same(items.size(), 3);
            test_same(items[0].uint().value(), 1);
            test_same(items[2].array().value()[1].uint().value(), 5);
            test_same(parsed { "80" }.root().array().value().size(), 0);
        };
        "maps"_test = [] {
            const parsed p { "A26161016162820203" };
            const auto m = p.root().map().value();
            test_same(m.size(), 2);
            test_same(m.key(0).text().value(), std::string_view { "a" });
            test_same(m.val(0).uint().value(), 1);
            test_same(m.key(1).text().value(), std::string_view { "b" });
            test_same(m.val(1).array().value().size(), 2);
            // duplicate keys are kept as is
            test_same(parsed { "A201010102" }.root().map().value().size(), 2);
        };
        "tags"_test = [] {
            const parsed p { "C11A514B67B0" };
            const auto [id, item] = p.root().tag().value();
            test_same(id, 1);
            test_same(item.uint().value(), 1363896240);
            test_same(p.res.value().arena_used, 1);
            test_same(parsed { "D818456449455446" }.root().tag().value().second.bytes().value().size(), 5);
        };
        "indefinite containers"_test = [] {
            {
                const parsed p { "9F018202039F0405FFFF" };
                const auto items = p.root().array().value();
                test_same(items.size(), 3);
                test_same(items[2].array().value().size(), 2);
                test_same(items[2].array().value()[1].uint().value(), 5);
                test_same(p.res.value().bytes_consumed, 10);
            }
            {
                const parsed p { "BF61610161629F0203FFFF" };
                const auto m = p.root().map().value();
                test_same(m.size(), 2);
                test_same(m.val(1).array().value().size(), 2);
            }
            test_same(parsed { "9FFF" }.root().array().value().size(), 0);
            test_same(parsed { "BFFF" }.root().map().value().size(), 0);
            // an indefinite map with a key but no value
            expect_error(parsed { "BF01FF" }.res, errc::invalid_type);
            expect_error(parsed { "9FBF01FFFF" }.res, errc::invalid_type);
            // a break inside a definite container
            expect_error(parsed { "8201FF" }.res, errc::invalid_type);
            expect_error(parsed { "9F8201FFFF" }.res, errc::invalid_type);
        };
        "chunked strings"_test = [] {
            {
                const parsed p { "7F657374726561646D696E67FF" };
                const auto &v = p.root();
                expect(v.is_chunked());
                test_same(v.size().value(), 9);
                expect_error(v.text(), errc::not_contiguous);
                std::array<uint8_t, 9> out {};
                test_same(v.copy_bytes(out).value(), 9);
                test_same(std::string_view { reinterpret_cast<const char *>(out.data()), out.size() }, std::string_view { "streaming" });
                expect(v == value::from_text("streaming"));
            }
            {
                const parsed p { "5F42010243030405FF" };
                expect(p.root().is_chunked());
                expect(p.root() == value::from_bytes(buffer { uint8_vector::from_hex("0102030405") }));
                expect_error(p.root().bytes(), errc::not_contiguous);
            }
            // zero or one chunk produce a contiguous string
            test_same(parsed { "7F6161FF" }.root().text().value(), std::string_view { "a" });
            test_same(parsed { "5FFF" }.root().bytes().value().size(), 0);
            // chunks of another type or of indefinite length
            expect_error(parsed { "7F4161FF" }.res, errc::invalid_type);
            expect_error(parsed { "5F5F4101FFFF" }.res, errc::invalid_type);
            // each chunk must be valid UTF-8 on its own
            expect_error(parsed { "7F61C361BCFF" }.res, errc::invalid_type);
        };
        "arena overflow"_test = [] {
            expect_error(parsed { "83010203", 2 }.res, errc::arena_overflow);
            expect(parsed { "83010203", 3 }.res.has_value());
            expect_error(parsed { "A1616101", 1 }.res, errc::arena_overflow);
            expect_error(parsed { "9F010203FF", 2 }.res, errc::arena_overflow);
            expect_error(parsed { "C101", 0 }.res, errc::arena_overflow);
            test_same(parsed { "00", 0 }.root().uint().value(), 0);
        };
        "counts above the input size"_test = [] {
            // reported before any arena slot is reserved
            expect_error(parsed { "9BFFFFFFFFFFFFFFFF", 0 }.res, errc::buffer_overflow);
            expect_error(parsed { "BBFFFFFFFFFFFFFFFF", 0 }.res, errc::buffer_overflow);
            expect_error(parsed { "5BFFFFFFFFFFFFFFFF" }.res, errc::buffer_overflow);
            expect_error(parsed { "A2010203" }.res, errc::buffer_overflow);
        };
        "depth limit"_test = [] {
            const auto ok_arrays = repeat("81", default_max_depth) + "00";
            expect(parsed { ok_arrays }.res.has_value());
            const auto deep_arrays = repeat("81", default_max_depth + 1) + "00";
            expect_error(parsed { deep_arrays }.res, errc::invalid_type);
            expect(parsed { repeat("C1", default_max_depth) + "00" }.res.has_value());
            expect_error(parsed { repeat("C1", default_max_depth + 1) + "00" }.res, errc::invalid_type);
            expect(parsed { repeat("9F", default_max_depth) + repeat("FF", default_max_depth) }.res.has_value());
            expect_error(parsed { repeat("9F", default_max_depth + 1) + repeat("FF", default_max_depth + 1) }.res, errc::invalid_type);
            // a deep definite array inside an indefinite one is caught by the pre-count
            expect_error(parsed { "9F" + repeat("81", default_max_depth) + "00FF" }.res, errc::invalid_type);
            // a smaller limit
            const auto data = uint8_vector::from_hex("818180");
            std::vector<value> arena(4);
            expect(decode<3>(data, arena).has_value());
            expect_error(decode<2>(data, arena), errc::invalid_type);
        };
        "truncated"_test = [] {
            expect_error(parsed { "" }.res, errc::buffer_overflow);
            expect_error(parsed { "18" }.res, errc::buffer_overflow);
            expect_error(parsed { "1B000000" }.res, errc::buffer_overflow);
            expect_error(parsed { "6461" }.res, errc::buffer_overflow);
            expect_error(parsed { "FB3FF1" }.res, errc::buffer_overflow);
            expect_error(parsed { "C1" }.res, errc::buffer_overflow);
            expect_error(parsed { "9F01" }.res, errc::buffer_overflow);
            expect_error(parsed { "7F6161" }.res, errc::buffer_overflow);
        };
        "trailing bytes"_test = [] {
            const parsed p { "0102" };
            test_same(p.root().uint().value(), 1);
            test_same(p.res.value().bytes_consumed, 1);
        };
        "sequence"_test = [] {
            const auto data = uint8_vector::from_hex("01826161626262A0");
            std::vector<value> arena(8);
            decoder dec { data, arena };
            std::vector<value> items {};
            while (!dec.done()) {
                const auto res = dec.read();
                expect(res.has_value());
                if (!res.has_value())
                    break;
                items.emplace_back(res.value());
            }
            test_same(items.size(), 3);
            test_same(dec.bytes_consumed(), data.size());
            test_same(dec.arena_used(), 2);
            test_same(items[1].array().value()[1].text().value(), std::string_view { "bb" });
            expect_error(dec.read(), errc::buffer_overflow);
        };
    };
};
