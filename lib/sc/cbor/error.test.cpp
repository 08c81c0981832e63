/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <sc/common/test.hpp>
#include <sc/cbor/error.hpp>

using namespace static_cbor;
using namespace static_cbor::cbor;

suite cbor_error_suite = [] {
    "cbor::error"_test = [] {
        "category"_test = [] {
            const boost::system::error_code ec = errc::invalid_type;
            test_same(std::string_view { ec.category().name() }, std::string_view { "cbor" });
            test_same(ec.message(), std::string { "invalid_type" });
            expect(static_cast<bool>(ec));
            expect(!boost::system::error_code { errc::success });
        };
        "conditions"_test = [] {
            expect(boost::system::error_code { errc::buffer_overflow } == boost::system::errc::no_buffer_space);
            expect(boost::system::error_code { errc::arena_overflow } == boost::system::errc::no_buffer_space);
            expect(boost::system::error_code { errc::invalid_type } == boost::system::errc::illegal_byte_sequence);
            expect(boost::system::error_code { errc::type_mismatch } == boost::system::errc::invalid_argument);
            expect(boost::system::error_code { errc::not_contiguous } == boost::system::errc::invalid_argument);
        };
        "result"_test = [] {
            const auto fail = []() -> result<int> { return errc::arena_overflow; };
            const auto ok = []() -> result<int> { return 7; };
            expect_error(fail(), errc::arena_overflow);
            expect(ok().has_value());
            test_same(ok().value(), 7);
        };
        "format"_test = [] {
            test_same(fmt::format("{}", errc::not_contiguous), std::string { "not_contiguous" });
            test_same(fmt::format("{}", static_cast<errc>(99)), std::string { "unknown" });
        };
    };
};
