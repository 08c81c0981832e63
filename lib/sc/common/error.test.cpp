/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cerrno>
#include <optional>
#include <sc/common/test.hpp>
#include <sc/common/bytes.hpp>
#include <sc/common/error.hpp>

using namespace static_cbor;

namespace {
    const std::string no_error_msg {
#ifdef __APPLE__
        "Undefined error: 0"
#elif _WIN32
        "No error"
#else
        "Success"
#endif
    };

    template<typename F>
    void expect_throws_msg(const F &f, const std::string &prefix, const std::source_location &src_loc=std::source_location::current())
    {
        std::optional<std::string> msg {};
        try {
            f();
        } catch (error &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg), src_loc) << "no exception has been thrown";
        if (msg)
            expect(msg->starts_with(prefix), src_loc) << fmt::format("'{}' does not start with '{}'", *msg, prefix);
    }
}

suite common_error_suite = [] {
    "common::error"_test = [] {
        "message"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, "Hello!");
            expect_throws_msg([] { throw error("Hello {}!", 123); }, "Hello 123!");
        };
        "buffer"_test = [] {
            const auto buf = uint8_vector::from_hex("DEADBEEF");
            expect_throws_msg([&] { throw error("Hello {}!", buffer { buf }); }, "Hello DEADBEEF!");
        };
        "what is stable"_test = [] {
            const error ex { "item #{} is invalid", 7 };
            const std::string first { ex.what() };
            test_same(first, std::string { ex.what() });
            test_same(std::string { "item #7 is invalid" }, first);
        };
        "error_sys"_test = [] {
            expect_throws_msg([] { errno = 0; throw error_sys("Hello world!"); }, "Hello world! errno: 0 strerror: " + no_error_msg);
            expect_throws_msg([] { errno = 2; throw error_sys("Hello {}!", "world"); }, "Hello world! errno: 2 strerror: No such file or directory");
        };
        "bad hex"_test = [] {
            expect_throws_msg([] { uint8_vector::from_hex("ABC"); }, "hex string must have an even number");
            expect_throws_msg([] { uint8_vector::from_hex("ZZ"); }, "unexpected character in a hex number");
            expect_throws_msg([] { uint8_vector::from_hex("0G"); }, "unexpected character in a hex number: 0x47");
        };
        "hex with non-ascii characters"_test = [] {
            // bytes above 0x7F are negative as a plain char on most targets
            expect_throws_msg([] { uint8_vector::from_hex("\xC3\xA9"); }, "unexpected character in a hex number: 0xC3");
            expect_throws_msg([] { uint8_vector::from_hex("A\xFF"); }, "unexpected character in a hex number: 0xFF");
        };
        "mixed case hex"_test = [] {
            test_same(uint8_vector::from_hex("deadBEEF"), uint8_vector::from_hex("DEADBEEF"));
        };
        "subbuf"_test = [] {
            const auto data = uint8_vector::from_hex("00112233");
            const buffer buf { data };
            test_same(subbuf(buf, 1, 2), buffer { uint8_vector::from_hex("1122") });
            test_same(subbuf(buf, 4).size(), 0);
            test_same(subbuf(buf, 1), buffer { uint8_vector::from_hex("112233") });
            expect(throws<error>([&] { subbuf(buf, 3, 2); }));
            expect(throws<error>([&] { subbuf(buf, 5); }));
        };
    };
};
