/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <array>
#include <cmath>
#include <limits>
#include <sc/common/test.hpp>
#include <sc/cbor/encoder.hpp>
#include <sc/cbor/value.hpp>

using namespace static_cbor;
using namespace static_cbor::cbor;

namespace {
    constexpr std::array<value, 2> pair_items { value::from_uint(1), value::from_uint(2) };
    constexpr auto pair_array = value::from_array(pair_items);
    static_assert(encoded_size(pair_array) == 3);

    constexpr std::array<map_item, 1> k_items { map_item { value::from_text("k"), value::from_uint(1) } };
    constexpr auto k_map = value::from_map(k_items);
    static_assert(encoded_size(k_map) == 4);

    constexpr auto inner = value::from_uint(0x1234);
    constexpr auto tagged = value::from_tag(24, inner);
    static_assert(encoded_size(tagged) == 2 + 3);

    static_assert(encoded_size(value::from_int(-1)) == 1);
    static_assert(encoded_size(value::from_float(1.5)) == 9);
    static_assert(encoded_size(value::null()) == 1);
    static_assert(value::from_int(std::numeric_limits<int64_t>::min()).special_uint() == 0x7FFFFFFFFFFFFFFFULL);
}

suite cbor_value_suite = [] {
    "cbor::value"_test = [] {
        "from_int"_test = [] {
            test_same(value::from_int(0).uint().value(), 0);
            test_same(value::from_int(42).uint().value(), 42);
            test_same(value::from_int(-1).nint().value(), 0);
            test_same(value::from_int(-500).nint().value(), 499);
            test_same(value::from_int(std::numeric_limits<int64_t>::max()).uint().value(), static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
            test_same(value::from_int(std::numeric_limits<int64_t>::min()).nint().value(), 0x7FFFFFFFFFFFFFFFULL);
        };
        "accessors"_test = [] {
            const auto v = value::from_text("abc");
            test_same(v.type(), major_type::text);
            test_same(v.text().value(), std::string_view { "abc" });
            test_same(v.size().value(), 3);
            expect_error(v.bytes(), errc::type_mismatch);
            expect_error(v.uint(), errc::type_mismatch);
            expect_error(v.array(), errc::type_mismatch);
            expect_error(v.float64(), errc::type_mismatch);
            expect_error(value::from_uint(1).size(), errc::type_mismatch);
            expect_error(value::null().boolean(), errc::type_mismatch);
            test_same(value::from_bool(true).boolean().value(), true);
            test_same(value::from_bool(false).simple().value(), special_val::s_false);
            test_same(value::undefined().simple().value(), special_val::s_undefined);
            expect(value::null().is_null());
            expect(value::undefined().is_undefined());
            expect(!value::from_float(0.0).is_null());
            test_same(value::from_float(2.5).float64().value(), 2.5);
        };
        "bytes"_test = [] {
            const auto data = uint8_vector::from_hex("DEADBEEF");
            const auto v = value::from_bytes(buffer { data });
            test_same(v.bytes().value(), buffer { data });
            expect(!v.is_chunked());
            std::array<uint8_t, 4> out {};
            test_same(v.copy_bytes(out).value(), 4);
            test_same(buffer { out.data(), out.size() }, buffer { data });
            std::array<uint8_t, 3> small {};
            expect_error(v.copy_bytes(small), errc::buffer_overflow);
            expect_error(value::from_uint(1).copy_bytes(out), errc::type_mismatch);
        };
        "array"_test = [] {
            const std::array<value, 3> items { value::from_uint(1), value::from_text("x"), value::null() };
            const auto v = value::from_array(items);
            const auto arr = v.array().value();
            test_same(arr.size(), 3);
            expect(arr[1] == value::from_text("x"));
            expect(arr[2].is_null());
        };
        "map"_test = [] {
            const std::array<map_item, 2> items {
                map_item { value::from_text("b"), value::from_uint(2) },
                map_item { value::from_text("a"), value::from_uint(1) }
            };
            const auto m = value::from_map(items).map().value();
            test_same(m.size(), 2);
            // insertion order is kept
            test_same(m.key(0).text().value(), std::string_view { "b" });
            test_same(m.val(1).uint().value(), 1);
            size_t num_items = 0;
            for (const auto &[k, v]: m) {
                expect(k.type() == major_type::text);
                expect(v.type() == major_type::uint);
                ++num_items;
            }
            test_same(num_items, 2);
        };
        "tag"_test = [] {
            const auto item = value::from_uint(1363896240);
            const auto v = value::from_tag(1, item);
            const auto [id, tagged_item] = v.tag().value();
            test_same(id, 1);
            expect(tagged_item == item);
        };
        "equality"_test = [] {
            expect(value::from_uint(1) == value::from_uint(1));
            expect(!(value::from_uint(1) == value::from_nint(1)));
            expect(!(value::from_text("a") == value::from_bytes(buffer { std::string_view { "a" } })));
            expect(value::from_float(std::numeric_limits<double>::quiet_NaN()) == value::from_float(std::numeric_limits<double>::quiet_NaN()));
            expect(!(value::from_float(0.0) == value::from_float(-0.0)));
            expect(!(value::from_bool(true) == value::from_bool(false)));
            const std::array<value, 2> a1 { value::from_uint(1), value::from_text("x") };
            const std::array<value, 2> a2 { value::from_uint(1), value::from_text("x") };
            const std::array<value, 2> a3 { value::from_uint(1), value::from_text("y") };
            expect(value::from_array(a1) == value::from_array(a2));
            expect(!(value::from_array(a1) == value::from_array(a3)));
            expect(!(value::from_array(a1) == value::from_array(std::span<const value> { a2.data(), 1 })));
        };
        "trivially copyable"_test = [] {
            const auto v1 = value::from_text("hello");
            value v2 {};
            std::memcpy(&v2, &v1, sizeof(v1));
            expect(v1 == v2);
        };
    };
};
