/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <type_traits>
#include <sc/common/error.hpp>
#include <sc/common/test.hpp>
#include <sc/timer.hpp>

using namespace static_cbor;

suite timer_suite = [] {
    "timer"_test = [] {
        "destructor does not throw"_test = [] {
            static_assert(std::is_nothrow_destructible_v<timer>);
            expect(nothrow([] { timer t { "timer test", logger::level::debug }; }));
        };
        "duration grows"_test = [] {
            const timer t { "timer duration" };
            const auto d1 = t.duration();
            const auto d2 = t.duration();
            expect(d1 >= 0.0);
            expect(d2 >= d1);
        };
        "scope left by an exception"_test = [] {
            expect(throws<error>([] {
                timer t { "timer failure", logger::level::debug };
                throw error("the timed block failed");
            }));
        };
    };
};
