/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_COMMON_FORMAT_HPP
#define STATIC_CBOR_COMMON_FORMAT_HPP

#include <cstdint>
#include <span>

#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#       pragma GCC diagnostic ignored "-Warray-bounds"
#       pragma GCC diagnostic ignored "-Wstringop-overflow"
#   endif
#endif
#include <fmt/core.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

namespace fmt {
    // byte ranges print as upper-case hex without separators
    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out()) {
            static constexpr char digits[] = "0123456789ABCDEF";
            auto out_it = ctx.out();
            for (const uint8_t v: data) {
                *out_it++ = digits[v >> 4];
                *out_it++ = digits[v & 0xF];
            }
            return out_it;
        }
    };
}

#endif // !STATIC_CBOR_COMMON_FORMAT_HPP
