/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_CBOR_UTF8_HPP
#define STATIC_CBOR_CBOR_UTF8_HPP

#include <cstddef>
#include <cstdint>

namespace static_cbor::cbor::utf8 {
    // Strict well-formedness as in the Unicode Standard, Table 3-7:
    // rejects overlong forms, UTF-16 surrogates, and code points above U+10FFFF.
    constexpr bool valid(const uint8_t *p, const size_t sz) noexcept
    {
        const uint8_t *end = p + sz;
        while (p < end) {
            const uint8_t b0 = *p;
            if (b0 < 0x80) [[likely]] {
                ++p;
                continue;
            }
            size_t len;
            uint8_t lo = 0x80, hi = 0xBF;
            if (b0 >= 0xC2 && b0 <= 0xDF) {
                len = 2;
            } else if (b0 >= 0xE0 && b0 <= 0xEF) {
                len = 3;
                if (b0 == 0xE0)
                    lo = 0xA0;
                else if (b0 == 0xED)
                    hi = 0x9F;
            } else if (b0 >= 0xF0 && b0 <= 0xF4) {
                len = 4;
                if (b0 == 0xF0)
                    lo = 0x90;
                else if (b0 == 0xF4)
                    hi = 0x8F;
            } else {
                return false;
            }
            if (static_cast<size_t>(end - p) < len)
                return false;
            if (p[1] < lo || p[1] > hi)
                return false;
            for (size_t i = 2; i < len; ++i) {
                if (p[i] < 0x80 || p[i] > 0xBF)
                    return false;
            }
            p += len;
        }
        return true;
    }
}

#endif // !STATIC_CBOR_CBOR_UTF8_HPP
