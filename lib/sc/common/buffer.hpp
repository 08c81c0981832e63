/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_COMMON_BUFFER_HPP
#define STATIC_CBOR_COMMON_BUFFER_HPP

#include <algorithm>
#include <compare>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include "format.hpp"

/*
 * Non-owning byte ranges used by the codec. Nothing here allocates or throws,
 * the throwing helpers (slicing with bounds checks, hex conversion, owned vectors) live in bytes.hpp.
 */
namespace static_cbor {
    typedef std::span<uint8_t> write_buffer;

    struct buffer: std::span<const uint8_t> {
        constexpr buffer() noexcept =default;
        constexpr buffer(const buffer &) noexcept =default;

        template <typename T>
        constexpr buffer(const std::span<T> bytes) noexcept:
            std::span<const uint8_t> { bytes.data(), bytes.size() }
        {
            static_assert(sizeof(T) == 1);
        }

        constexpr buffer(const uint8_t *data, const size_t sz) noexcept:
            std::span<const uint8_t> { data, sz }
        {
        }

        buffer(const std::string_view s) noexcept:
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s) noexcept:
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        constexpr buffer &operator=(const buffer &o) noexcept =default;

        std::string_view string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            const auto min_sz = std::min(size(), o.size());
            const auto cmp = min_sz ? memcmp(data(), o.data(), min_sz) : 0;
            if (cmp < 0)
                return std::strong_ordering::less;
            if (cmp > 0)
                return std::strong_ordering::greater;
            return size() <=> o.size();
        }

        bool operator==(const buffer &o) const noexcept
        {
            return std::strong_ordering::equal == (*this <=> o);
        }
    };
}

namespace fmt {
    template<>
    struct formatter<static_cbor::buffer>: formatter<std::span<const uint8_t>> {
    };
}

#endif // !STATIC_CBOR_COMMON_BUFFER_HPP
