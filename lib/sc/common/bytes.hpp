/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_COMMON_BYTES_HPP
#define STATIC_CBOR_COMMON_BYTES_HPP

#include <cctype>
#include <vector>
#include "buffer.hpp"
#include "error.hpp"

namespace static_cbor {
    // Bounds-checked slicing for the tooling layer. The codec slices with the buffer constructors.
    inline buffer subbuf(const buffer b, const size_t offset, const size_t sz)
    {
        if (offset <= b.size() && sz <= b.size() - offset) [[likely]]
            return buffer { b.data() + offset, sz };
        throw error("requested offset: {} and size: {} end over the end of buffer's size: {}!", offset, sz, b.size());
    }

    inline buffer subbuf(const buffer b, const size_t offset)
    {
        if (offset <= b.size()) [[likely]]
            return buffer { b.data() + offset, b.size() - offset };
        throw error("a buffer's offset {} is greater than its size {}", offset, b.size());
    }

    inline uint8_t uint_from_hex(const char k)
    {
        const int c = std::tolower(static_cast<unsigned char>(k));
        if (c >= '0' && c <= '9')
            return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f')
            return static_cast<uint8_t>(c - 'a' + 10);
        throw error("unexpected character in a hex number: 0x{:02X}!", static_cast<unsigned char>(k));
    }

    inline void init_from_hex(const write_buffer out, const std::string_view hex)
    {
        if (hex.size() != out.size() * 2)
            throw error("hex string must have {} characters but got {}: {}!", out.size() * 2, hex.size(), hex);
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = uint_from_hex(hex[i * 2]) << 4 | uint_from_hex(hex[i * 2 + 1]);
    }

    struct uint8_vector: std::vector<uint8_t> {
        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0)
                throw error("hex string must have an even number of characters but got {}!", hex.size());
            uint8_vector data(hex.size() / 2);
            init_from_hex(data, hex);
            return data;
        }

        uint8_vector() =default;

        explicit uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t> { bytes.begin(), bytes.end() }
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        operator write_buffer() noexcept
        {
            return { data(), size() };
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) == static_cast<buffer>(o);
        }

        bool operator==(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) == o;
        }
    };
}

namespace fmt {
    template<>
    struct formatter<static_cbor::uint8_vector>: formatter<static_cbor::buffer> {
    };
}

#endif // !STATIC_CBOR_COMMON_BYTES_HPP
