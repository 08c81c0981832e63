/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_CBOR_ENCODER_HPP
#define STATIC_CBOR_CBOR_ENCODER_HPP

#include <array>
#include <limits>
#include <sc/cbor/value.hpp>

namespace static_cbor::cbor {
    // A header byte followed by the shortest big-endian argument that can represent the value.
    struct header {
        std::array<uint8_t, 9> bytes {};
        uint8_t size = 0;

        constexpr std::span<const uint8_t> span() const noexcept
        {
            return { bytes.data(), size };
        }
    };

    constexpr size_t argument_size(const uint64_t val) noexcept
    {
        if (val < 24)
            return 0;
        if (val <= std::numeric_limits<uint8_t>::max())
            return 1;
        if (val <= std::numeric_limits<uint16_t>::max())
            return 2;
        if (val <= std::numeric_limits<uint32_t>::max())
            return 4;
        return 8;
    }

    constexpr size_t header_size(const uint64_t val) noexcept
    {
        return 1 + argument_size(val);
    }

    constexpr header encode_header(const major_type typ, const uint64_t val) noexcept
    {
        header h {};
        const auto arg_sz = argument_size(val);
        switch (arg_sz) {
            case 0: h.bytes[0] = make_header(typ, static_cast<uint8_t>(val)); break;
            case 1: h.bytes[0] = make_header(typ, static_cast<uint8_t>(special_val::one_byte)); break;
            case 2: h.bytes[0] = make_header(typ, static_cast<uint8_t>(special_val::two_bytes)); break;
            case 4: h.bytes[0] = make_header(typ, static_cast<uint8_t>(special_val::four_bytes)); break;
            default: h.bytes[0] = make_header(typ, static_cast<uint8_t>(special_val::eight_bytes)); break;
        }
        for (size_t i = 0; i < arg_sz; ++i)
            h.bytes[1 + i] = static_cast<uint8_t>(val >> (8 * (arg_sz - 1 - i)));
        h.size = static_cast<uint8_t>(1 + arg_sz);
        return h;
    }

    // The exact number of bytes that encode(v, ...) writes. Chunked strings are counted in their definite form.
    constexpr size_t encoded_size(const value &v) noexcept
    {
        switch (v._type) {
            case major_type::uint:
            case major_type::nint:
                return header_size(v._uint);
            case major_type::bytes:
            case major_type::text:
                return header_size(v._uint) + v._uint;
            case major_type::array: {
                auto sz = header_size(v._uint);
                for (size_t i = 0; i < v._uint; ++i)
                    sz += encoded_size(v._ptr.items[i]);
                return sz;
            }
            case major_type::map: {
                auto sz = header_size(v._uint);
                for (size_t i = 0; i < v._uint; ++i) {
                    if (v._info)
                        sz += encoded_size(v._ptr.items[i * 2]) + encoded_size(v._ptr.items[i * 2 + 1]);
                    else
                        sz += encoded_size(v._ptr.pairs[i].key) + encoded_size(v._ptr.pairs[i].val);
                }
                return sz;
            }
            case major_type::tag:
                return header_size(v._uint) + encoded_size(*v._ptr.items);
            case major_type::simple:
                return v.is_float() ? 9 : 1;
            default:
                return 0;
        }
    }

    /*
     * Writes CBOR items into a caller-supplied buffer. Before each header and each payload the remaining capacity
     * is checked; the first failure is sticky: later writes become no-ops and finish() returns the error.
     * The buffer may stay partially written after a failure.
     */
    struct encoder {
        explicit encoder(const write_buffer out) noexcept: _out { out }
        {
        }

        encoder &array() noexcept
        {
            _encode_item(major_type::array, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &array(const size_t sz) noexcept
        {
            _encode_uint_item(major_type::array, sz);
            return *this;
        }

        encoder &map() noexcept
        {
            _encode_item(major_type::map, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &map(const size_t sz) noexcept
        {
            _encode_uint_item(major_type::map, sz);
            return *this;
        }

        encoder &uint(const uint64_t val) noexcept
        {
            _encode_uint_item(major_type::uint, val);
            return *this;
        }

        // the negative value must be already converted to its offset representation: -1 - val
        encoder &nint(const uint64_t val) noexcept
        {
            _encode_uint_item(major_type::nint, val);
            return *this;
        }

        encoder &float64(const double val) noexcept
        {
            const auto bits = std::bit_cast<uint64_t>(val);
            std::array<uint8_t, 9> data {};
            data[0] = make_header(major_type::simple, static_cast<uint8_t>(special_val::eight_bytes));
            for (size_t i = 0; i < 8; ++i)
                data[1 + i] = static_cast<uint8_t>(bits >> (8 * (7 - i)));
            _encode_data(buffer { data.data(), data.size() });
            return *this;
        }

        encoder &bytes() noexcept
        {
            _encode_item(major_type::bytes, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &bytes(const buffer buf) noexcept
        {
            _encode_uint_item(major_type::bytes, buf.size());
            _encode_data(buf);
            return *this;
        }

        encoder &text() noexcept
        {
            _encode_item(major_type::text, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &text(const std::string_view sv) noexcept
        {
            _encode_uint_item(major_type::text, sv.size());
            _encode_data(buffer { reinterpret_cast<const uint8_t *>(sv.data()), sv.size() });
            return *this;
        }

        encoder &tag(const uint64_t id) noexcept
        {
            _encode_uint_item(major_type::tag, id);
            return *this;
        }

        encoder &s_null() noexcept
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_null));
            return *this;
        }

        encoder &s_undefined() noexcept
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_undefined));
            return *this;
        }

        encoder &s_break() noexcept
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &s_false() noexcept
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_false));
            return *this;
        }

        encoder &s_true() noexcept
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_true));
            return *this;
        }

        // always emits the definite-length form, chunked strings included
        encoder &item(const value &v) noexcept
        {
            switch (v._type) {
                case major_type::uint:
                    return uint(v._uint);
                case major_type::nint:
                    return nint(v._uint);
                case major_type::bytes:
                case major_type::text:
                    _encode_uint_item(v._type, v._uint);
                    for (chunk_iterator it { v }; !it.done() && _ok(); )
                        _encode_data(it.next());
                    return *this;
                case major_type::array:
                    array(v._uint);
                    for (size_t i = 0; i < v._uint && _ok(); ++i)
                        item(v._ptr.items[i]);
                    return *this;
                case major_type::map: {
                    map(v._uint);
                    const map_view m { v };
                    for (size_t i = 0; i < m.size() && _ok(); ++i)
                        item(m.key(i)).item(m.val(i));
                    return *this;
                }
                case major_type::tag:
                    tag(v._uint);
                    return item(*v._ptr.items);
                case major_type::simple:
                    if (v.is_float())
                        return float64(std::bit_cast<double>(v._uint));
                    _encode_item(major_type::simple, v._info);
                    return *this;
                default:
                    _fail(errc::invalid_type);
                    return *this;
            }
        }

        // the number of bytes written so far
        size_t size() const noexcept
        {
            return _pos;
        }

        [[nodiscard]] result<size_t> finish() const noexcept
        {
            if (_ok()) [[likely]]
                return _pos;
            return _err;
        }
    private:
        write_buffer _out;
        size_t _pos = 0;
        errc _err = errc::success;

        bool _ok() const noexcept
        {
            return _err == errc::success;
        }

        void _fail(const errc err) noexcept
        {
            if (_ok())
                _err = err;
        }

        void _encode_data(const buffer buf) noexcept
        {
            if (!_ok()) [[unlikely]]
                return;
            if (buf.size() > _out.size() - _pos) [[unlikely]] {
                _fail(errc::buffer_overflow);
                return;
            }
            if (!buf.empty())
                memcpy(_out.data() + _pos, buf.data(), buf.size());
            _pos += buf.size();
        }

        void _encode_uint_item(const major_type typ, const uint64_t val) noexcept
        {
            _encode_data(encode_header(typ, val).span());
        }

        void _encode_item(const major_type typ, const uint8_t special) noexcept
        {
            const uint8_t hdr = make_header(typ, special);
            _encode_data(buffer { &hdr, 1 });
        }
    };

    // Encodes the value into the buffer and returns the number of bytes written,
    // which always equals encoded_size(v) on success.
    inline result<size_t> encode(const value &v, const write_buffer out) noexcept
    {
        encoder enc { out };
        enc.item(v);
        return enc.finish();
    }
}

#endif // !STATIC_CBOR_CBOR_ENCODER_HPP
