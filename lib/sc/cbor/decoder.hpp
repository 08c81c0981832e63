/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_CBOR_DECODER_HPP
#define STATIC_CBOR_CBOR_DECODER_HPP

#include <array>
#include <cmath>
#include <limits>
#include <sc/cbor/utf8.hpp>
#include <sc/cbor/value.hpp>

/*
 * The decoder parses items in a single forward pass without recursion. Open containers are tracked
 * in a fixed-size stack of frames, and the children of every container are stored in one contiguous
 * range of the caller's arena reserved when the container's header is read.
 * Strings are never copied: decoded values point into the input buffer.
 */
namespace static_cbor::cbor {
    static constexpr size_t default_max_depth = 64;

    // RFC 7049, Appendix D
    inline double decode_half(const uint16_t half) noexcept
    {
        const int exp = (half >> 10) & 0x1F;
        const int mant = half & 0x3FF;
        double val;
        if (exp == 0)
            val = std::ldexp(mant, -24);
        else if (exp != 31)
            val = std::ldexp(mant + 1024, exp - 25);
        else if (mant == 0)
            val = std::numeric_limits<double>::infinity();
        else
            val = std::numeric_limits<double>::quiet_NaN();
        return half & 0x8000 ? -val : val;
    }

    struct decoded {
        value root {};
        size_t arena_used = 0;
        size_t bytes_consumed = 0;
    };

    template<size_t MAX_DEPTH=default_max_depth>
    struct basic_decoder {
        static_assert(MAX_DEPTH > 0);
        static constexpr size_t max_depth = MAX_DEPTH;

        basic_decoder(const buffer data, const std::span<value> arena) noexcept:
            _begin { data.data() },
            _ptr { data.data() },
            _end { data.data() + data.size() },
            _arena { arena }
        {
        }

        bool done() const noexcept
        {
            return _ptr >= _end;
        }

        size_t bytes_consumed() const noexcept
        {
            return _ptr - _begin;
        }

        size_t arena_used() const noexcept
        {
            return _arena_used;
        }

        // Decodes the next item. After a failure the position and the arena usage are unspecified
        // and the decoder must not be used further.
        result<value> read() noexcept
        {
            value root {};
            value *target = &root;
            size_t depth = 0;
            for (;;) {
                if (const auto err = _read_item(*target, depth); err != errc::success) [[unlikely]]
                    return err;
                for (;;) {
                    if (depth == 0)
                        return root;
                    const auto &f = _frames[depth - 1];
                    if (f.next != f.end)
                        break;
                    if (f.indefinite) {
                        if (_ptr >= _end) [[unlikely]]
                            return errc::buffer_overflow;
                        if (*_ptr != break_byte) [[unlikely]]
                            return errc::invalid_type;
                        ++_ptr;
                    }
                    --depth;
                }
                target = _frames[depth - 1].next++;
            }
        }
    private:
        struct frame {
            value *next = nullptr;
            value *end = nullptr;
            bool indefinite = false;
        };

        struct scan_frame {
            // items left for definite containers, items seen for indefinite ones
            uint64_t num_items = 0;
            bool indefinite = false;
            bool map = false;
        };

        const uint8_t *_begin;
        const uint8_t *_ptr;
        const uint8_t *_end;
        std::span<value> _arena;
        size_t _arena_used = 0;
        std::array<frame, MAX_DEPTH> _frames {};

        size_t _remaining() const noexcept
        {
            return _end - _ptr;
        }

        // reads the argument of a definite header whose first byte has already been consumed
        static errc _read_argument(const uint8_t *&p, const uint8_t *end, const uint8_t info, uint64_t &arg) noexcept
        {
            if (info < 24) {
                arg = info;
                return errc::success;
            }
            if (info > 27) [[unlikely]]
                return errc::invalid_type;
            const auto num_bytes = detail::argument_bytes(info);
            if (static_cast<size_t>(end - p) < num_bytes) [[unlikely]]
                return errc::buffer_overflow;
            arg = detail::read_be(p, num_bytes);
            p += num_bytes;
            return errc::success;
        }

        errc _reserve(const uint64_t num_slots, value *&first) noexcept
        {
            if (num_slots > _arena.size() - _arena_used) [[unlikely]]
                return errc::arena_overflow;
            first = _arena.data() + _arena_used;
            _arena_used += num_slots;
            return errc::success;
        }

        errc _push(value *first, const uint64_t num_slots, const bool indefinite, size_t &depth) noexcept
        {
            _frames[depth++] = frame { first, first + num_slots, indefinite };
            return errc::success;
        }

        errc _read_item(value &target, size_t &depth) noexcept
        {
            if (_ptr >= _end) [[unlikely]]
                return errc::buffer_overflow;
            const uint8_t hdr = *_ptr++;
            const auto typ = header_type(hdr);
            const auto info = header_info(hdr);
            if (info == static_cast<uint8_t>(special_val::s_break))
                return _read_indefinite(target, typ, depth);
            if (typ == major_type::simple)
                return _read_simple(target, info);
            uint64_t arg;
            if (const auto err = _read_argument(_ptr, _end, info, arg); err != errc::success) [[unlikely]]
                return err;
            switch (typ) {
                case major_type::uint:
                    target = value::from_uint(arg);
                    return errc::success;
                case major_type::nint:
                    target = value::from_nint(arg);
                    return errc::success;
                case major_type::bytes:
                case major_type::text: {
                    if (arg > _remaining()) [[unlikely]]
                        return errc::buffer_overflow;
                    if (typ == major_type::text && !utf8::valid(_ptr, arg)) [[unlikely]]
                        return errc::invalid_type;
                    target = _string(typ, _ptr, arg);
                    _ptr += arg;
                    return errc::success;
                }
                case major_type::array:
                case major_type::map: {
                    if (depth >= MAX_DEPTH) [[unlikely]]
                        return errc::invalid_type;
                    const bool is_map = typ == major_type::map;
                    // every item takes at least one byte
                    if (arg > (is_map ? _remaining() / 2 : _remaining())) [[unlikely]]
                        return errc::buffer_overflow;
                    const uint64_t num_slots = is_map ? arg * 2 : arg;
                    value *first = nullptr;
                    if (const auto err = _reserve(num_slots, first); err != errc::success) [[unlikely]]
                        return err;
                    target = is_map ? value::_flat_map(first, arg) : value::from_array(std::span<const value> { first, arg });
                    return _push(first, num_slots, false, depth);
                }
                case major_type::tag: {
                    if (depth >= MAX_DEPTH) [[unlikely]]
                        return errc::invalid_type;
                    if (_ptr >= _end) [[unlikely]]
                        return errc::buffer_overflow;
                    value *first = nullptr;
                    if (const auto err = _reserve(1, first); err != errc::success) [[unlikely]]
                        return err;
                    target = value::from_tag(arg, *first);
                    return _push(first, 1, false, depth);
                }
                default:
                    return errc::invalid_type;
            }
        }

        static value _string(const major_type typ, const uint8_t *data, const uint64_t sz) noexcept
        {
            if (typ == major_type::text)
                return value::from_text(std::string_view { reinterpret_cast<const char *>(data), sz });
            return value::from_bytes(std::span<const uint8_t> { data, sz });
        }

        errc _read_simple(value &target, const uint8_t info) noexcept
        {
            switch (info) {
                case static_cast<uint8_t>(special_val::s_false):
                    target = value::from_bool(false);
                    return errc::success;
                case static_cast<uint8_t>(special_val::s_true):
                    target = value::from_bool(true);
                    return errc::success;
                case static_cast<uint8_t>(special_val::s_null):
                    target = value::null();
                    return errc::success;
                case static_cast<uint8_t>(special_val::s_undefined):
                    target = value::undefined();
                    return errc::success;
                case static_cast<uint8_t>(special_val::two_bytes):
                case static_cast<uint8_t>(special_val::four_bytes):
                case static_cast<uint8_t>(special_val::eight_bytes): {
                    uint64_t bits;
                    if (const auto err = _read_argument(_ptr, _end, info, bits); err != errc::success) [[unlikely]]
                        return err;
                    switch (info) {
                        case static_cast<uint8_t>(special_val::two_bytes):
                            target = value::from_float(decode_half(static_cast<uint16_t>(bits)));
                            break;
                        case static_cast<uint8_t>(special_val::four_bytes):
                            target = value::from_float(static_cast<double>(std::bit_cast<float>(static_cast<uint32_t>(bits))));
                            break;
                        default:
                            target = value::from_float(std::bit_cast<double>(bits));
                            break;
                    }
                    return errc::success;
                }
                // unassigned simple values, one-byte simple values, and reserved additional info
                default:
                    return errc::invalid_type;
            }
        }

        errc _read_indefinite(value &target, const major_type typ, size_t &depth) noexcept
        {
            switch (typ) {
                case major_type::bytes:
                case major_type::text:
                    return _read_chunked(target, typ);
                case major_type::array:
                case major_type::map: {
                    if (depth >= MAX_DEPTH) [[unlikely]]
                        return errc::invalid_type;
                    const bool is_map = typ == major_type::map;
                    uint64_t num_slots = 0;
                    if (const auto err = _count_items(is_map, depth, num_slots); err != errc::success) [[unlikely]]
                        return err;
                    value *first = nullptr;
                    if (const auto err = _reserve(num_slots, first); err != errc::success) [[unlikely]]
                        return err;
                    target = is_map ? value::_flat_map(first, num_slots / 2) : value::from_array(std::span<const value> { first, num_slots });
                    return _push(first, num_slots, true, depth);
                }
                // a break outside of an indefinite-length container or an indefinite integer or tag
                default:
                    return errc::invalid_type;
            }
        }

        errc _read_chunked(value &target, const major_type typ) noexcept
        {
            const uint8_t *raw = _ptr;
            const uint8_t *first_data = _ptr;
            uint64_t total_size = 0;
            size_t num_chunks = 0;
            for (;;) {
                if (_ptr >= _end) [[unlikely]]
                    return errc::buffer_overflow;
                const uint8_t hdr = *_ptr;
                if (hdr == break_byte) {
                    ++_ptr;
                    break;
                }
                // chunks must be definite strings of the same major type
                if (header_type(hdr) != typ || header_info(hdr) > 27) [[unlikely]]
                    return errc::invalid_type;
                ++_ptr;
                uint64_t sz;
                if (const auto err = _read_argument(_ptr, _end, header_info(hdr), sz); err != errc::success) [[unlikely]]
                    return err;
                if (sz > _remaining()) [[unlikely]]
                    return errc::buffer_overflow;
                if (typ == major_type::text && !utf8::valid(_ptr, sz)) [[unlikely]]
                    return errc::invalid_type;
                first_data = _ptr;
                total_size += sz;
                _ptr += sz;
                ++num_chunks;
            }
            if (num_chunks >= 2)
                target = value::_chunked(typ, raw, total_size);
            else
                target = _string(typ, first_data, total_size);
            return errc::success;
        }

        // Counts the direct children of an indefinite-length container whose header has just been consumed
        // without moving the read position. Nested items are skipped iteratively and the nesting is limited
        // so that the following parse stays within MAX_DEPTH.
        errc _count_items(const bool is_map, const size_t depth, uint64_t &num_items) const noexcept
        {
            std::array<scan_frame, MAX_DEPTH> stack {};
            size_t level = 0;
            stack[0] = scan_frame { 0, true, is_map };
            const uint8_t *p = _ptr;
            for (;;) {
                auto &f = stack[level];
                if (f.indefinite) {
                    if (p >= _end) [[unlikely]]
                        return errc::buffer_overflow;
                    if (*p == break_byte) {
                        // a break in the value position of a map
                        if (f.map && f.num_items % 2 != 0) [[unlikely]]
                            return errc::invalid_type;
                        ++p;
                        if (level == 0) {
                            num_items = f.num_items;
                            return errc::success;
                        }
                        --level;
                        continue;
                    }
                    ++f.num_items;
                } else {
                    if (f.num_items == 0) {
                        --level;
                        continue;
                    }
                    --f.num_items;
                }
                if (p >= _end) [[unlikely]]
                    return errc::buffer_overflow;
                const uint8_t hdr = *p++;
                const auto typ = header_type(hdr);
                const auto info = header_info(hdr);
                const bool opens_level = typ == major_type::array || typ == major_type::map || typ == major_type::tag;
                if (opens_level && depth + level + 1 >= MAX_DEPTH) [[unlikely]]
                    return errc::invalid_type;
                if (info == static_cast<uint8_t>(special_val::s_break)) {
                    switch (typ) {
                        case major_type::bytes:
                        case major_type::text:
                            if (const auto err = _skip_chunks(p, typ); err != errc::success) [[unlikely]]
                                return err;
                            break;
                        case major_type::array:
                        case major_type::map:
                            stack[++level] = scan_frame { 0, true, typ == major_type::map };
                            break;
                        default:
                            return errc::invalid_type;
                    }
                    continue;
                }
                if (typ == major_type::simple) {
                    if (info < static_cast<uint8_t>(special_val::s_false) || info == static_cast<uint8_t>(special_val::one_byte)) [[unlikely]]
                        return errc::invalid_type;
                }
                uint64_t arg;
                if (const auto err = _read_argument(p, _end, info, arg); err != errc::success) [[unlikely]]
                    return err;
                const size_t remaining = _end - p;
                switch (typ) {
                    case major_type::bytes:
                    case major_type::text:
                        if (arg > remaining) [[unlikely]]
                            return errc::buffer_overflow;
                        p += arg;
                        break;
                    case major_type::array:
                        if (arg > remaining) [[unlikely]]
                            return errc::buffer_overflow;
                        stack[++level] = scan_frame { arg, false, false };
                        break;
                    case major_type::map:
                        if (arg > remaining / 2) [[unlikely]]
                            return errc::buffer_overflow;
                        stack[++level] = scan_frame { arg * 2, false, true };
                        break;
                    case major_type::tag:
                        stack[++level] = scan_frame { 1, false, false };
                        break;
                    default:
                        break;
                }
            }
        }

        errc _skip_chunks(const uint8_t *&p, const major_type typ) const noexcept
        {
            for (;;) {
                if (p >= _end) [[unlikely]]
                    return errc::buffer_overflow;
                const uint8_t hdr = *p;
                if (hdr == break_byte) {
                    ++p;
                    return errc::success;
                }
                if (header_type(hdr) != typ || header_info(hdr) > 27) [[unlikely]]
                    return errc::invalid_type;
                ++p;
                uint64_t sz;
                if (const auto err = _read_argument(p, _end, header_info(hdr), sz); err != errc::success) [[unlikely]]
                    return err;
                if (sz > static_cast<size_t>(_end - p)) [[unlikely]]
                    return errc::buffer_overflow;
                p += sz;
            }
        }
    };

    using decoder = basic_decoder<default_max_depth>;

    // Decodes the first item of data. Bytes after it are left unread and reported through bytes_consumed.
    template<size_t MAX_DEPTH=default_max_depth>
    result<decoded> decode(const buffer data, const std::span<value> arena) noexcept
    {
        basic_decoder<MAX_DEPTH> dec { data, arena };
        auto res = dec.read();
        if (res.has_error()) [[unlikely]]
            return res.error();
        return decoded { res.value(), dec.arena_used(), dec.bytes_consumed() };
    }
}

#endif // !STATIC_CBOR_CBOR_DECODER_HPP
