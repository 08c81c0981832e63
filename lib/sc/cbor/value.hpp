/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

/*
 * A value is a 24-byte view of a single CBOR data item. It never owns memory:
 * strings borrow the caller's data or the decoded input buffer, and composite items borrow
 * caller-built sequences or ranges of a decode arena. A value must not outlive what it borrows.
 *
 * The construction functions and encoded_size are constexpr so that constant trees can be
 * sized at compile time. The accessors report a wrong variant with errc::type_mismatch.
 */
#ifndef STATIC_CBOR_CBOR_VALUE_HPP
#define STATIC_CBOR_CBOR_VALUE_HPP

#include <bit>
#include <cstring>
#include <iterator>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <sc/common/buffer.hpp>
#include <sc/cbor/error.hpp>
#include <sc/cbor/types.hpp>

namespace static_cbor::cbor {
    struct encoder;
    struct map_item;
    struct map_view;
    template<size_t MAX_DEPTH>
    struct basic_decoder;

    namespace detail {
        // the number of argument bytes that follow a header with the given additional info
        constexpr size_t argument_bytes(const uint8_t info) noexcept
        {
            switch (info) {
                case static_cast<uint8_t>(special_val::one_byte): return 1;
                case static_cast<uint8_t>(special_val::two_bytes): return 2;
                case static_cast<uint8_t>(special_val::four_bytes): return 4;
                case static_cast<uint8_t>(special_val::eight_bytes): return 8;
                default: return 0;
            }
        }

        constexpr uint64_t read_be(const uint8_t *p, const size_t num_bytes) noexcept
        {
            uint64_t v = 0;
            for (size_t i = 0; i < num_bytes; ++i)
                v = (v << 8) | p[i];
            return v;
        }

        // reads the argument of an already validated definite-length header and advances the pointer past it
        inline uint64_t read_validated_argument(const uint8_t *&p) noexcept
        {
            const auto info = header_info(*p++);
            if (info < 24)
                return info;
            const auto num_bytes = argument_bytes(info);
            const auto v = read_be(p, num_bytes);
            p += num_bytes;
            return v;
        }
    }

    struct value {
        using tag_item = std::pair<uint64_t, value>;

        static constexpr value from_uint(const uint64_t v) noexcept
        {
            return { major_type::uint, 0, v, payload_ptr { .bytes=nullptr } };
        }

        // represents the integer -1 - offset
        static constexpr value from_nint(const uint64_t offset) noexcept
        {
            return { major_type::nint, 0, offset, payload_ptr { .bytes=nullptr } };
        }

        static constexpr value from_int(const int64_t v) noexcept
        {
            if (v >= 0)
                return from_uint(static_cast<uint64_t>(v));
            return from_nint(static_cast<uint64_t>(-(v + 1)));
        }

        static constexpr value from_bytes(const std::span<const uint8_t> bytes) noexcept
        {
            return { major_type::bytes, 0, bytes.size(), payload_ptr { .bytes=bytes.data() } };
        }

        static constexpr value from_text(const std::string_view text) noexcept
        {
            return { major_type::text, 0, text.size(), payload_ptr { .text=text.data() } };
        }

        static constexpr value from_array(const std::span<const value> items) noexcept
        {
            return { major_type::array, 0, items.size(), payload_ptr { .items=items.data() } };
        }

        static constexpr value from_map(const std::span<const map_item> items) noexcept
        {
            return { major_type::map, 0, items.size(), payload_ptr { .pairs=items.data() } };
        }

        // the tagged item is borrowed, so it must outlive the returned value
        static constexpr value from_tag(const uint64_t id, const value &item) noexcept
        {
            return { major_type::tag, 0, id, payload_ptr { .items=&item } };
        }
        static value from_tag(uint64_t, const value &&) =delete;

        static constexpr value from_bool(const bool b) noexcept
        {
            return _simple(b ? special_val::s_true : special_val::s_false, 0);
        }

        static constexpr value null() noexcept
        {
            return _simple(special_val::s_null, 0);
        }

        static constexpr value undefined() noexcept
        {
            return _simple(special_val::s_undefined, 0);
        }

        static constexpr value from_float(const double d) noexcept
        {
            return _simple(special_val::eight_bytes, std::bit_cast<uint64_t>(d));
        }

        constexpr value() noexcept =default;
        constexpr value(const value &) noexcept =default;
        constexpr value &operator=(const value &) noexcept =default;

        constexpr major_type type() const noexcept
        {
            return _type;
        }

        constexpr bool is_float() const noexcept
        {
            return _type == major_type::simple && _info == static_cast<uint8_t>(special_val::eight_bytes);
        }

        constexpr bool is_null() const noexcept
        {
            return _type == major_type::simple && _info == static_cast<uint8_t>(special_val::s_null);
        }

        constexpr bool is_undefined() const noexcept
        {
            return _type == major_type::simple && _info == static_cast<uint8_t>(special_val::s_undefined);
        }

        // a decoded indefinite-length string of two or more chunks
        constexpr bool is_chunked() const noexcept
        {
            return (_type == major_type::bytes || _type == major_type::text) && _info == static_cast<uint8_t>(special_val::s_break);
        }

        // the CBOR argument: an integer magnitude, a string length, an item count, a tag id, or the bits of a double
        constexpr uint64_t special_uint() const noexcept
        {
            return _uint;
        }

        result<uint64_t> uint() const noexcept;
        // returns the offset n of the represented integer -1 - n
        result<uint64_t> nint() const noexcept;
        result<buffer> bytes() const noexcept;
        result<std::string_view> text() const noexcept;
        // copies the payload of a byte or a text string, contiguous or chunked, and returns its size
        result<size_t> copy_bytes(write_buffer out) const noexcept;
        result<std::span<const value>> array() const noexcept;
        result<map_view> map() const noexcept;
        result<tag_item> tag() const noexcept;
        result<special_val> simple() const noexcept;
        result<bool> boolean() const noexcept;
        result<double> float64() const noexcept;
        // the payload length of a string or the number of items in an array or a map
        result<uint64_t> size() const noexcept;

        bool operator==(const value &o) const noexcept;
    private:
        friend encoder;
        friend map_view;
        friend struct chunk_iterator;
        template<size_t MAX_DEPTH>
        friend struct basic_decoder;
        friend constexpr size_t encoded_size(const value &v) noexcept;

        union payload_ptr {
            const uint8_t *bytes;
            const char *text;
            const value *items;
            const map_item *pairs;
        };

        major_type _type = major_type::uint;
        // simple: the special_val; strings: s_break when chunked; maps: 1 when stored as flat key-value slots
        uint8_t _info = 0;
        uint64_t _uint = 0;
        payload_ptr _ptr { .bytes=nullptr };

        constexpr value(const major_type typ, const uint8_t info, const uint64_t arg, const payload_ptr ptr) noexcept:
            _type { typ }, _info { info }, _uint { arg }, _ptr { ptr }
        {
        }

        static constexpr value _simple(const special_val sv, const uint64_t bits) noexcept
        {
            return { major_type::simple, static_cast<uint8_t>(sv), bits, payload_ptr { .bytes=nullptr } };
        }

        // raw points to the first chunk header right after the indefinite-length header
        static constexpr value _chunked(const major_type typ, const uint8_t *raw, const uint64_t total_size) noexcept
        {
            return { typ, static_cast<uint8_t>(special_val::s_break), total_size, payload_ptr { .bytes=raw } };
        }

        // items points to 2 * num_pairs consecutive slots: key, value, key, value, ...
        static constexpr value _flat_map(const value *items, const uint64_t num_pairs) noexcept
        {
            return { major_type::map, 1, num_pairs, payload_ptr { .items=items } };
        }

        const uint8_t *_payload_data() const noexcept
        {
            return _type == major_type::text ? reinterpret_cast<const uint8_t *>(_ptr.text) : _ptr.bytes;
        }
    };
    static_assert(sizeof(value) == 24);
    static_assert(std::is_trivially_copyable_v<value>);

    struct map_item {
        value key {};
        value val {};
    };

    struct map_view {
        using item_ref = std::pair<const value &, const value &>;

        struct iterator {
            using iterator_category = std::forward_iterator_tag;
            using difference_type = std::ptrdiff_t;
            using value_type = item_ref;

            const map_view *view = nullptr;
            size_t idx = 0;

            item_ref operator*() const noexcept
            {
                return (*view)[idx];
            }

            iterator &operator++() noexcept
            {
                ++idx;
                return *this;
            }

            bool operator==(const iterator &o) const noexcept
            {
                return idx == o.idx;
            }
        };

        explicit map_view(const value &v) noexcept: _v { v }
        {
        }

        size_t size() const noexcept
        {
            return _v._uint;
        }

        bool empty() const noexcept
        {
            return _v._uint == 0;
        }

        const value &key(const size_t idx) const noexcept
        {
            return _flat() ? _v._ptr.items[idx * 2] : _v._ptr.pairs[idx].key;
        }

        const value &val(const size_t idx) const noexcept
        {
            return _flat() ? _v._ptr.items[idx * 2 + 1] : _v._ptr.pairs[idx].val;
        }

        item_ref operator[](const size_t idx) const noexcept
        {
            return { key(idx), val(idx) };
        }

        iterator begin() const noexcept
        {
            return { this, 0 };
        }

        iterator end() const noexcept
        {
            return { this, size() };
        }
    private:
        value _v;

        bool _flat() const noexcept
        {
            return _v._info != 0;
        }
    };

    // Iterates over the payload of a string chunk by chunk: a contiguous string is a single chunk.
    struct chunk_iterator {
        explicit chunk_iterator(const value &v) noexcept
        {
            if (v.is_chunked()) {
                _raw = v._ptr.bytes;
            } else {
                _single = buffer { v._payload_data(), v._uint };
                _single_pending = true;
            }
        }

        bool done() const noexcept
        {
            if (_raw)
                return *_raw == break_byte;
            return !_single_pending;
        }

        buffer next() noexcept
        {
            if (_raw) {
                const auto sz = detail::read_validated_argument(_raw);
                const buffer chunk { _raw, sz };
                _raw += sz;
                return chunk;
            }
            _single_pending = false;
            return _single;
        }
    private:
        const uint8_t *_raw = nullptr;
        buffer _single {};
        bool _single_pending = false;
    };

    inline result<uint64_t> value::uint() const noexcept
    {
        if (_type == major_type::uint) [[likely]]
            return _uint;
        return errc::type_mismatch;
    }

    inline result<uint64_t> value::nint() const noexcept
    {
        if (_type == major_type::nint) [[likely]]
            return _uint;
        return errc::type_mismatch;
    }

    inline result<buffer> value::bytes() const noexcept
    {
        if (_type != major_type::bytes) [[unlikely]]
            return errc::type_mismatch;
        if (is_chunked()) [[unlikely]]
            return errc::not_contiguous;
        return buffer { _ptr.bytes, _uint };
    }

    inline result<std::string_view> value::text() const noexcept
    {
        if (_type != major_type::text) [[unlikely]]
            return errc::type_mismatch;
        if (is_chunked()) [[unlikely]]
            return errc::not_contiguous;
        return std::string_view { _ptr.text, _uint };
    }

    inline result<size_t> value::copy_bytes(const write_buffer out) const noexcept
    {
        if (_type != major_type::bytes && _type != major_type::text) [[unlikely]]
            return errc::type_mismatch;
        if (_uint > out.size()) [[unlikely]]
            return errc::buffer_overflow;
        size_t pos = 0;
        for (chunk_iterator it { *this }; !it.done(); ) {
            const auto chunk = it.next();
            if (!chunk.empty())
                memcpy(out.data() + pos, chunk.data(), chunk.size());
            pos += chunk.size();
        }
        return pos;
    }

    inline result<std::span<const value>> value::array() const noexcept
    {
        if (_type == major_type::array) [[likely]]
            return std::span<const value> { _ptr.items, _uint };
        return errc::type_mismatch;
    }

    inline result<map_view> value::map() const noexcept
    {
        if (_type == major_type::map) [[likely]]
            return map_view { *this };
        return errc::type_mismatch;
    }

    inline result<value::tag_item> value::tag() const noexcept
    {
        if (_type == major_type::tag) [[likely]]
            return tag_item { _uint, *_ptr.items };
        return errc::type_mismatch;
    }

    inline result<special_val> value::simple() const noexcept
    {
        if (_type == major_type::simple) [[likely]]
            return static_cast<special_val>(_info);
        return errc::type_mismatch;
    }

    inline result<bool> value::boolean() const noexcept
    {
        if (_type == major_type::simple) [[likely]] {
            switch (static_cast<special_val>(_info)) {
                case special_val::s_false: return false;
                case special_val::s_true: return true;
                default: break;
            }
        }
        return errc::type_mismatch;
    }

    inline result<double> value::float64() const noexcept
    {
        if (is_float()) [[likely]]
            return std::bit_cast<double>(_uint);
        return errc::type_mismatch;
    }

    inline result<uint64_t> value::size() const noexcept
    {
        switch (_type) {
            case major_type::bytes:
            case major_type::text:
            case major_type::array:
            case major_type::map:
                return _uint;
            default:
                return errc::type_mismatch;
        }
    }

    namespace detail {
        inline bool same_payload(const value &a, const value &b) noexcept
        {
            chunk_iterator a_it { a }, b_it { b };
            buffer a_chunk {}, b_chunk {};
            for (;;) {
                while (a_chunk.empty() && !a_it.done())
                    a_chunk = a_it.next();
                while (b_chunk.empty() && !b_it.done())
                    b_chunk = b_it.next();
                if (a_chunk.empty() || b_chunk.empty())
                    return a_chunk.empty() && b_chunk.empty();
                const auto sz = std::min(a_chunk.size(), b_chunk.size());
                if (memcmp(a_chunk.data(), b_chunk.data(), sz) != 0)
                    return false;
                a_chunk = buffer { a_chunk.data() + sz, a_chunk.size() - sz };
                b_chunk = buffer { b_chunk.data() + sz, b_chunk.size() - sz };
            }
        }
    }

    // Structural equality: floats compare by their bit patterns, map items compare in order.
    inline bool value::operator==(const value &o) const noexcept
    {
        if (_type != o._type)
            return false;
        switch (_type) {
            case major_type::uint:
            case major_type::nint:
                return _uint == o._uint;
            case major_type::bytes:
            case major_type::text:
                return _uint == o._uint && detail::same_payload(*this, o);
            case major_type::array: {
                if (_uint != o._uint)
                    return false;
                for (size_t i = 0; i < _uint; ++i) {
                    if (!(_ptr.items[i] == o._ptr.items[i]))
                        return false;
                }
                return true;
            }
            case major_type::map: {
                if (_uint != o._uint)
                    return false;
                const map_view m { *this }, o_m { o };
                for (size_t i = 0; i < _uint; ++i) {
                    if (!(m.key(i) == o_m.key(i)) || !(m.val(i) == o_m.val(i)))
                        return false;
                }
                return true;
            }
            case major_type::tag:
                return _uint == o._uint && *_ptr.items == *o._ptr.items;
            case major_type::simple:
                return _info == o._info && _uint == o._uint;
            default:
                return false;
        }
    }
}

#endif // !STATIC_CBOR_CBOR_VALUE_HPP
