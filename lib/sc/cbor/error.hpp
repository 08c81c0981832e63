/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_CBOR_ERROR_HPP
#define STATIC_CBOR_CBOR_ERROR_HPP

#include <string>
#include <string_view>
#include <type_traits>
#include <boost/outcome/result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/system/error_code.hpp>
#include <sc/common/format.hpp>

/*
 * The codec never throws and never allocates on its own: every failure is returned as a cbor::errc
 * wrapped into a boost::system::error_code and carried by an outcome result.
 */
namespace static_cbor::cbor {
    namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

    enum class errc: int {
        success = 0,
        // the destination buffer (encode) or the remaining input (decode) is too small
        buffer_overflow,
        // a malformed or unsupported encoding: reserved additional info, invalid UTF-8, too deep nesting
        invalid_type,
        // the decode arena has too few value slots
        arena_overflow,
        // an accessor was called for a different variant
        type_mismatch,
        // a chunked string cannot be exposed as a single contiguous slice
        not_contiguous
    };

    constexpr std::string_view errc_name(const errc e) noexcept
    {
        switch (e) {
            case errc::success: return "success";
            case errc::buffer_overflow: return "buffer_overflow";
            case errc::invalid_type: return "invalid_type";
            case errc::arena_overflow: return "arena_overflow";
            case errc::type_mismatch: return "type_mismatch";
            case errc::not_contiguous: return "not_contiguous";
            default: return "unknown";
        }
    }

    struct error_category: boost::system::error_category {
        virtual ~error_category() noexcept =default;

        const char *name() const noexcept override
        {
            return "cbor";
        }

        std::string message(const int code) const override
        {
            return std::string { errc_name(static_cast<errc>(code)) };
        }

        boost::system::error_condition default_error_condition(const int code) const noexcept override
        {
            switch (static_cast<errc>(code)) {
                case errc::success:
                    return make_error_condition(boost::system::errc::success);
                case errc::buffer_overflow:
                case errc::arena_overflow:
                    return make_error_condition(boost::system::errc::no_buffer_space);
                case errc::invalid_type:
                    return make_error_condition(boost::system::errc::illegal_byte_sequence);
                case errc::type_mismatch:
                case errc::not_contiguous:
                    return make_error_condition(boost::system::errc::invalid_argument);
                default:
                    return { code, *this };
            }
        }
    };

    inline const boost::system::error_category &cbor_category() noexcept
    {
        static const error_category category {};
        return category;
    }

    // found by ADL when an errc is converted into a boost::system::error_code
    inline boost::system::error_code make_error_code(const errc e) noexcept
    {
        return { static_cast<int>(e), cbor_category() };
    }

    template<typename T>
    using result = outcome::result<T>;
}

namespace boost::system {
    template<>
    struct is_error_code_enum<static_cbor::cbor::errc>: std::true_type {
    };
}

namespace fmt {
    template<>
    struct formatter<static_cbor::cbor::errc>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", static_cbor::cbor::errc_name(v));
        }
    };
}

#endif // !STATIC_CBOR_CBOR_ERROR_HPP
