/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_CBOR_STRINGIFY_HPP
#define STATIC_CBOR_CBOR_STRINGIFY_HPP

#include <limits>
#include <sstream>
#include <string>
#include <sc/cbor/value.hpp>

namespace static_cbor::cbor {
    struct stringify_config {
        size_t max_depth = 16;
        // containers with more items are printed with their size only; 0 means no limit
        size_t max_seq_to_expand = 100;
    };

    inline bool is_ascii(const buffer b)
    {
        for (const uint8_t *p = b.data(), *end = p + b.size(); p < end; ++p) {
            if (*p < 32 || *p > 126)
                return false;
        }
        return true;
    }

    // -1 - n does not fit into int64_t for the largest offsets
    inline std::string nint_str(const uint64_t offset)
    {
        if (offset == std::numeric_limits<uint64_t>::max())
            return "-18446744073709551616";
        return fmt::format("-{}", offset + 1);
    }

    inline std::string payload_str(const value &v)
    {
        std::string s {};
        for (chunk_iterator it { v }; !it.done(); ) {
            const auto chunk = it.next();
            s.append(reinterpret_cast<const char *>(chunk.data()), chunk.size());
        }
        return s;
    }

    inline void stringify(std::ostream &os, const value &v, const stringify_config &cfg={}, const size_t depth=0)
    {
        const std::string shift_str(depth * 4, ' ');
        const auto expand = [&](const size_t sz) {
            return sz > 0 && (cfg.max_seq_to_expand == 0 || sz <= cfg.max_seq_to_expand) && depth < cfg.max_depth;
        };
        switch (v.type()) {
            case major_type::uint:
                os << "I " << v.special_uint();
                break;
            case major_type::nint:
                os << "I " << nint_str(v.special_uint());
                break;
            case major_type::bytes: {
                const auto data = payload_str(v);
                const buffer b { data };
                os << fmt::format("B #{}", b);
                if (!b.empty() && is_ascii(b))
                    os << " ('" << data << "')";
                if (v.is_chunked())
                    os << " (chunked)";
                break;
            }
            case major_type::text:
                os << "T '" << payload_str(v) << "'";
                if (v.is_chunked())
                    os << " (chunked)";
                break;
            case major_type::array: {
                const auto items = v.array().value();
                os << fmt::format("[(items: {})", items.size());
                if (expand(items.size())) {
                    os << '\n';
                    for (size_t i = 0; i < items.size(); ++i) {
                        os << shift_str << "    #" << i << ": ";
                        stringify(os, items[i], cfg, depth + 1);
                        os << '\n';
                    }
                    os << shift_str;
                }
                os << ']';
                break;
            }
            case major_type::map: {
                const auto m = v.map().value();
                os << fmt::format("{{(items: {})", m.size());
                if (expand(m.size())) {
                    os << '\n';
                    for (const auto &[key, val]: m) {
                        os << shift_str << "    ";
                        stringify(os, key, cfg, depth + 1);
                        os << ": ";
                        stringify(os, val, cfg, depth + 1);
                        os << '\n';
                    }
                    os << shift_str;
                }
                os << '}';
                break;
            }
            case major_type::tag: {
                const auto [id, item] = v.tag().value();
                os << "TAG " << id << " ";
                stringify(os, item, cfg, depth);
                break;
            }
            case major_type::simple:
                if (v.is_float()) {
                    os << fmt::format("F64 {}", v.float64().value());
                    break;
                }
                switch (v.simple().value()) {
                    case special_val::s_false: os << "FALSE"; break;
                    case special_val::s_true: os << "TRUE"; break;
                    case special_val::s_null: os << "NULL"; break;
                    case special_val::s_undefined: os << "UNDEFINED"; break;
                    default: os << fmt::format("SIMPLE {}", v.simple().value()); break;
                }
                break;
            default:
                os << fmt::format("unsupported CBOR type: {}", v.type());
                break;
        }
    }

    inline std::string stringify(const value &v, const stringify_config &cfg={})
    {
        std::stringstream ss {};
        stringify(ss, v, cfg);
        return ss.str();
    }
}

namespace fmt {
    template<>
    struct formatter<static_cbor::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", static_cbor::cbor::stringify(v));
        }
    };
}

#endif // !STATIC_CBOR_CBOR_STRINGIFY_HPP
