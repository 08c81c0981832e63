/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_CLI_COMMON_HPP
#define STATIC_CBOR_CLI_COMMON_HPP

#include <vector>
#include <sc/cbor/decoder.hpp>
#include <sc/common/bytes.hpp>
#include <sc/cli.hpp>

namespace static_cbor::cli::common {
    inline void add_opts(config &cmd)
    {
        cmd.opts.try_emplace("arena-size", "the number of value slots available for decoding a single item", std::optional<std::string> {},
            [](const std::optional<std::string> &val) -> std::optional<std::string> {
                if (!val)
                    return "a value is required";
                try {
                    parse_size("arena-size", *val);
                } catch (const std::exception &ex) {
                    return ex.what();
                }
                return {};
            });
    }

    inline size_t arena_size(const options &opts)
    {
        const auto it = opts.find("arena-size");
        return static_cbor::arena_size(it != opts.end() ? it->second : std::optional<std::string> {});
    }

    // Decodes consecutive items of data, each one with a fresh arena, and calls on_item(idx, offset, item, raw_item).
    // Throws an error naming the item and its offset when decoding fails.
    template<typename F>
    size_t decode_all(const buffer data, const size_t num_slots, const F &on_item)
    {
        std::vector<cbor::value> arena(num_slots);
        size_t num_items = 0;
        for (size_t offset = 0; offset < data.size(); ++num_items) {
            const auto item_data = subbuf(data, offset);
            const auto res = cbor::decode(item_data, arena);
            if (res.has_error())
                throw error("item #{} at offset {} is invalid: {}", num_items, offset, res.error().message());
            const auto &dec = res.value();
            on_item(num_items, offset, dec.root, subbuf(item_data, 0, dec.bytes_consumed));
            offset += dec.bytes_consumed;
        }
        return num_items;
    }
}

#endif // !STATIC_CBOR_CLI_COMMON_HPP
