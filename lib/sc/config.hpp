/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_CONFIG_HPP
#define STATIC_CBOR_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>
#include <boost/json/object.hpp>

namespace static_cbor {
    extern void consider_bin_dir(std::string_view bin_path);
    extern std::string install_path(std::string_view rel_path);

    // Settings of the command-line tool. The codec itself is configured only through its arguments.
    struct config {
        static constexpr size_t default_arena_size = 1 << 16;

        // Loads the file named by SC_CONFIG or etc/sc.json in the installation directory; missing files mean defaults.
        static const config &get();
        static config from_json(const boost::json::object &j);
        static config from_file(const std::string &path);

        // the number of value slots in the decode arena
        size_t arena_size = default_arena_size;
        // diagnostic rendering limits
        size_t max_depth = 16;
        size_t max_seq_to_expand = 100;
    };

    // Parses a positive integer setting and names it in the error message when the value is invalid.
    extern size_t parse_size(std::string_view name, std::string_view val);

    // The command-line value takes precedence over SC_ARENA_SIZE, which takes precedence over the config.
    extern size_t arena_size(const std::optional<std::string> &cli_val, const config &cfg=config::get());
}

#endif // !STATIC_CBOR_CONFIG_HPP
