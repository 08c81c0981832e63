/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <boost/json.hpp>
#include <sc/common/error.hpp>
#include <sc/config.hpp>
#include <sc/file.hpp>
#include <sc/logger.hpp>

namespace static_cbor {
    static bool install_dir_ok(const std::filesystem::path &dir)
    {
        return std::filesystem::exists(dir / "etc" / "sc.json");
    }

    // Must be configured before any multi-threading code is executed
    static std::filesystem::path install_dir(const std::optional<std::filesystem::path> &override_dir={})
    {
        static std::optional<std::filesystem::path> dir {};
        if (override_dir && install_dir_ok(*override_dir)) {
            dir.emplace(*override_dir);
            std::cerr << fmt::format("SC_INIT: install dir: {} resolved using the binary-relative path\n", dir->string());
        }
        if (!dir)
            dir.emplace(std::filesystem::absolute(std::filesystem::current_path()));
        return *dir;
    }

    // The sc binary is expected to be located:
    // 1) in prod: in a bin subdirectory of the installation directory
    // 2) in dev: in a build subdirectory of the source-code directory
    void consider_bin_dir(const std::string_view bin_path)
    {
        const auto bin_dir = std::filesystem::weakly_canonical(std::filesystem::absolute(bin_path)).parent_path().parent_path();
        install_dir(bin_dir);
    }

    std::string install_path(const std::string_view rel_path)
    {
        std::filesystem::path path { rel_path };
        if (path.is_relative())
            path = std::filesystem::absolute(install_dir() / path);
        return std::filesystem::weakly_canonical(path).string();
    }

    static size_t json_size(const boost::json::object &j, const std::string_view name, const size_t def)
    {
        const auto *v = j.if_contains(name);
        if (!v)
            return def;
        if (!v->is_int64() || v->as_int64() <= 0)
            throw error("configuration element {} must be a positive integer but got {}", name, boost::json::serialize(*v));
        return static_cast<size_t>(v->as_int64());
    }

    config config::from_json(const boost::json::object &j)
    {
        config c {};
        c.arena_size = json_size(j, "arenaSize", c.arena_size);
        c.max_depth = json_size(j, "maxDepth", c.max_depth);
        c.max_seq_to_expand = json_size(j, "maxSeqToExpand", c.max_seq_to_expand);
        return c;
    }

    config config::from_file(const std::string &path)
    {
        const auto bytes = file::read(path);
        boost::json::value j {};
        try {
            j = boost::json::parse(buffer { bytes }.string_view());
        } catch (const std::exception &ex) {
            throw error("failed to parse the configuration file {}: {}", path, ex.what());
        }
        if (!j.is_object())
            throw error("the configuration file {} must contain a JSON object", path);
        return from_json(j.get_object());
    }

    static std::string config_path()
    {
        const char *env_path = std::getenv("SC_CONFIG");
        return install_path(env_path ? env_path : "etc/sc.json");
    }

    const config &config::get()
    {
        static config cfg = [] {
            const auto path = config_path();
            if (!std::filesystem::exists(path)) {
                logger::debug("configuration file {} is missing, using the defaults", path);
                return config {};
            }
            logger::debug("configuration file: {}", path);
            return from_file(path);
        }();
        return cfg;
    }

    size_t parse_size(const std::string_view name, const std::string_view val)
    {
        size_t res = 0;
        const auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), res);
        if (ec != std::errc {} || ptr != val.data() + val.size() || res == 0)
            throw error("{} must be a positive integer but got: '{}'", name, val);
        return res;
    }

    size_t arena_size(const std::optional<std::string> &cli_val, const config &cfg)
    {
        if (cli_val)
            return parse_size("arena-size", *cli_val);
        if (const char *env_val = std::getenv("SC_ARENA_SIZE"); env_val)
            return parse_size("SC_ARENA_SIZE", env_val);
        return cfg.arena_size;
    }
}
