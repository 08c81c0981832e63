/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <iostream>
#include <sc/cli.hpp>
#include <sc/timer.hpp>

namespace static_cbor::cli {
    std::string config::make_usage() const
    {
        std::string usage { opts.empty() ? "" : "[options]" };
        for (const auto &arg_name: args.names)
            usage += fmt::format(" {}", arg_name);
        return fmt::format("{} - {}", usage, desc);
    }

    static std::string full_usage(const config &cfg)
    {
        std::string usage = fmt::format("usage: {} {}", cfg.name, cfg.make_usage());
        if (!cfg.opts.empty()) {
            usage += fmt::format("\n{} supports the following options:", cfg.name);
            for (const auto &[name, opt_cfg]: cfg.opts) {
                usage += fmt::format("\n    --{}", name);
                if (opt_cfg.default_value)
                    usage += fmt::format(" ({} by default)", *opt_cfg.default_value);
                usage += fmt::format(" - {}", opt_cfg.desc);
            }
        }
        return usage;
    }

    parse_result command::parse(const config &cfg, const arguments &args)
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (!arg.starts_with("--")) {
                pr.args.emplace_back(arg);
                continue;
            }
            const auto eq_pos = arg.find('=', 2);
            const auto name = arg.substr(2, eq_pos == arg.npos ? arg.npos : eq_pos - 2);
            if (!cfg.opts.contains(name))
                throw error("unknown option '--{}'", name);
            std::optional<std::string> val {};
            if (eq_pos != arg.npos)
                val = arg.substr(eq_pos + 1);
            if (!pr.opts.try_emplace(name, std::move(val)).second)
                throw error("duplicate option specification '{}'", arg);
        }
        for (const auto &[name, opt_cfg]: cfg.opts) {
            if (opt_cfg.default_value)
                pr.opts.try_emplace(name, *opt_cfg.default_value);
            const auto val_it = pr.opts.find(name);
            if (val_it == pr.opts.end() || !opt_cfg.validator)
                continue;
            if (const auto val_err = (*opt_cfg.validator)(val_it->second); val_err)
                throw error("value '{}' is invalid for '--{}': {}", val_it->second.value_or(""), name, *val_err);
        }
        if (pr.args.size() != cfg.args.names.size())
            throw error("{}", full_usage(cfg));
        return pr;
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::map<std::string, std::pair<std::shared_ptr<command>, config>> commands {};
        for (const auto &cmd: command_list) {
            config cfg {};
            cmd->configure(cfg);
            auto name = cfg.name;
            if (!commands.try_emplace(std::move(name), cmd, std::move(cfg)).second) [[unlikely]]
                throw error("multiple definitions for {}", cfg.name);
        }
        if (argc < 2) {
            std::cerr << "Usage: sc <command> [<arg> ...], where <command> is one of:\n";
            for (const auto &[name, meta]: commands)
                std::cerr << fmt::format("    {} {}\n", name, meta.second.make_usage());
            return 1;
        }

        const std::string cmd_name { argv[1] };
        const auto cmd_it = commands.find(cmd_name);
        if (cmd_it == commands.end()) {
            logger::error("unknown command {}", cmd_name);
            return 1;
        }
        const arguments args(argv + 2, argv + argc);
        const auto failure = logger::run_log_errors(cmd_name, [&] {
            const auto &[cmd, cfg] = cmd_it->second;
            timer t { fmt::format("sc {}", cmd_name), logger::level::debug };
            const auto pr = command::parse(cfg, args);
            cmd->run(pr.args, pr.opts);
        });
        return failure ? 1 : 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
