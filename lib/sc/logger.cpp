/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sc/config.hpp>
#include <sc/logger.hpp>

namespace static_cbor::logger {
    static bool tracing_enabled()
    {
        return std::getenv("SC_DEBUG") != nullptr;
    }

    static std::string log_path()
    {
        const char *env_log_path = std::getenv("SC_LOG");
        return install_path(env_log_path ? env_log_path : "./log/sc.log");
    }

    static bool console_enabled()
    {
        return !std::getenv("SC_LOG_NO_CONSOLE");
    }

    static spdlog::logger create(const std::string &path)
    {
        {
            std::error_code ec {};
            std::filesystem::create_directories(std::filesystem::path { path }.parent_path(), ec);
            std::ofstream os { path, std::ios_base::app };
            if (!os) {
                std::cerr << fmt::format("SC_INIT: Unable to write to the log file: {}; terminating.\n", path);
                std::terminate();
            }
        }

        std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink {};
        if (console_enabled()) {
            console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
        auto logger = console_sink
            ? spdlog::logger("sc", { console_sink, file_sink })
            : spdlog::logger("sc", { file_sink });
        if (tracing_enabled()) {
            logger.set_level(spdlog::level::trace);
        } else {
            logger.set_level(spdlog::level::debug);
        }
        logger.flush_on(spdlog::level::debug);
        logger.debug("log path: {}", path);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    void log(const level lev, const std::string &msg)
    {
        auto &l = get();
        switch (lev) {
            case level::trace:
                l.trace(msg);
                break;
            case level::debug:
                l.debug(msg);
                break;
            case level::info:
                l.info(msg);
                break;
            case level::warn:
                l.warn(msg);
                break;
            case level::error:
                l.error(msg);
                break;
            default:
                l.error("unsupported log level {}: {}", static_cast<int>(lev), msg);
                break;
        }
    }

    std::exception_ptr run_log_errors(const std::string_view context, const std::function<void()> &action)
    {
        try {
            action();
        } catch (const std::exception &ex) {
            error("{}: {}", context, ex.what());
            return std::current_exception();
        }
        return {};
    }
}
