/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_LOGGER_HPP
#define STATIC_CBOR_LOGGER_HPP

#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <sc/common/format.hpp>

namespace static_cbor::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    extern void log(level lev, const std::string &msg);

    template<typename... Args>
    void log(const level lev, fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(lev, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::trace, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::debug, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::info, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::warn, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::error, fmt::format(fmt, std::forward<Args>(a)...));
    }

    // Runs the action and logs an exception escaping it as "<context>: <message>".
    // Returns the exception or nullptr when the action completed.
    extern std::exception_ptr run_log_errors(std::string_view context, const std::function<void()> &action);
}

#endif // !STATIC_CBOR_LOGGER_HPP
