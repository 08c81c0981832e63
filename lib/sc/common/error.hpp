/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_COMMON_ERROR_HPP
#define STATIC_CBOR_COMMON_ERROR_HPP

#include <array>
#include <cerrno>
#include <stdexcept>
#include <string>
#include <utility>
#include "format.hpp"

/*
 * Exceptions are used only by the tooling layer: file I/O, configuration, and the command-line tool.
 * The codec itself reports failures with cbor::errc results, see cbor/error.hpp.
 */
namespace static_cbor {
    struct error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        template<typename... Args>
        explicit error(fmt::format_string<Args...> fmt, Args &&...a):
            error { std::in_place, fmt::format(fmt, std::forward<Args>(a)...) }
        {
        }

        // the first call also writes the stack trace of the throw site to the debug log
        const char *what() const noexcept override;
    protected:
        error(std::in_place_t, std::string msg);
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
        mutable bool _trace_logged = false;
    };

    // appends errno and its description to the message
    struct error_sys: error {
        template<typename... Args>
        explicit error_sys(fmt::format_string<Args...> fmt, Args &&...a):
            error_sys { errno, fmt::format(fmt, std::forward<Args>(a)...) }
        {
        }
    private:
        error_sys(int errnum, const std::string &msg);
    };
}

#endif // !STATIC_CBOR_COMMON_ERROR_HPP
