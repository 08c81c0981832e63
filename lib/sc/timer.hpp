/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_TIMER_HPP
#define STATIC_CBOR_TIMER_HPP

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <sc/logger.hpp>

namespace static_cbor {
    // Logs the lifetime of a scope on destruction, marking scopes left by an exception as failed.
    struct timer {
        using clock = std::chrono::steady_clock;

        explicit timer(const std::string_view title, const logger::level lev=logger::level::trace):
            _title { title }, _level { lev }
        {
        }

        timer(const timer &) =delete;
        timer &operator=(const timer &) =delete;

        ~timer() noexcept
        {
            try {
                if (std::uncaught_exceptions() == _num_uncaught)
                    logger::log(_level, "{} took {:0.3f} secs", _title, duration());
                else
                    logger::log(_level, "{} failed after {:0.3f} secs", _title, duration());
            } catch (const std::exception &ex) {
                std::cerr << "timer: failed to log the duration of " << _title << ": " << ex.what() << '\n';
            }
        }

        double duration() const
        {
            return std::chrono::duration<double> { clock::now() - _start }.count();
        }
    private:
        const std::string _title;
        const logger::level _level;
        const int _num_uncaught = std::uncaught_exceptions();
        const clock::time_point _start = clock::now();
    };
}

#endif // !STATIC_CBOR_TIMER_HPP
