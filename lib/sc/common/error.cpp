/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cstring>
#include <typeinfo>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include <sc/logger.hpp>

namespace static_cbor {
    error::error(std::in_place_t, std::string msg):
        _msg { std::move(msg) }
    {
        // skips the frames of safe_dump_to and of the constructors
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    const char *error::what() const noexcept
    {
        if (!_trace_logged) {
            _trace_logged = true;
            try {
                thread_local std::array<char, 0x2000> buf {};
                boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
                os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
                buf[os.buffer().second] = 0;
                logger::debug("{} ({}) raised at:\n{}", typeid(*this).name(), _msg, buf.data());
            } catch (const std::exception &) {
                // the message stays available even when the trace cannot be logged
            }
        }
        return _msg.c_str();
    }

    error_sys::error_sys(const int errnum, const std::string &msg):
        error { std::in_place, fmt::format("{} errno: {} strerror: {}", msg, errnum, std::strerror(errnum)) }
    {
    }
}
