/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef STATIC_CBOR_FILE_HPP
#define STATIC_CBOR_FILE_HPP

#include <filesystem>
#include <string>
#include <sc/common/bytes.hpp>

namespace static_cbor::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, buffer data);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    // A path in the system's temporary directory; the file is removed when the object goes out of scope.
    struct tmp {
        explicit tmp(const std::string &name);
        ~tmp();

        tmp(const tmp &) =delete;
        tmp &operator=(const tmp &) =delete;

        const std::string &path() const noexcept
        {
            return _path;
        }

        operator const std::string &() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !STATIC_CBOR_FILE_HPP
