/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cstdio>
#include <memory>
#include <sc/file.hpp>
#include <sc/logger.hpp>

namespace static_cbor::file {
    struct file_closer {
        void operator()(std::FILE *f) const noexcept
        {
            std::fclose(f);
        }
    };
    using file_ptr = std::unique_ptr<std::FILE, file_closer>;

    void read(const std::string &path, uint8_vector &buf)
    {
        file_ptr f { std::fopen(path.c_str(), "rb") };
        if (!f)
            throw error_sys("failed to open for read: {}", path);
        std::error_code ec {};
        const auto sz = std::filesystem::file_size(path, ec);
        if (ec)
            throw error("failed to get the size of {}: {}", path, ec.message());
        buf.resize(sz);
        if (sz > 0 && std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size())
            throw error_sys("failed to read {} bytes from {}", buf.size(), path);
        logger::trace("read {} bytes from {}", buf.size(), path);
    }

    void write(const std::string &path, const buffer data)
    {
        const auto parent = std::filesystem::path { path }.parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent);
        file_ptr f { std::fopen(path.c_str(), "wb") };
        if (!f)
            throw error_sys("failed to open for write: {}", path);
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size())
            throw error_sys("failed to write {} bytes to {}", data.size(), path);
        if (std::fclose(f.release()) != 0)
            throw error_sys("failed to close {}", path);
        logger::trace("wrote {} bytes to {}", data.size(), path);
    }

    tmp::tmp(const std::string &name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        if (!std::filesystem::remove(_path, ec) && ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }
}
