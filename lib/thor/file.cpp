/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <filesystem>
#include <fstream>
#include <thor/file.hpp>

namespace thor_sdk::file {
    uint8_vector read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        const auto sz = std::filesystem::file_size(path);
        uint8_vector data(sz);
        if (sz > 0 && !is.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(sz)))
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
        return data;
    }
}
