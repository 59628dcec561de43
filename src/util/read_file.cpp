/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "util/checks.hpp"
#include "util/read_file.hpp"

std::vector<std::uint8_t> read_file_binary(const std::string &path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw GfxError(ErrorKind::ResourceLoadFailed, std::format("Cannot stat {}: {}", path, ec.message()));
    }

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw GfxError(ErrorKind::ResourceLoadFailed, "Failed to open file: " + path);
    }

    std::vector<std::uint8_t> data(static_cast<size_t>(size));
    if (size > 0 && !f.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(size))) {
        throw GfxError(ErrorKind::ResourceLoadFailed, std::format("Short read on {} ({} bytes expected)", path, size));
    }
    return data;
}
