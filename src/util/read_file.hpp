/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Whole file as bytes. Throws GfxError(ResourceLoadFailed) if it cannot be opened or read.
std::vector<std::uint8_t> read_file_binary(const std::string &path);
