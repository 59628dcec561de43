/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "util/checks.hpp"

const char *to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Vulkan:
        return "Vulkan";
    case ErrorKind::NoSuitableDevice:
        return "NoSuitableDevice";
    case ErrorKind::NoSuitableQueueFamily:
        return "NoSuitableQueueFamily";
    case ErrorKind::NoSuitableMemoryType:
        return "NoSuitableMemoryType";
    case ErrorKind::ResourceCreationFailed:
        return "ResourceCreationFailed";
    case ErrorKind::AllocationFailed:
        return "AllocationFailed";
    case ErrorKind::ResourceLoadFailed:
        return "ResourceLoadFailed";
    case ErrorKind::DeviceLost:
        return "DeviceLost";
    }
    return "Unknown";
}
