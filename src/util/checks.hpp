/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Vulkan,
    NoSuitableDevice,
    NoSuitableQueueFamily,
    NoSuitableMemoryType,
    ResourceCreationFailed,
    AllocationFailed,
    ResourceLoadFailed,
    DeviceLost,
};

const char *to_string(ErrorKind kind);

class GfxError : public std::runtime_error {
public:
    GfxError(ErrorKind kind, const std::string &what, VkResult result = VK_SUCCESS)
        : std::runtime_error(what), kind_(kind), result_(result) {}

    ErrorKind kind() const { return kind_; }
    VkResult result() const { return result_; }

private:
    ErrorKind kind_;
    VkResult result_;
};

inline void vk_check(VkResult r, const char *what, ErrorKind kind = ErrorKind::Vulkan) {
    if (r == VK_SUCCESS) {
        return;
    }
    if (r == VK_ERROR_DEVICE_LOST) {
        kind = ErrorKind::DeviceLost;
    }
    throw GfxError(kind, std::string(what) + " (VkResult=" + std::to_string(r) + ")", r);
}
