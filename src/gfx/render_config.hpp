/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

#include "util/log.hpp"

// Built once in main() and passed by const reference; never mutated afterwards.
struct RenderConfig {
    std::string app_name = "vk-quad";
    uint32_t window_width = 1024;
    uint32_t window_height = 768;

    std::string shader_dir = "shaders";

#ifdef NDEBUG
    bool enable_validation = false;
    LogLevel log_level = LogLevel::Info;
#else
    bool enable_validation = true;
    LogLevel log_level = LogLevel::Debug;
#endif

    std::vector<const char *> device_extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    VkFormat preferred_format = VK_FORMAT_B8G8R8A8_SRGB;
    VkColorSpaceKHR preferred_color_space = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;

    // UINT64_MAX waits forever; anything finite turns VK_TIMEOUT into a DeviceLost error.
    uint64_t fence_timeout_ns = UINT64_MAX;

    bool recreate_on_suboptimal = true;

    // Stalls on the present queue before every present. Costs pipelining.
    bool wait_idle_before_present = false;

    VkClearColorValue clear_color = {{0.02f, 0.02f, 0.03f, 1.0f}};
};
