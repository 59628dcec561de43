/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstddef>
#include <string>
#include <vector>

#include "gfx/vk_bootstrap.hpp"

enum class DeviceState { Unselected, Evaluated, Selected, Rejected };

// Everything the suitability predicate looks at, gathered up front so the predicate itself
// never touches the driver.
struct DeviceCandidate {
    VkPhysicalDevice handle{};
    std::string name;

    std::vector<VkQueueFamilyProperties> queue_families;
    std::vector<bool> present_support; // indexed like queue_families
    std::vector<std::string> extensions;
    size_t format_count = 0;
    size_t present_mode_count = 0;

    DeviceState state = DeviceState::Unselected;
    QueueFamilyIndices families{};
    std::string reject_reason;
};

// Prefers one family that does both; otherwise first graphics and first presenting family.
QueueFamilyIndices find_queue_families(const DeviceCandidate &dev);

// Moves the candidate to Evaluated, fills `families` and returns true when all four checks pass;
// otherwise sets `reject_reason`.
bool evaluate_device(DeviceCandidate &dev, const std::vector<const char *> &required_extensions);

// Marks the first suitable candidate Selected, every other evaluated one Rejected.
// Throws GfxError(NoSuitableDevice) if nothing qualifies.
size_t select_device(std::vector<DeviceCandidate> &candidates, const std::vector<const char *> &required_extensions);

DeviceCandidate query_candidate(VkPhysicalDevice phys, VkSurfaceKHR surface);

VkSharingMode swapchain_sharing_mode(const QueueFamilyIndices &qf);
