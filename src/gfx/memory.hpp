/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>

// First memory type index allowed by type_bits whose property flags contain all of `required`.
// Throws GfxError(NoSuitableMemoryType) when none exists.
uint32_t find_memory_type(const VkPhysicalDeviceMemoryProperties &props,
                          uint32_t type_bits,
                          VkMemoryPropertyFlags required);

uint32_t find_memory_type(VkPhysicalDevice phys, uint32_t type_bits, VkMemoryPropertyFlags required);
