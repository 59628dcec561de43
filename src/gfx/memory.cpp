/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/memory.hpp"

#include <format>

#include "util/checks.hpp"

uint32_t find_memory_type(const VkPhysicalDeviceMemoryProperties &props,
                          uint32_t type_bits,
                          VkMemoryPropertyFlags required) {
    for (uint32_t i = 0; i < props.memoryTypeCount && i < VK_MAX_MEMORY_TYPES; i++) {
        if ((type_bits & (1u << i)) && (props.memoryTypes[i].propertyFlags & required) == required) {
            return i;
        }
    }
    throw GfxError(ErrorKind::NoSuitableMemoryType,
                   std::format("No suitable memory type (type_bits=0x{:x}, flags=0x{:x})", type_bits, required));
}

uint32_t find_memory_type(VkPhysicalDevice phys, uint32_t type_bits, VkMemoryPropertyFlags required) {
    VkPhysicalDeviceMemoryProperties mp{};
    vkGetPhysicalDeviceMemoryProperties(phys, &mp);
    return find_memory_type(mp, type_bits, required);
}
