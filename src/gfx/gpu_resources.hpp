/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <span>
#include <vector>

// A buffer and the memory backing it. Destroyed together: buffer first, memory second.
struct GpuBuffer {
    VkBuffer buffer{};
    VkDeviceMemory memory{};
    VkDeviceSize size = 0;
    void *mapped{}; // non-null only for persistently mapped buffers
};

struct GpuImage {
    VkImage image{};
    VkDeviceMemory memory{};
    uint32_t width = 0;
    uint32_t height = 0;
};

// Decoded pixels as handed over by the asset loader: 4 bytes per pixel, tightly packed rows.
struct DecodedImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<std::uint8_t> rgba;
};

struct Texture {
    GpuImage image;
    VkImageView view{};
    VkSampler sampler{};
};

constexpr VkFormat kTextureFormat = VK_FORMAT_R8G8B8A8_SRGB;

// Throws GfxError(ResourceCreationFailed) for size 0 before touching the driver.
GpuBuffer create_buffer(VkPhysicalDevice phys,
                        VkDevice device,
                        VkDeviceSize size,
                        VkBufferUsageFlags usage,
                        VkMemoryPropertyFlags mem_flags);

// Host-visible, host-coherent buffer holding a byte-exact copy of `data`. Left unmapped.
GpuBuffer create_filled_buffer(
    VkPhysicalDevice phys, VkDevice device, VkBufferUsageFlags usage, const void *data, VkDeviceSize size);

template <typename T>
GpuBuffer create_filled_buffer(VkPhysicalDevice phys, VkDevice device, VkBufferUsageFlags usage, std::span<const T> items) {
    return create_filled_buffer(phys, device, usage, items.data(), static_cast<VkDeviceSize>(sizeof(T) * items.size()));
}

// Host-visible, host-coherent buffer that stays mapped until destroy_buffer().
GpuBuffer create_mapped_buffer(VkPhysicalDevice phys, VkDevice device, VkDeviceSize size, VkBufferUsageFlags usage);

void destroy_buffer(VkDevice device, GpuBuffer &buf);

// Throws GfxError(ResourceLoadFailed) for empty images or a pixel buffer of the wrong size.
void validate_decoded_image(const DecodedImage &img);

// Two-tone checkerboard, `cell` pixels per square.
DecodedImage make_checkerboard(uint32_t width, uint32_t height, uint32_t cell);

// Uploads through a staging buffer and blocks on `queue` until the copy has finished.
Texture upload_texture(VkPhysicalDevice phys, VkDevice device, VkQueue queue, VkCommandPool pool, const DecodedImage &img);

void destroy_texture(VkDevice device, Texture &tex);

VkCommandBuffer begin_one_shot(VkDevice device, VkCommandPool pool);
void end_one_shot(VkDevice device, VkCommandPool pool, VkQueue queue, VkCommandBuffer cmd);
