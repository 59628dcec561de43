/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/gpu_resources.hpp"

#include <cstring>
#include <format>

#include "gfx/memory.hpp"
#include "util/checks.hpp"

namespace {

constexpr VkMemoryPropertyFlags kHostMemory = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;

void transition_layout(VkCommandBuffer cmd,
                       VkImage image,
                       VkImageLayout from,
                       VkImageLayout to,
                       VkAccessFlags src_access,
                       VkAccessFlags dst_access,
                       VkPipelineStageFlags src_stage,
                       VkPipelineStageFlags dst_stage) {
    VkImageMemoryBarrier barrier{VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER};
    barrier.srcAccessMask = src_access;
    barrier.dstAccessMask = dst_access;
    barrier.oldLayout = from;
    barrier.newLayout = to;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    barrier.subresourceRange.levelCount = 1;
    barrier.subresourceRange.layerCount = 1;

    vkCmdPipelineBarrier(cmd, src_stage, dst_stage, 0, 0, nullptr, 0, nullptr, 1, &barrier);
}

GpuImage create_device_image(VkPhysicalDevice phys, VkDevice device, uint32_t w, uint32_t h) {
    GpuImage out{};
    out.width = w;
    out.height = h;

    VkImageCreateInfo ici{VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO};
    ici.imageType = VK_IMAGE_TYPE_2D;
    ici.format = kTextureFormat;
    ici.extent = {w, h, 1};
    ici.mipLevels = 1;
    ici.arrayLayers = 1;
    ici.samples = VK_SAMPLE_COUNT_1_BIT;
    ici.tiling = VK_IMAGE_TILING_OPTIMAL;
    ici.usage = VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;
    ici.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    ici.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    vk_check(vkCreateImage(device, &ici, nullptr, &out.image), "vkCreateImage", ErrorKind::ResourceCreationFailed);

    try {
        VkMemoryRequirements req{};
        vkGetImageMemoryRequirements(device, out.image, &req);

        VkMemoryAllocateInfo mai{VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO};
        mai.allocationSize = req.size;
        mai.memoryTypeIndex = find_memory_type(phys, req.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
        vk_check(vkAllocateMemory(device, &mai, nullptr, &out.memory), "vkAllocateMemory(image)",
                 ErrorKind::AllocationFailed);
        vk_check(vkBindImageMemory(device, out.image, out.memory, 0), "vkBindImageMemory");
    } catch (...) {
        vkDestroyImage(device, out.image, nullptr);
        if (out.memory) {
            vkFreeMemory(device, out.memory, nullptr);
        }
        throw;
    }
    return out;
}

} // namespace

GpuBuffer create_buffer(VkPhysicalDevice phys,
                        VkDevice device,
                        VkDeviceSize size,
                        VkBufferUsageFlags usage,
                        VkMemoryPropertyFlags mem_flags) {
    if (size == 0) {
        throw GfxError(ErrorKind::ResourceCreationFailed, "Refusing to create a zero-sized buffer");
    }

    GpuBuffer out{};
    out.size = size;

    VkBufferCreateInfo bci{VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO};
    bci.size = size;
    bci.usage = usage;
    bci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    vk_check(vkCreateBuffer(device, &bci, nullptr, &out.buffer), "vkCreateBuffer", ErrorKind::ResourceCreationFailed);

    try {
        VkMemoryRequirements req{};
        vkGetBufferMemoryRequirements(device, out.buffer, &req);

        VkMemoryAllocateInfo mai{VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO};
        mai.allocationSize = req.size;
        mai.memoryTypeIndex = find_memory_type(phys, req.memoryTypeBits, mem_flags);

        vk_check(vkAllocateMemory(device, &mai, nullptr, &out.memory), "vkAllocateMemory", ErrorKind::AllocationFailed);
        vk_check(vkBindBufferMemory(device, out.buffer, out.memory, 0), "vkBindBufferMemory");
    } catch (...) {
        destroy_buffer(device, out);
        throw;
    }
    return out;
}

GpuBuffer create_filled_buffer(
    VkPhysicalDevice phys, VkDevice device, VkBufferUsageFlags usage, const void *data, VkDeviceSize size) {
    GpuBuffer out = create_buffer(phys, device, size, usage, kHostMemory);

    void *dst = nullptr;
    VkResult r = vkMapMemory(device, out.memory, 0, size, 0, &dst);
    if (r != VK_SUCCESS) {
        destroy_buffer(device, out);
        vk_check(r, "vkMapMemory");
    }
    std::memcpy(dst, data, static_cast<size_t>(size));
    vkUnmapMemory(device, out.memory);
    return out;
}

GpuBuffer create_mapped_buffer(VkPhysicalDevice phys, VkDevice device, VkDeviceSize size, VkBufferUsageFlags usage) {
    GpuBuffer out = create_buffer(phys, device, size, usage, kHostMemory);

    VkResult r = vkMapMemory(device, out.memory, 0, VK_WHOLE_SIZE, 0, &out.mapped);
    if (r != VK_SUCCESS) {
        destroy_buffer(device, out);
        vk_check(r, "vkMapMemory");
    }
    return out;
}

void destroy_buffer(VkDevice device, GpuBuffer &buf) {
    if (buf.mapped) {
        vkUnmapMemory(device, buf.memory);
    }
    if (buf.buffer) {
        vkDestroyBuffer(device, buf.buffer, nullptr);
    }
    if (buf.memory) {
        vkFreeMemory(device, buf.memory, nullptr);
    }
    buf = GpuBuffer{};
}

VkCommandBuffer begin_one_shot(VkDevice device, VkCommandPool pool) {
    VkCommandBufferAllocateInfo cai{VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO};
    cai.commandPool = pool;
    cai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cai.commandBufferCount = 1;

    VkCommandBuffer cmd{};
    vk_check(vkAllocateCommandBuffers(device, &cai, &cmd), "vkAllocateCommandBuffers(one-shot)");

    VkCommandBufferBeginInfo cbi{VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO};
    cbi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    VkResult r = vkBeginCommandBuffer(cmd, &cbi);
    if (r != VK_SUCCESS) {
        vkFreeCommandBuffers(device, pool, 1, &cmd);
        vk_check(r, "vkBeginCommandBuffer(one-shot)");
    }
    return cmd;
}

void end_one_shot(VkDevice device, VkCommandPool pool, VkQueue queue, VkCommandBuffer cmd) {
    VkResult r = vkEndCommandBuffer(cmd);
    if (r == VK_SUCCESS) {
        VkSubmitInfo si{VK_STRUCTURE_TYPE_SUBMIT_INFO};
        si.commandBufferCount = 1;
        si.pCommandBuffers = &cmd;
        r = vkQueueSubmit(queue, 1, &si, VK_NULL_HANDLE);
    }
    // The one-shot path trades pipelining for simplicity: the CPU waits for the transfer.
    if (r == VK_SUCCESS) {
        r = vkQueueWaitIdle(queue);
    }
    vkFreeCommandBuffers(device, pool, 1, &cmd);
    vk_check(r, "one-shot submit");
}

void validate_decoded_image(const DecodedImage &img) {
    if (img.width == 0 || img.height == 0) {
        throw GfxError(ErrorKind::ResourceLoadFailed, std::format("Empty texture ({}x{})", img.width, img.height));
    }
    const size_t expected = static_cast<size_t>(img.width) * img.height * 4;
    if (img.rgba.size() != expected) {
        throw GfxError(ErrorKind::ResourceLoadFailed,
                       std::format("Texture {}x{} needs {} bytes, got {}", img.width, img.height, expected,
                                   img.rgba.size()));
    }
}

DecodedImage make_checkerboard(uint32_t width, uint32_t height, uint32_t cell) {
    if (cell == 0) {
        cell = 1;
    }
    DecodedImage img;
    img.width = width;
    img.height = height;
    img.rgba.resize(static_cast<size_t>(width) * height * 4);

    for (uint32_t y = 0; y < height; y++) {
        for (uint32_t x = 0; x < width; x++) {
            const bool light = ((x / cell) + (y / cell)) % 2 == 0;
            const std::uint8_t v = light ? 230 : 40;
            std::uint8_t *px = &img.rgba[(static_cast<size_t>(y) * width + x) * 4];
            px[0] = v;
            px[1] = v;
            px[2] = v;
            px[3] = 255;
        }
    }
    return img;
}

Texture upload_texture(VkPhysicalDevice phys, VkDevice device, VkQueue queue, VkCommandPool pool, const DecodedImage &img) {
    validate_decoded_image(img);

    GpuBuffer staging = create_filled_buffer(phys, device, VK_BUFFER_USAGE_TRANSFER_SRC_BIT, img.rgba.data(),
                                             static_cast<VkDeviceSize>(img.rgba.size()));

    Texture tex{};
    try {
        tex.image = create_device_image(phys, device, img.width, img.height);

        VkCommandBuffer cmd = begin_one_shot(device, pool);

        transition_layout(cmd, tex.image.image, VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 0,
                          VK_ACCESS_TRANSFER_WRITE_BIT, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT,
                          VK_PIPELINE_STAGE_TRANSFER_BIT);

        VkBufferImageCopy region{};
        region.bufferOffset = 0;
        region.bufferRowLength = 0;
        region.bufferImageHeight = 0;
        region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        region.imageSubresource.mipLevel = 0;
        region.imageSubresource.baseArrayLayer = 0;
        region.imageSubresource.layerCount = 1;
        region.imageOffset = {0, 0, 0};
        region.imageExtent = {img.width, img.height, 1};
        vkCmdCopyBufferToImage(cmd, staging.buffer, tex.image.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

        transition_layout(cmd, tex.image.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                          VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, VK_ACCESS_TRANSFER_WRITE_BIT,
                          VK_ACCESS_SHADER_READ_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT,
                          VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT);

        end_one_shot(device, pool, queue, cmd);
        destroy_buffer(device, staging);

        VkImageViewCreateInfo vci{VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO};
        vci.image = tex.image.image;
        vci.viewType = VK_IMAGE_VIEW_TYPE_2D;
        vci.format = kTextureFormat;
        vci.components = {VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY,
                          VK_COMPONENT_SWIZZLE_IDENTITY};
        vci.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        vci.subresourceRange.levelCount = 1;
        vci.subresourceRange.layerCount = 1;
        vk_check(vkCreateImageView(device, &vci, nullptr, &tex.view), "vkCreateImageView(texture)",
                 ErrorKind::ResourceCreationFailed);

        VkSamplerCreateInfo sci{VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO};
        sci.magFilter = VK_FILTER_NEAREST;
        sci.minFilter = VK_FILTER_NEAREST;
        sci.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
        sci.addressModeU = VK_SAMPLER_ADDRESS_MODE_REPEAT;
        sci.addressModeV = VK_SAMPLER_ADDRESS_MODE_REPEAT;
        sci.addressModeW = VK_SAMPLER_ADDRESS_MODE_REPEAT;
        sci.anisotropyEnable = VK_FALSE;
        sci.maxAnisotropy = 1.0f;
        sci.minLod = 0.0f;
        sci.maxLod = 0.0f;
        vk_check(vkCreateSampler(device, &sci, nullptr, &tex.sampler), "vkCreateSampler",
                 ErrorKind::ResourceCreationFailed);
    } catch (...) {
        destroy_buffer(device, staging);
        destroy_texture(device, tex);
        throw;
    }
    return tex;
}

void destroy_texture(VkDevice device, Texture &tex) {
    if (tex.sampler) {
        vkDestroySampler(device, tex.sampler, nullptr);
    }
    if (tex.view) {
        vkDestroyImageView(device, tex.view, nullptr);
    }
    if (tex.image.image) {
        vkDestroyImage(device, tex.image.image, nullptr);
    }
    if (tex.image.memory) {
        vkFreeMemory(device, tex.image.memory, nullptr);
    }
    tex = Texture{};
}
