/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

#include "gfx/gpu_resources.hpp"

class VkContext;
class Swapchain;
class MeshPipeline;

// Synchronization for one frame-in-flight slot.
struct FrameSync {
    VkSemaphore image_available{};
    VkSemaphore render_finished{};
    VkFence in_flight{}; // created signaled so the first wait returns immediately
};

class FrameRing {
public:
    static constexpr uint32_t kMaxFrames = 2;

    void init(VkDevice device);
    void shutdown(VkDevice device);

    FrameSync &slot(uint32_t i) { return frames_[i]; }
    const FrameSync &slot(uint32_t i) const { return frames_[i]; }

private:
    FrameSync frames_[kMaxFrames]{};
};

// A rebuilt swapchain bundle must hold exactly one framebuffer and one ImageResources per image.
// Throws GfxError(ResourceCreationFailed) otherwise.
void check_swapchain_bundle(uint32_t image_count, uint32_t framebuffer_count, uint32_t per_image_count);

// What every per-image command buffer draws.
struct DrawData {
    VkBuffer vertex_buffer{};
    VkBuffer index_buffer{};
    uint32_t index_count = 0;
    const Texture *texture = nullptr;
    VkClearColorValue clear_color{};
};

struct ImageResources {
    VkCommandBuffer cmd{};
    GpuBuffer ubo; // persistently mapped
    VkDescriptorSet ds{};
};

// Per-swapchain-image command buffers, uniform buffers and descriptor sets. Their count follows
// the swapchain, so they are rebuilt with it.
class SwapchainImages {
public:
    void create(VkContext &ctx, const Swapchain &sw, const MeshPipeline &pipe, const DrawData &draw);
    void destroy(VkDevice device, VkCommandPool pool);

    ImageResources &image(uint32_t i) { return images_.at(i); }
    uint32_t count() const { return static_cast<uint32_t>(images_.size()); }

private:
    void record(uint32_t i, const Swapchain &sw, const MeshPipeline &pipe, const DrawData &draw);

    std::vector<ImageResources> images_;
    VkDescriptorPool pool_{};
};
