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

class Swapchain;

// SPIR-V blobs, read once at startup and reused on every pipeline rebuild.
struct ShaderBlobs {
    std::vector<std::uint8_t> vert;
    std::vector<std::uint8_t> frag;
};

ShaderBlobs load_shader_blobs(const std::string &shader_dir);

// Graphics pipeline for the textured mesh plus one framebuffer per swapchain image.
// The descriptor set layout outlives swapchain rebuilds; everything else is rebuilt with the chain.
class MeshPipeline {
public:
    void init(VkDevice device);
    void shutdown(VkDevice device);

    void create(VkDevice device, const Swapchain &sw, const ShaderBlobs &shaders);
    void destroy_framebuffers(VkDevice device);
    void destroy(VkDevice device);

    VkPipelineLayout layout() const { return layout_; }
    VkPipeline pipeline() const { return pipe_; }
    VkDescriptorSetLayout dsl() const { return dsl_; }

    VkFramebuffer framebuffer(uint32_t swap_img) const { return fb_.at(swap_img); }
    uint32_t framebuffer_count() const { return static_cast<uint32_t>(fb_.size()); }

private:
    void create_framebuffers(VkDevice device, const Swapchain &sw);

    VkDescriptorSetLayout dsl_{};
    VkPipelineLayout layout_{};
    VkPipeline pipe_{};

    std::vector<VkFramebuffer> fb_;
};
