/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>
#include <format>
#include <vector>

#include "gfx/frame_resources.hpp"
#include "gfx/mesh.hpp"
#include "gfx/mesh_pipeline.hpp"
#include "gfx/swapchain.hpp"
#include "gfx/vk_context.hpp"
#include "util/checks.hpp"

void check_swapchain_bundle(uint32_t image_count, uint32_t framebuffer_count, uint32_t per_image_count) {
    if (image_count == 0 || framebuffer_count != image_count || per_image_count != image_count) {
        throw GfxError(ErrorKind::ResourceCreationFailed,
                       std::format("Inconsistent swapchain bundle: {} images, {} framebuffers, {} per-image sets",
                                   image_count, framebuffer_count, per_image_count));
    }
}

void FrameRing::init(VkDevice device) {
    for (uint32_t i = 0; i < kMaxFrames; i++) {
        VkSemaphoreCreateInfo sci{VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO};
        vk_check(vkCreateSemaphore(device, &sci, nullptr, &frames_[i].image_available),
                 "vkCreateSemaphore(image_available)");
        vk_check(vkCreateSemaphore(device, &sci, nullptr, &frames_[i].render_finished),
                 "vkCreateSemaphore(render_finished)");

        VkFenceCreateInfo fci{VK_STRUCTURE_TYPE_FENCE_CREATE_INFO};
        fci.flags = VK_FENCE_CREATE_SIGNALED_BIT;
        vk_check(vkCreateFence(device, &fci, nullptr, &frames_[i].in_flight), "vkCreateFence");
    }
}

void FrameRing::shutdown(VkDevice device) {
    for (auto &f : frames_) {
        if (f.in_flight) {
            vkDestroyFence(device, f.in_flight, nullptr);
        }
        if (f.render_finished) {
            vkDestroySemaphore(device, f.render_finished, nullptr);
        }
        if (f.image_available) {
            vkDestroySemaphore(device, f.image_available, nullptr);
        }
        f = FrameSync{};
    }
}

void SwapchainImages::create(VkContext &ctx, const Swapchain &sw, const MeshPipeline &pipe, const DrawData &draw) {
    const uint32_t n = sw.image_count();
    images_.assign(n, ImageResources{});

    std::vector<VkCommandBuffer> cbs(n);
    VkCommandBufferAllocateInfo cai{VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO};
    cai.commandPool = ctx.command_pool();
    cai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cai.commandBufferCount = n;
    vk_check(vkAllocateCommandBuffers(ctx.device(), &cai, cbs.data()), "vkAllocateCommandBuffers");
    for (uint32_t i = 0; i < n; i++) {
        images_[i].cmd = cbs[i];
    }

    for (auto &img : images_) {
        img.ubo = create_mapped_buffer(ctx.phys(), ctx.device(), sizeof(UniformData), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT);
    }

    std::array<VkDescriptorPoolSize, 2> ps{};
    ps[0].type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    ps[0].descriptorCount = n;
    ps[1].type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    ps[1].descriptorCount = n;

    VkDescriptorPoolCreateInfo dpci{VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO};
    dpci.maxSets = n;
    dpci.poolSizeCount = static_cast<uint32_t>(ps.size());
    dpci.pPoolSizes = ps.data();
    vk_check(vkCreateDescriptorPool(ctx.device(), &dpci, nullptr, &pool_), "vkCreateDescriptorPool");

    std::vector<VkDescriptorSetLayout> layouts(n, pipe.dsl());
    std::vector<VkDescriptorSet> sets(n);
    VkDescriptorSetAllocateInfo dsai{VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO};
    dsai.descriptorPool = pool_;
    dsai.descriptorSetCount = n;
    dsai.pSetLayouts = layouts.data();
    vk_check(vkAllocateDescriptorSets(ctx.device(), &dsai, sets.data()), "vkAllocateDescriptorSets");

    for (uint32_t i = 0; i < n; i++) {
        images_[i].ds = sets[i];

        VkDescriptorBufferInfo bi{};
        bi.buffer = images_[i].ubo.buffer;
        bi.offset = 0;
        bi.range = sizeof(UniformData);

        VkDescriptorImageInfo ii{};
        ii.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
        ii.imageView = draw.texture->view;
        ii.sampler = draw.texture->sampler;

        std::array<VkWriteDescriptorSet, 2> wds{};
        wds[0].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        wds[0].dstSet = sets[i];
        wds[0].dstBinding = 0;
        wds[0].descriptorCount = 1;
        wds[0].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        wds[0].pBufferInfo = &bi;

        wds[1].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        wds[1].dstSet = sets[i];
        wds[1].dstBinding = 1;
        wds[1].descriptorCount = 1;
        wds[1].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        wds[1].pImageInfo = &ii;

        vkUpdateDescriptorSets(ctx.device(), static_cast<uint32_t>(wds.size()), wds.data(), 0, nullptr);

        record(i, sw, pipe, draw);
    }
}

void SwapchainImages::record(uint32_t i, const Swapchain &sw, const MeshPipeline &pipe, const DrawData &draw) {
    VkCommandBuffer cmd = images_[i].cmd;

    VkCommandBufferBeginInfo cbi{VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO};
    vk_check(vkBeginCommandBuffer(cmd, &cbi), "vkBeginCommandBuffer");

    VkClearValue clear{};
    clear.color = draw.clear_color;

    VkRenderPassBeginInfo rpbi{VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO};
    rpbi.renderPass = sw.render_pass();
    rpbi.framebuffer = pipe.framebuffer(i);
    rpbi.renderArea.offset = {0, 0};
    rpbi.renderArea.extent = sw.extent();
    rpbi.clearValueCount = 1;
    rpbi.pClearValues = &clear;

    vkCmdBeginRenderPass(cmd, &rpbi, VK_SUBPASS_CONTENTS_INLINE);
    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipe.pipeline());

    VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(cmd, 0, 1, &draw.vertex_buffer, &offset);
    vkCmdBindIndexBuffer(cmd, draw.index_buffer, 0, VK_INDEX_TYPE_UINT16);
    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipe.layout(), 0, 1, &images_[i].ds, 0, nullptr);
    vkCmdDrawIndexed(cmd, draw.index_count, 1, 0, 0, 0);

    vkCmdEndRenderPass(cmd);
    vk_check(vkEndCommandBuffer(cmd), "vkEndCommandBuffer");
}

void SwapchainImages::destroy(VkDevice device, VkCommandPool pool) {
    std::vector<VkCommandBuffer> cbs;
    for (auto &img : images_) {
        if (img.cmd) {
            cbs.push_back(img.cmd);
        }
    }
    if (!cbs.empty()) {
        vkFreeCommandBuffers(device, pool, static_cast<uint32_t>(cbs.size()), cbs.data());
    }

    if (pool_) {
        vkDestroyDescriptorPool(device, pool_, nullptr);
        pool_ = VK_NULL_HANDLE;
    }
    for (auto &img : images_) {
        destroy_buffer(device, img.ubo);
    }
    images_.clear();
}
