/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/swapchain.hpp"

#include <algorithm>
#include <vector>

#include "gfx/device_selection.hpp"
#include "gfx/render_config.hpp"
#include "gfx/vk_context.hpp"
#include "util/checks.hpp"
#include "util/log.hpp"

VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR> &fmts,
                                         VkFormat preferred,
                                         VkColorSpaceKHR preferred_space) {
    for (auto &f : fmts) {
        if (f.format == preferred && f.colorSpace == preferred_space) {
            return f;
        }
    }
    if (fmts.empty()) {
        throw GfxError(ErrorKind::Vulkan, "Surface reports no formats");
    }
    return fmts.front();
}

VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR> &modes) {
    for (auto m : modes) {
        if (m == VK_PRESENT_MODE_MAILBOX_KHR) {
            return m;
        }
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR &caps, uint32_t w, uint32_t h) {
    if (caps.currentExtent.width != UINT32_MAX) {
        return caps.currentExtent;
    }
    VkExtent2D e{};
    e.width = std::clamp(w, caps.minImageExtent.width, caps.maxImageExtent.width);
    e.height = std::clamp(h, caps.minImageExtent.height, caps.maxImageExtent.height);
    return e;
}

uint32_t choose_image_count(const VkSurfaceCapabilitiesKHR &caps) {
    uint32_t image_count = caps.minImageCount + 1;
    if (caps.maxImageCount > 0 && image_count > caps.maxImageCount) {
        image_count = caps.maxImageCount;
    }
    return image_count;
}

void Swapchain::create(VkContext &ctx, const RenderConfig &cfg, uint32_t w, uint32_t h) {
    const SwapchainSupport support = query_swapchain_support(ctx.phys(), ctx.surface());

    auto chosen_fmt = choose_surface_format(support.formats, cfg.preferred_format, cfg.preferred_color_space);
    present_mode_ = choose_present_mode(support.present_modes);
    extent_ = choose_extent(support.caps, w, h);
    format_ = chosen_fmt.format;

    VkSwapchainCreateInfoKHR ci{VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR};
    ci.surface = ctx.surface();
    ci.minImageCount = choose_image_count(support.caps);
    ci.imageFormat = chosen_fmt.format;
    ci.imageColorSpace = chosen_fmt.colorSpace;
    ci.imageExtent = extent_;
    ci.imageArrayLayers = 1;
    ci.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    ci.preTransform = support.caps.currentTransform;
    ci.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    ci.presentMode = present_mode_;
    ci.clipped = VK_TRUE;
    ci.oldSwapchain = VK_NULL_HANDLE;

    uint32_t qfs[] = {ctx.graphics_qf(), ctx.present_qf()};
    ci.imageSharingMode = swapchain_sharing_mode(ctx.queue_families());
    if (ci.imageSharingMode == VK_SHARING_MODE_CONCURRENT) {
        ci.queueFamilyIndexCount = 2;
        ci.pQueueFamilyIndices = qfs;
    }

    vk_check(vkCreateSwapchainKHR(ctx.device(), &ci, nullptr, &swapchain_), "vkCreateSwapchainKHR");

    uint32_t img_count = 0;
    vk_check(vkGetSwapchainImagesKHR(ctx.device(), swapchain_, &img_count, nullptr), "vkGetSwapchainImagesKHR(count)");
    images_.resize(img_count);
    vk_check(vkGetSwapchainImagesKHR(ctx.device(), swapchain_, &img_count, images_.data()),
             "vkGetSwapchainImagesKHR(list)");

    views_.assign(img_count, VK_NULL_HANDLE);
    for (uint32_t i = 0; i < img_count; i++) {
        VkImageViewCreateInfo vci{VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO};
        vci.image = images_[i];
        vci.viewType = VK_IMAGE_VIEW_TYPE_2D;
        vci.format = format_;
        vci.components = {VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY,
                          VK_COMPONENT_SWIZZLE_IDENTITY};
        vci.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        vci.subresourceRange.baseMipLevel = 0;
        vci.subresourceRange.levelCount = 1;
        vci.subresourceRange.baseArrayLayer = 0;
        vci.subresourceRange.layerCount = 1;
        vk_check(vkCreateImageView(ctx.device(), &vci, nullptr, &views_[i]), "vkCreateImageView");
    }

    create_render_pass(ctx.device());

    log_info("Swapchain {}x{}, {} images, format {}, present mode {}", extent_.width, extent_.height, img_count,
             static_cast<int>(format_), static_cast<int>(present_mode_));
}

void Swapchain::destroy(VkDevice device) {
    if (render_pass_ != VK_NULL_HANDLE) {
        vkDestroyRenderPass(device, render_pass_, nullptr);
        render_pass_ = VK_NULL_HANDLE;
    }

    for (auto v : views_) {
        if (v) {
            vkDestroyImageView(device, v, nullptr);
        }
    }
    views_.clear();
    images_.clear();
    if (swapchain_) {
        vkDestroySwapchainKHR(device, swapchain_, nullptr);
    }
    swapchain_ = VK_NULL_HANDLE;
}

void Swapchain::create_render_pass(VkDevice device) {
    VkAttachmentDescription color{};
    color.format = format_;
    color.samples = VK_SAMPLE_COUNT_1_BIT;
    color.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    color.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference color_ref{};
    color_ref.attachment = 0;
    color_ref.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount = 1;
    subpass.pColorAttachments = &color_ref;

    // Orders the UNDEFINED -> COLOR_ATTACHMENT transition after the acquire semaphore wait.
    VkSubpassDependency dep{};
    dep.srcSubpass = VK_SUBPASS_EXTERNAL;
    dep.dstSubpass = 0;
    dep.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dep.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dep.srcAccessMask = 0;
    dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo rpci{VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO};
    rpci.attachmentCount = 1;
    rpci.pAttachments = &color;
    rpci.subpassCount = 1;
    rpci.pSubpasses = &subpass;
    rpci.dependencyCount = 1;
    rpci.pDependencies = &dep;

    vk_check(vkCreateRenderPass(device, &rpci, nullptr, &render_pass_), "vkCreateRenderPass");
}
