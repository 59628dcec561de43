/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <vector>

class VkContext;
struct RenderConfig;

VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR> &fmts,
                                         VkFormat preferred,
                                         VkColorSpaceKHR preferred_space);
VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR> &modes);
// currentExtent.width == UINT32_MAX means the surface lets us pick; clamp the window size then.
VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR &caps, uint32_t w, uint32_t h);
// minImageCount + 1, clamped to maxImageCount unless that is 0 (unbounded).
uint32_t choose_image_count(const VkSurfaceCapabilitiesKHR &caps);

// Chain, its images and views, and the render pass whose attachment format follows the chain.
class Swapchain {
public:
    void create(VkContext &ctx, const RenderConfig &cfg, uint32_t w, uint32_t h);
    void destroy(VkDevice device);

    VkSwapchainKHR handle() const { return swapchain_; }
    VkFormat format() const { return format_; }
    VkExtent2D extent() const { return extent_; }

    uint32_t image_count() const { return static_cast<uint32_t>(images_.size()); }
    VkRenderPass render_pass() const { return render_pass_; }

    const std::vector<VkImageView> &image_views() const { return views_; }

private:
    void create_render_pass(VkDevice device);

    VkSwapchainKHR swapchain_{};

    VkFormat format_{};
    VkExtent2D extent_{};
    VkPresentModeKHR present_mode_{VK_PRESENT_MODE_FIFO_KHR};
    std::vector<VkImage> images_; // owned by the chain
    std::vector<VkImageView> views_;

    VkRenderPass render_pass_{VK_NULL_HANDLE};
};
