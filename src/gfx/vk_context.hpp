/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vulkan/vulkan.h>

#include <GLFW/glfw3.h>

#include "gfx/vk_bootstrap.hpp"

struct RenderConfig;

// Instance, surface, chosen device and its queues. Created once, destroyed last.
class VkContext {
public:
    void init(GLFWwindow *window, const RenderConfig &cfg);
    void shutdown();

    VkPhysicalDevice phys() const { return phys_; }
    VkDevice device() const { return device_; }
    VkSurfaceKHR surface() const { return surface_; }

    VkQueue graphics_queue() const { return graphics_queue_; }
    VkQueue present_queue() const { return present_queue_; }
    uint32_t graphics_qf() const { return qf_.graphics; }
    uint32_t present_qf() const { return qf_.present; }
    const QueueFamilyIndices &queue_families() const { return qf_; }

    VkCommandPool command_pool() const { return cmd_pool_; }

private:
    void create_instance(const RenderConfig &cfg);
    void pick_physical_device(const RenderConfig &cfg);
    void create_device(const RenderConfig &cfg);

    VkInstance instance_{};
    VkDebugUtilsMessengerEXT messenger_{};
    VkPhysicalDevice phys_{};
    VkDevice device_{};
    VkSurfaceKHR surface_{};

    VkQueue graphics_queue_{};
    VkQueue present_queue_{};
    QueueFamilyIndices qf_{};

    VkCommandPool cmd_pool_{};

    VkPhysicalDeviceProperties props_{};

    bool validation_ = false;
};
