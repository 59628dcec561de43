/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/device_selection.hpp"

#include <algorithm>

#include "util/checks.hpp"
#include "util/log.hpp"

SwapchainSupport query_swapchain_support(VkPhysicalDevice phys, VkSurfaceKHR surface) {
    SwapchainSupport s{};
    vk_check(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(phys, surface, &s.caps),
             "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");

    uint32_t fmt_count = 0;
    vk_check(vkGetPhysicalDeviceSurfaceFormatsKHR(phys, surface, &fmt_count, nullptr),
             "vkGetPhysicalDeviceSurfaceFormatsKHR(count)");
    s.formats.resize(fmt_count);
    vk_check(vkGetPhysicalDeviceSurfaceFormatsKHR(phys, surface, &fmt_count, s.formats.data()),
             "vkGetPhysicalDeviceSurfaceFormatsKHR(list)");
    s.formats.resize(fmt_count);

    uint32_t pm_count = 0;
    vk_check(vkGetPhysicalDeviceSurfacePresentModesKHR(phys, surface, &pm_count, nullptr),
             "vkGetPhysicalDeviceSurfacePresentModesKHR(count)");
    s.present_modes.resize(pm_count);
    vk_check(vkGetPhysicalDeviceSurfacePresentModesKHR(phys, surface, &pm_count, s.present_modes.data()),
             "vkGetPhysicalDeviceSurfacePresentModesKHR(list)");
    s.present_modes.resize(pm_count);
    return s;
}

QueueFamilyIndices find_queue_families(const DeviceCandidate &dev) {
    QueueFamilyIndices out{};
    for (uint32_t i = 0; i < dev.queue_families.size(); i++) {
        const bool graphics = (dev.queue_families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;
        const bool present = i < dev.present_support.size() && dev.present_support[i];

        if (graphics && present) {
            out.graphics = i;
            out.present = i;
            return out;
        }
        if (graphics && out.graphics == UINT32_MAX) {
            out.graphics = i;
        }
        if (present && out.present == UINT32_MAX) {
            out.present = i;
        }
    }
    return out;
}

bool evaluate_device(DeviceCandidate &dev, const std::vector<const char *> &required_extensions) {
    dev.state = DeviceState::Evaluated;
    dev.reject_reason.clear();
    dev.families = find_queue_families(dev);

    if (dev.families.graphics == UINT32_MAX) {
        dev.reject_reason = "no graphics queue family";
        return false;
    }
    if (dev.families.present == UINT32_MAX) {
        dev.reject_reason = "no queue family can present to the surface";
        return false;
    }
    for (const char *ext : required_extensions) {
        if (std::find(dev.extensions.begin(), dev.extensions.end(), ext) == dev.extensions.end()) {
            dev.reject_reason = std::string("missing device extension ") + ext;
            return false;
        }
    }
    if (dev.format_count == 0 || dev.present_mode_count == 0) {
        dev.reject_reason = "insufficient swapchain support";
        return false;
    }
    return true;
}

size_t select_device(std::vector<DeviceCandidate> &candidates, const std::vector<const char *> &required_extensions) {
    size_t chosen = candidates.size();
    for (size_t i = 0; i < candidates.size(); i++) {
        auto &c = candidates[i];
        if (chosen == candidates.size() && evaluate_device(c, required_extensions)) {
            c.state = DeviceState::Selected;
            chosen = i;
            log_info("Selected physical device '{}' (graphics qf={}, present qf={})", c.name, c.families.graphics,
                     c.families.present);
            continue;
        }
        if (c.state == DeviceState::Evaluated) {
            log_warn("Skipping physical device '{}': {}", c.name, c.reject_reason);
        } else {
            c.reject_reason = "not evaluated, '" + candidates[chosen].name + "' already selected";
            log_debug("Skipping physical device '{}': {}", c.name, c.reject_reason);
        }
        c.state = DeviceState::Rejected;
    }
    if (chosen == candidates.size()) {
        throw GfxError(ErrorKind::NoSuitableDevice, "No suitable Vulkan device found");
    }
    return chosen;
}

DeviceCandidate query_candidate(VkPhysicalDevice phys, VkSurfaceKHR surface) {
    DeviceCandidate c{};
    c.handle = phys;

    VkPhysicalDeviceProperties props{};
    vkGetPhysicalDeviceProperties(phys, &props);
    c.name = props.deviceName;

    uint32_t qf_count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(phys, &qf_count, nullptr);
    c.queue_families.resize(qf_count);
    vkGetPhysicalDeviceQueueFamilyProperties(phys, &qf_count, c.queue_families.data());

    c.present_support.resize(qf_count);
    for (uint32_t i = 0; i < qf_count; i++) {
        VkBool32 present = VK_FALSE;
        vk_check(vkGetPhysicalDeviceSurfaceSupportKHR(phys, i, surface, &present),
                 "vkGetPhysicalDeviceSurfaceSupportKHR");
        c.present_support[i] = present == VK_TRUE;
    }

    uint32_t ext_count = 0;
    vk_check(vkEnumerateDeviceExtensionProperties(phys, nullptr, &ext_count, nullptr),
             "vkEnumerateDeviceExtensionProperties(count)");
    std::vector<VkExtensionProperties> exts(ext_count);
    vk_check(vkEnumerateDeviceExtensionProperties(phys, nullptr, &ext_count, exts.data()),
             "vkEnumerateDeviceExtensionProperties(list)");
    for (uint32_t i = 0; i < ext_count; i++) {
        c.extensions.emplace_back(exts[i].extensionName);
    }

    uint32_t fmt_count = 0;
    vk_check(vkGetPhysicalDeviceSurfaceFormatsKHR(phys, surface, &fmt_count, nullptr),
             "vkGetPhysicalDeviceSurfaceFormatsKHR(count)");
    uint32_t pm_count = 0;
    vk_check(vkGetPhysicalDeviceSurfacePresentModesKHR(phys, surface, &pm_count, nullptr),
             "vkGetPhysicalDeviceSurfacePresentModesKHR(count)");
    c.format_count = fmt_count;
    c.present_mode_count = pm_count;
    return c;
}

VkSharingMode swapchain_sharing_mode(const QueueFamilyIndices &qf) {
    return qf.shared() ? VK_SHARING_MODE_EXCLUSIVE : VK_SHARING_MODE_CONCURRENT;
}
