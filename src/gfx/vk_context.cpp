/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>
#include <vector>

#include "gfx/device_selection.hpp"
#include "gfx/render_config.hpp"
#include "gfx/vk_context.hpp"
#include "util/checks.hpp"
#include "util/log.hpp"

namespace {

constexpr const char *kValidationLayer = "VK_LAYER_KHRONOS_validation";

VKAPI_ATTR VkBool32 VKAPI_CALL dbg_cb(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                                      VkDebugUtilsMessageTypeFlagsEXT,
                                      const VkDebugUtilsMessengerCallbackDataEXT *cb,
                                      void *) {
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        log_error("Vulkan: {}", cb->pMessage);
    } else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        log_warn("Vulkan: {}", cb->pMessage);
    } else {
        log_debug("Vulkan: {}", cb->pMessage);
    }
    return VK_FALSE;
}

VkDebugUtilsMessengerCreateInfoEXT debug_create_info() {
    VkDebugUtilsMessengerCreateInfoEXT ci{VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT};
    ci.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    ci.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                     VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    ci.pfnUserCallback = dbg_cb;
    return ci;
}

bool validation_layer_available() {
    uint32_t count = 0;
    vk_check(vkEnumerateInstanceLayerProperties(&count, nullptr), "vkEnumerateInstanceLayerProperties(count)");
    std::vector<VkLayerProperties> layers(count);
    vk_check(vkEnumerateInstanceLayerProperties(&count, layers.data()), "vkEnumerateInstanceLayerProperties(list)");
    for (const auto &l : layers) {
        if (std::strcmp(l.layerName, kValidationLayer) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

void VkContext::create_instance(const RenderConfig &cfg) {
    VkApplicationInfo app{VK_STRUCTURE_TYPE_APPLICATION_INFO};
    app.pApplicationName = cfg.app_name.c_str();
    app.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app.pEngineName = "vk-quad";
    app.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    app.apiVersion = VK_API_VERSION_1_0;

    uint32_t glfw_ext_count = 0;
    const char **glfw_exts = glfwGetRequiredInstanceExtensions(&glfw_ext_count);
    if (!glfw_exts) {
        throw GfxError(ErrorKind::Vulkan, "glfwGetRequiredInstanceExtensions: Vulkan not supported by window system");
    }

    std::vector<const char *> exts(glfw_exts, glfw_exts + glfw_ext_count);

    validation_ = cfg.enable_validation;
    if (validation_ && !validation_layer_available()) {
        log_warn("{} requested but not installed; continuing without validation", kValidationLayer);
        validation_ = false;
    }

    std::vector<const char *> layers;
    if (validation_) {
        layers.push_back(kValidationLayer);
        exts.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    VkInstanceCreateInfo ici{VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO};
    ici.pApplicationInfo = &app;
    ici.enabledExtensionCount = static_cast<uint32_t>(exts.size());
    ici.ppEnabledExtensionNames = exts.data();
    ici.enabledLayerCount = static_cast<uint32_t>(layers.size());
    ici.ppEnabledLayerNames = layers.empty() ? nullptr : layers.data();

    // Chained so instance creation/destruction itself is covered by the callback.
    VkDebugUtilsMessengerCreateInfoEXT dci = debug_create_info();
    if (validation_) {
        ici.pNext = &dci;
    }

    vk_check(vkCreateInstance(&ici, nullptr, &instance_), "vkCreateInstance");

    if (validation_) {
        auto create_fn = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT"));
        if (create_fn) {
            vk_check(create_fn(instance_, &dci, nullptr, &messenger_), "vkCreateDebugUtilsMessengerEXT");
        }
    }
}

void VkContext::pick_physical_device(const RenderConfig &cfg) {
    uint32_t dev_count = 0;
    vk_check(vkEnumeratePhysicalDevices(instance_, &dev_count, nullptr), "vkEnumeratePhysicalDevices(count)");
    if (dev_count == 0) {
        throw GfxError(ErrorKind::NoSuitableDevice, "No Vulkan physical devices found");
    }

    std::vector<VkPhysicalDevice> devs(dev_count);
    vk_check(vkEnumeratePhysicalDevices(instance_, &dev_count, devs.data()), "vkEnumeratePhysicalDevices(list)");

    std::vector<DeviceCandidate> candidates;
    candidates.reserve(dev_count);
    for (auto d : devs) {
        candidates.push_back(query_candidate(d, surface_));
    }

    const auto &chosen = candidates[select_device(candidates, cfg.device_extensions)];
    phys_ = chosen.handle;
    qf_ = chosen.families;
    if (!qf_.complete()) {
        throw GfxError(ErrorKind::NoSuitableQueueFamily, "Selected device '" + chosen.name + "' lacks a queue family");
    }
    vkGetPhysicalDeviceProperties(phys_, &props_);
}

void VkContext::create_device(const RenderConfig &cfg) {
    float prio = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> qcis;

    auto make_qci = [&](uint32_t family) {
        VkDeviceQueueCreateInfo qci{VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO};
        qci.queueFamilyIndex = family;
        qci.queueCount = 1;
        qci.pQueuePriorities = &prio;
        return qci;
    };

    qcis.push_back(make_qci(qf_.graphics));
    if (!qf_.shared()) {
        qcis.push_back(make_qci(qf_.present));
    }

    VkPhysicalDeviceFeatures feats{};

    std::vector<const char *> layers;
    if (validation_) {
        layers.push_back(kValidationLayer);
    }

    VkDeviceCreateInfo dci{VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO};
    dci.queueCreateInfoCount = static_cast<uint32_t>(qcis.size());
    dci.pQueueCreateInfos = qcis.data();
    dci.enabledExtensionCount = static_cast<uint32_t>(cfg.device_extensions.size());
    dci.ppEnabledExtensionNames = cfg.device_extensions.data();
    dci.enabledLayerCount = static_cast<uint32_t>(layers.size());
    dci.ppEnabledLayerNames = layers.empty() ? nullptr : layers.data();
    dci.pEnabledFeatures = &feats;

    vk_check(vkCreateDevice(phys_, &dci, nullptr, &device_), "vkCreateDevice");

    vkGetDeviceQueue(device_, qf_.graphics, 0, &graphics_queue_);
    vkGetDeviceQueue(device_, qf_.present, 0, &present_queue_);

    // Per-image command buffers are freed and re-allocated on swapchain rebuild.
    VkCommandPoolCreateInfo cpci{VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO};
    cpci.queueFamilyIndex = qf_.graphics;
    cpci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    vk_check(vkCreateCommandPool(device_, &cpci, nullptr, &cmd_pool_), "vkCreateCommandPool");
}

void VkContext::init(GLFWwindow *window, const RenderConfig &cfg) {
    create_instance(cfg);

    vk_check(glfwCreateWindowSurface(instance_, window, nullptr, &surface_), "glfwCreateWindowSurface");

    pick_physical_device(cfg);
    create_device(cfg);

    log_info("Logical device ready on '{}' (Vulkan {}.{}.{})", props_.deviceName, VK_VERSION_MAJOR(props_.apiVersion),
             VK_VERSION_MINOR(props_.apiVersion), VK_VERSION_PATCH(props_.apiVersion));
}

void VkContext::shutdown() {
    if (device_) {
        if (VkResult r = vkDeviceWaitIdle(device_); r != VK_SUCCESS) {
            log_warn("vkDeviceWaitIdle during shutdown returned {}", static_cast<int>(r));
        }
        if (cmd_pool_) {
            vkDestroyCommandPool(device_, cmd_pool_, nullptr);
        }
        vkDestroyDevice(device_, nullptr);
    }
    if (instance_ && messenger_) {
        auto destroy_fn = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (destroy_fn) {
            destroy_fn(instance_, messenger_, nullptr);
        }
    }
    if (surface_) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
    }
    if (instance_) {
        vkDestroyInstance(instance_, nullptr);
    }

    cmd_pool_ = VK_NULL_HANDLE;
    device_ = VK_NULL_HANDLE;
    messenger_ = VK_NULL_HANDLE;
    surface_ = VK_NULL_HANDLE;
    instance_ = VK_NULL_HANDLE;
    phys_ = VK_NULL_HANDLE;
}
