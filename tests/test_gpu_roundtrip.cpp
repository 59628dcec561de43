/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <cstring>
#include <numeric>
#include <span>
#include <vector>

#include "gfx/frame_resources.hpp"
#include "gfx/gpu_resources.hpp"
#include "gfx/memory.hpp"
#include "util/checks.hpp"

namespace {

// Headless instance + first device with a graphics queue. No surface, no window.
class GpuTest : public ::testing::Test {
protected:
    void SetUp() override {
        VkApplicationInfo ai{VK_STRUCTURE_TYPE_APPLICATION_INFO};
        ai.pApplicationName = "vkquad_tests";
        ai.apiVersion = VK_API_VERSION_1_0;

        VkInstanceCreateInfo ici{VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO};
        ici.pApplicationInfo = &ai;
        if (vkCreateInstance(&ici, nullptr, &instance_) != VK_SUCCESS) {
            instance_ = VK_NULL_HANDLE;
            GTEST_SKIP() << "no Vulkan instance available";
        }

        uint32_t count = 0;
        vk_check(vkEnumeratePhysicalDevices(instance_, &count, nullptr), "vkEnumeratePhysicalDevices(count)");
        std::vector<VkPhysicalDevice> devs(count);
        vk_check(vkEnumeratePhysicalDevices(instance_, &count, devs.data()), "vkEnumeratePhysicalDevices(list)");

        for (auto d : devs) {
            uint32_t qf_count = 0;
            vkGetPhysicalDeviceQueueFamilyProperties(d, &qf_count, nullptr);
            std::vector<VkQueueFamilyProperties> qfs(qf_count);
            vkGetPhysicalDeviceQueueFamilyProperties(d, &qf_count, qfs.data());
            for (uint32_t i = 0; i < qf_count; i++) {
                if (qfs[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) {
                    phys_ = d;
                    family_ = i;
                    break;
                }
            }
            if (phys_) {
                break;
            }
        }
        if (!phys_) {
            GTEST_SKIP() << "no Vulkan device with a graphics queue";
        }

        float prio = 1.0f;
        VkDeviceQueueCreateInfo qci{VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO};
        qci.queueFamilyIndex = family_;
        qci.queueCount = 1;
        qci.pQueuePriorities = &prio;

        VkDeviceCreateInfo dci{VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO};
        dci.queueCreateInfoCount = 1;
        dci.pQueueCreateInfos = &qci;
        vk_check(vkCreateDevice(phys_, &dci, nullptr, &device_), "vkCreateDevice");
        vkGetDeviceQueue(device_, family_, 0, &queue_);

        VkCommandPoolCreateInfo pci{VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO};
        pci.queueFamilyIndex = family_;
        vk_check(vkCreateCommandPool(device_, &pci, nullptr, &pool_), "vkCreateCommandPool");
    }

    void TearDown() override {
        if (device_) {
            vk_check(vkDeviceWaitIdle(device_), "vkDeviceWaitIdle");
            if (pool_) {
                vkDestroyCommandPool(device_, pool_, nullptr);
            }
            vkDestroyDevice(device_, nullptr);
        }
        if (instance_) {
            vkDestroyInstance(instance_, nullptr);
        }
    }

    VkInstance instance_{};
    VkPhysicalDevice phys_{};
    uint32_t family_ = 0;
    VkDevice device_{};
    VkQueue queue_{};
    VkCommandPool pool_{};
};

} // namespace

TEST_F(GpuTest, MappedBufferRoundTrip) {
    std::vector<uint32_t> data(1024);
    std::iota(data.begin(), data.end(), 7u);
    const VkDeviceSize size = data.size() * sizeof(uint32_t);

    GpuBuffer buf = create_mapped_buffer(phys_, device_, size, VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT);
    ASSERT_NE(buf.mapped, nullptr);
    std::memcpy(buf.mapped, data.data(), size);

    std::vector<uint32_t> back(data.size());
    std::memcpy(back.data(), buf.mapped, size);
    EXPECT_EQ(back, data);

    destroy_buffer(device_, buf);
    EXPECT_EQ(buf.buffer, VK_NULL_HANDLE);
    EXPECT_EQ(buf.memory, VK_NULL_HANDLE);
}

TEST_F(GpuTest, FilledBufferSurvivesGpuCopy) {
    std::vector<uint16_t> data(300);
    std::iota(data.begin(), data.end(), uint16_t{1});
    const VkDeviceSize size = data.size() * sizeof(uint16_t);

    GpuBuffer src = create_filled_buffer(phys_, device_, VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                                         std::span<const uint16_t>(data));
    GpuBuffer dst = create_mapped_buffer(phys_, device_, size, VK_BUFFER_USAGE_TRANSFER_DST_BIT);

    VkCommandBuffer cmd = begin_one_shot(device_, pool_);
    VkBufferCopy region{0, 0, size};
    vkCmdCopyBuffer(cmd, src.buffer, dst.buffer, 1, &region);
    end_one_shot(device_, pool_, queue_, cmd);

    std::vector<uint16_t> back(data.size());
    std::memcpy(back.data(), dst.mapped, size);
    EXPECT_EQ(back, data);

    destroy_buffer(device_, dst);
    destroy_buffer(device_, src);
}

TEST_F(GpuTest, HostCoherentTypeExists) {
    VkBuffer probe{};
    VkBufferCreateInfo bci{VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO};
    bci.size = 256;
    bci.usage = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
    vk_check(vkCreateBuffer(device_, &bci, nullptr, &probe), "vkCreateBuffer");

    VkMemoryRequirements req{};
    vkGetBufferMemoryRequirements(device_, probe, &req);
    vkDestroyBuffer(device_, probe, nullptr);

    EXPECT_NO_THROW(find_memory_type(phys_, req.memoryTypeBits,
                                     VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT));
}

TEST_F(GpuTest, TextureUploadProducesSampleableImage) {
    Texture tex = upload_texture(phys_, device_, queue_, pool_, make_checkerboard(64, 64, 8));
    EXPECT_NE(tex.image.image, VK_NULL_HANDLE);
    EXPECT_NE(tex.view, VK_NULL_HANDLE);
    EXPECT_NE(tex.sampler, VK_NULL_HANDLE);
    EXPECT_EQ(tex.image.width, 64u);
    destroy_texture(device_, tex);
}

TEST_F(GpuTest, TextureUploadRejectsBadPixels) {
    DecodedImage img{};
    img.width = 2;
    img.height = 2;
    img.rgba.resize(3);
    EXPECT_THROW(upload_texture(phys_, device_, queue_, pool_, img), GfxError);
}

TEST_F(GpuTest, FrameRingFencesStartSignaled) {
    FrameRing ring;
    ring.init(device_);
    for (uint32_t i = 0; i < FrameRing::kMaxFrames; i++) {
        EXPECT_EQ(vkGetFenceStatus(device_, ring.slot(i).in_flight), VK_SUCCESS);
        EXPECT_NE(ring.slot(i).image_available, VK_NULL_HANDLE);
        EXPECT_NE(ring.slot(i).render_finished, VK_NULL_HANDLE);
    }
    ring.shutdown(device_);
    EXPECT_EQ(ring.slot(0).in_flight, VK_NULL_HANDLE);
}
