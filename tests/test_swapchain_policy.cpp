/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <vector>

#include "gfx/swapchain.hpp"
#include "util/checks.hpp"

namespace {

VkSurfaceCapabilitiesKHR caps_with(uint32_t min_images, uint32_t max_images) {
    VkSurfaceCapabilitiesKHR c{};
    c.minImageCount = min_images;
    c.maxImageCount = max_images;
    c.currentExtent = {800, 600};
    c.minImageExtent = {1, 1};
    c.maxImageExtent = {4096, 4096};
    return c;
}

} // namespace

//=============================================================================
// Extent
//=============================================================================

TEST(ChooseExtentTest, UsesCurrentExtentWhenFixed) {
    auto c = caps_with(2, 3);
    VkExtent2D e = choose_extent(c, 1920, 1080);
    EXPECT_EQ(e.width, 800u);
    EXPECT_EQ(e.height, 600u);
}

TEST(ChooseExtentTest, ClampsWindowSizeWhenSurfaceDefers) {
    auto c = caps_with(2, 3);
    c.currentExtent = {UINT32_MAX, UINT32_MAX};

    VkExtent2D big = choose_extent(c, 5000, 5000);
    EXPECT_EQ(big.width, 4096u);
    EXPECT_EQ(big.height, 4096u);

    c.minImageExtent = {64, 64};
    VkExtent2D small = choose_extent(c, 10, 100);
    EXPECT_EQ(small.width, 64u);
    EXPECT_EQ(small.height, 100u);

    VkExtent2D fits = choose_extent(c, 1280, 720);
    EXPECT_EQ(fits.width, 1280u);
    EXPECT_EQ(fits.height, 720u);
}

//=============================================================================
// Image count
//=============================================================================

TEST(ChooseImageCountTest, OneMoreThanMinimum) { EXPECT_EQ(choose_image_count(caps_with(2, 3)), 3u); }

TEST(ChooseImageCountTest, ClampedToMaximum) { EXPECT_EQ(choose_image_count(caps_with(3, 3)), 3u); }

TEST(ChooseImageCountTest, ZeroMaximumIsUnbounded) { EXPECT_EQ(choose_image_count(caps_with(2, 0)), 3u); }

//=============================================================================
// Format / present mode
//=============================================================================

TEST(ChooseSurfaceFormatTest, PrefersRequestedPair) {
    std::vector<VkSurfaceFormatKHR> fmts = {
        {VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
        {VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
    };
    auto f = choose_surface_format(fmts, VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR);
    EXPECT_EQ(f.format, VK_FORMAT_B8G8R8A8_SRGB);
}

TEST(ChooseSurfaceFormatTest, FallsBackToFirst) {
    std::vector<VkSurfaceFormatKHR> fmts = {
        {VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
        {VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_EXTENDED_SRGB_LINEAR_EXT},
    };
    auto f = choose_surface_format(fmts, VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR);
    EXPECT_EQ(f.format, VK_FORMAT_R8G8B8A8_UNORM);
}

TEST(ChooseSurfaceFormatTest, EmptyListThrows) {
    EXPECT_THROW(choose_surface_format({}, VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR), GfxError);
}

TEST(ChoosePresentModeTest, MailboxWhenAvailable) {
    EXPECT_EQ(choose_present_mode({VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_MAILBOX_KHR}), VK_PRESENT_MODE_MAILBOX_KHR);
}

TEST(ChoosePresentModeTest, FifoOtherwise) {
    EXPECT_EQ(choose_present_mode({VK_PRESENT_MODE_IMMEDIATE_KHR}), VK_PRESENT_MODE_FIFO_KHR);
    EXPECT_EQ(choose_present_mode({}), VK_PRESENT_MODE_FIFO_KHR);
}
