/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>
#include <format>
#include <span>
#include <stdexcept>

#include <glm/gtc/matrix_transform.hpp>

#include "app/app.hpp"
#include "gfx/mesh.hpp"
#include "util/checks.hpp"
#include "util/log.hpp"

namespace {

constexpr uint32_t kTextureSize = 256;
constexpr uint32_t kTextureCell = 32;

} // namespace

App::App() : loop_(FrameRing::kMaxFrames) {}

void App::on_framebuffer_resize(int width, int height) {
    (void)width;
    (void)height;
    framebuffer_resized_ = true;
}

void App::on_mouse_move(double x, double y) {
    if (first_mouse_) {
        last_x_ = x;
        last_y_ = y;
        first_mouse_ = false;
    }

    const float dx = static_cast<float>(x - last_x_);
    const float dy = static_cast<float>(y - last_y_);

    last_x_ = x;
    last_y_ = y;

    if (window_ && glfwGetMouseButton(window_, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS) {
        camera_.orbit(dx, dy);
    }
}

void App::on_scroll(double dy) { camera_.zoom(static_cast<float>(dy) * 0.25f); }

bool App::framebuffer_size(uint32_t &w, uint32_t &h) const {
    int fb_w = 0, fb_h = 0;
    glfwGetFramebufferSize(window_, &fb_w, &fb_h);
    if (fb_w <= 0 || fb_h <= 0) {
        return false;
    }
    w = static_cast<uint32_t>(fb_w);
    h = static_cast<uint32_t>(fb_h);
    return true;
}

void App::create(GLFWwindow *window, const RenderConfig &cfg) {
    if (created_ || destroyed_) {
        throw std::logic_error("App::create called more than once");
    }
    window_ = window;
    cfg_ = cfg;
    created_ = true;

    ctx_.init(window_, cfg_);
    VkDevice dev = ctx_.device();

    shaders_ = load_shader_blobs(cfg_.shader_dir);
    pipe_.init(dev);

    vertex_buffer_ = create_filled_buffer(ctx_.phys(), dev, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
                                          std::span<const Vertex>(kQuadVertices));
    index_buffer_ = create_filled_buffer(ctx_.phys(), dev, VK_BUFFER_USAGE_INDEX_BUFFER_BIT,
                                         std::span<const uint16_t>(kQuadIndices));
    texture_ = upload_texture(ctx_.phys(), dev, ctx_.graphics_queue(), ctx_.command_pool(),
                              make_checkerboard(kTextureSize, kTextureSize, kTextureCell));

    frames_.init(dev);

    uint32_t w = cfg_.window_width, h = cfg_.window_height;
    if (!framebuffer_size(w, h)) {
        w = cfg_.window_width;
        h = cfg_.window_height;
    }
    create_swapchain_bundle(w, h);
    loop_.reset(sw_.image_count());

    t0_ = std::chrono::steady_clock::now();
}

void App::create_swapchain_bundle(uint32_t w, uint32_t h) {
    sw_.create(ctx_, cfg_, w, h);
    pipe_.create(ctx_.device(), sw_, shaders_);

    DrawData draw{};
    draw.vertex_buffer = vertex_buffer_.buffer;
    draw.index_buffer = index_buffer_.buffer;
    draw.index_count = static_cast<uint32_t>(kQuadIndices.size());
    draw.texture = &texture_;
    draw.clear_color = cfg_.clear_color;
    images_.create(ctx_, sw_, pipe_, draw);

    check_swapchain_bundle(sw_.image_count(), pipe_.framebuffer_count(), images_.count());
}

void App::destroy_swapchain_bundle() {
    VkDevice dev = ctx_.device();
    pipe_.destroy_framebuffers(dev);
    images_.destroy(dev, ctx_.command_pool());
    pipe_.destroy(dev);
    sw_.destroy(dev);
}

void App::destroy() {
    if (destroyed_) {
        throw std::logic_error("App::destroy called more than once");
    }
    destroyed_ = true;

    VkDevice dev = ctx_.device();
    if (dev) {
        if (VkResult r = vkDeviceWaitIdle(dev); r != VK_SUCCESS) {
            log_warn("vkDeviceWaitIdle during destroy returned {}", static_cast<int>(r));
        }
        destroy_swapchain_bundle();
        frames_.shutdown(dev);
        destroy_texture(dev, texture_);
        destroy_buffer(dev, index_buffer_);
        destroy_buffer(dev, vertex_buffer_);
        pipe_.shutdown(dev);
    }
    ctx_.shutdown();
    window_ = nullptr;
}

void App::render_frame() {
    if (!created_ || destroyed_) {
        throw std::logic_error("render_frame called outside create()/destroy()");
    }

    uint32_t w = 0, h = 0;
    if (!framebuffer_size(w, h)) {
        return; // minimized
    }
    if (recreate_pending_ && !loop_.recreate(*this)) {
        return;
    }

    loop_.render(*this, framebuffer_resized_, cfg_.recreate_on_suboptimal);
}

void App::wait_for_slot(uint32_t slot) {
    VkFence fence = frames_.slot(slot).in_flight;
    VkResult r = vkWaitForFences(ctx_.device(), 1, &fence, VK_TRUE, cfg_.fence_timeout_ns);
    if (r == VK_TIMEOUT) {
        throw GfxError(ErrorKind::DeviceLost,
                       std::format("Frame slot {} fence not signaled after {} ns", slot, cfg_.fence_timeout_ns), r);
    }
    vk_check(r, "vkWaitForFences");
}

AcquireResult App::acquire_image(uint32_t slot) {
    AcquireResult res{};
    VkResult r = vkAcquireNextImageKHR(ctx_.device(), sw_.handle(), UINT64_MAX, frames_.slot(slot).image_available,
                                       VK_NULL_HANDLE, &res.image_index);
    if (r == VK_ERROR_OUT_OF_DATE_KHR) {
        res.status = AcquireStatus::OutOfDate;
        return res;
    }
    if (r == VK_SUBOPTIMAL_KHR) {
        res.status = AcquireStatus::Suboptimal;
        return res;
    }
    vk_check(r, "vkAcquireNextImageKHR");
    return res;
}

void App::prepare_image(uint32_t slot, uint32_t image) {
    (void)slot;
    const float t = std::chrono::duration<float>(std::chrono::steady_clock::now() - t0_).count();
    const VkExtent2D ext = sw_.extent();
    const float aspect = static_cast<float>(ext.width) / static_cast<float>(ext.height);

    UniformData u{};
    u.model = glm::rotate(glm::mat4(1.0f), t * glm::radians(45.0f), glm::vec3(0.0f, 0.0f, 1.0f));
    u.view = camera_.view();
    u.proj = camera_.projection(aspect);

    std::memcpy(images_.image(image).ubo.mapped, &u, sizeof(u));
}

void App::submit(uint32_t slot, uint32_t image) {
    FrameSync &f = frames_.slot(slot);
    vk_check(vkResetFences(ctx_.device(), 1, &f.in_flight), "vkResetFences");

    VkCommandBuffer cmd = images_.image(image).cmd;
    VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

    VkSubmitInfo si{VK_STRUCTURE_TYPE_SUBMIT_INFO};
    si.waitSemaphoreCount = 1;
    si.pWaitSemaphores = &f.image_available;
    si.pWaitDstStageMask = &wait_stage;
    si.commandBufferCount = 1;
    si.pCommandBuffers = &cmd;
    si.signalSemaphoreCount = 1;
    si.pSignalSemaphores = &f.render_finished;

    vk_check(vkQueueSubmit(ctx_.graphics_queue(), 1, &si, f.in_flight), "vkQueueSubmit");
}

PresentStatus App::present(uint32_t slot, uint32_t image) {
    FrameSync &f = frames_.slot(slot);

    if (cfg_.wait_idle_before_present) {
        vk_check(vkQueueWaitIdle(ctx_.present_queue()), "vkQueueWaitIdle(present)");
    }

    VkPresentInfoKHR pi{VK_STRUCTURE_TYPE_PRESENT_INFO_KHR};
    pi.waitSemaphoreCount = 1;
    pi.pWaitSemaphores = &f.render_finished;

    VkSwapchainKHR sc_handle = sw_.handle();
    pi.swapchainCount = 1;
    pi.pSwapchains = &sc_handle;
    pi.pImageIndices = &image;

    VkResult r = vkQueuePresentKHR(ctx_.present_queue(), &pi);
    if (r == VK_ERROR_OUT_OF_DATE_KHR) {
        return PresentStatus::OutOfDate;
    }
    if (r == VK_SUBOPTIMAL_KHR) {
        return PresentStatus::Suboptimal;
    }
    vk_check(r, "vkQueuePresentKHR");
    return PresentStatus::Success;
}

std::optional<uint32_t> App::recreate_swapchain() {
    uint32_t w = 0, h = 0;
    if (!framebuffer_size(w, h)) {
        log_debug("window is minimized; deferring swapchain rebuild");
        recreate_pending_ = true;
        return std::nullopt;
    }

    vk_check(vkDeviceWaitIdle(ctx_.device()), "vkDeviceWaitIdle");
    destroy_swapchain_bundle();
    create_swapchain_bundle(w, h);

    framebuffer_resized_ = false;
    recreate_pending_ = false;
    return sw_.image_count();
}
