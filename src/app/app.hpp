/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <GLFW/glfw3.h>
#include <chrono>
#include <cstdint>
#include <optional>

#include "gfx/camera.hpp"
#include "gfx/frame_loop.hpp"
#include "gfx/frame_resources.hpp"
#include "gfx/gpu_resources.hpp"
#include "gfx/mesh_pipeline.hpp"
#include "gfx/render_config.hpp"
#include "gfx/swapchain.hpp"
#include "gfx/vk_context.hpp"

// Owns every GPU object. create() once, render_frame() per loop iteration, destroy() once before
// the window goes away.
class App : private FrameDriver {
public:
    App();

    void create(GLFWwindow *window, const RenderConfig &cfg);
    void render_frame();
    void destroy();

    void on_framebuffer_resize(int width, int height);
    void on_mouse_move(double x, double y);
    void on_scroll(double dy);

private:
    void wait_for_slot(uint32_t slot) override;
    AcquireResult acquire_image(uint32_t slot) override;
    void prepare_image(uint32_t slot, uint32_t image) override;
    void submit(uint32_t slot, uint32_t image) override;
    PresentStatus present(uint32_t slot, uint32_t image) override;
    std::optional<uint32_t> recreate_swapchain() override;

    void create_swapchain_bundle(uint32_t w, uint32_t h);
    void destroy_swapchain_bundle();
    bool framebuffer_size(uint32_t &w, uint32_t &h) const;

    GLFWwindow *window_{};
    RenderConfig cfg_;
    bool created_ = false;
    bool destroyed_ = false;

    bool framebuffer_resized_ = false;
    bool recreate_pending_ = false;

    VkContext ctx_;
    Swapchain sw_;
    MeshPipeline pipe_;
    SwapchainImages images_;
    FrameRing frames_;
    FrameLoop loop_;

    ShaderBlobs shaders_;
    GpuBuffer vertex_buffer_;
    GpuBuffer index_buffer_;
    Texture texture_;

    OrbitCamera camera_;
    bool first_mouse_ = true;
    double last_x_ = 0.0, last_y_ = 0.0;

    std::chrono::steady_clock::time_point t0_;
};
