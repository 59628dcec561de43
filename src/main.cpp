/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <unistd.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/app.hpp"
#include "util/log.hpp"

namespace {

std::string shader_dir_from_exe() {
    std::vector<char> buf(4096);
    ssize_t n = readlink("/proc/self/exe", buf.data(), buf.size() - 1);
    if (n > 0) {
        buf[n] = '\0';
        std::filesystem::path exe_path(buf.data());
        return (exe_path.parent_path() / "shaders").string();
    }
    return (std::filesystem::current_path() / "shaders").string();
}

void framebuffer_resize_cb(GLFWwindow *w, int width, int height) {
    auto *app = reinterpret_cast<App *>(glfwGetWindowUserPointer(w));
    if (app) {
        app->on_framebuffer_resize(width, height);
    }
}

void cursor_pos_cb(GLFWwindow *w, double x, double y) {
    auto *app = reinterpret_cast<App *>(glfwGetWindowUserPointer(w));
    if (app) {
        app->on_mouse_move(x, y);
    }
}

void scroll_cb(GLFWwindow *w, double dx, double dy) {
    (void)dx;
    auto *app = reinterpret_cast<App *>(glfwGetWindowUserPointer(w));
    if (app) {
        app->on_scroll(dy);
    }
}

GLFWwindow *init_window(const RenderConfig &cfg, App &app) {
    if (!glfwInit()) {
        throw std::runtime_error("glfwInit failed");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

    GLFWwindow *window = glfwCreateWindow(static_cast<int>(cfg.window_width), static_cast<int>(cfg.window_height),
                                          cfg.app_name.c_str(), nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        throw std::runtime_error("glfwCreateWindow failed");
    }

    glfwSetWindowUserPointer(window, &app);
    glfwSetFramebufferSizeCallback(window, framebuffer_resize_cb);
    glfwSetCursorPosCallback(window, cursor_pos_cb);
    glfwSetScrollCallback(window, scroll_cb);
    return window;
}

} // namespace

int main() {
    RenderConfig cfg;
    cfg.shader_dir = shader_dir_from_exe();
    set_log_level(cfg.log_level);

    App app;
    GLFWwindow *window = nullptr;
    int rc = 0;

    try {
        window = init_window(cfg, app);
        app.create(window, cfg);

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();
            app.render_frame();
        }
    } catch (const std::exception &e) {
        log_error("Fatal: {}", e.what());
        rc = 1;
    }

    if (window) {
        try {
            app.destroy();
        } catch (const std::exception &e) {
            log_error("Fatal during shutdown: {}", e.what());
            rc = 1;
        }
        glfwDestroyWindow(window);
        glfwTerminate();
    }
    return rc;
}
