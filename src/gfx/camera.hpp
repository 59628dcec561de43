/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <glm/glm.hpp>

// Camera orbiting `target` at `radius`. yaw = 0, pitch = 0 looks down -Z from +Z.
class OrbitCamera {
public:
    float yaw = 0.0f;   // radians, around +Y
    float pitch = 0.6f; // radians, clamped to avoid the poles
    float radius = 2.5f;
    glm::vec3 target{0.0f, 0.0f, 0.0f};

    float fov_y = glm::radians(45.0f);
    float z_near = 0.1f;
    float z_far = 10.0f;

    // Radians per pixel
    float mouse_sensitivity = 0.005f;

    glm::vec3 position() const;
    glm::mat4 view() const;
    // Vulkan clip space: Y points down, depth in [0, 1].
    glm::mat4 projection(float aspect) const;

    void orbit(float dx, float dy);
    void zoom(float delta);
};
