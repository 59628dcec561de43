/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

#include "gfx/camera.hpp"

namespace {

constexpr float kMaxPitch = 1.5f; // just under pi/2
constexpr float kMinRadius = 0.5f;
constexpr float kMaxRadius = 8.0f;

} // namespace

glm::vec3 OrbitCamera::position() const {
    glm::vec3 pos;
    pos.x = radius * std::cos(pitch) * std::sin(yaw);
    pos.y = radius * std::sin(pitch);
    pos.z = radius * std::cos(pitch) * std::cos(yaw);
    return pos + target;
}

glm::mat4 OrbitCamera::view() const { return glm::lookAt(position(), target, glm::vec3(0.0f, 1.0f, 0.0f)); }

glm::mat4 OrbitCamera::projection(float aspect) const {
    glm::mat4 p = glm::perspectiveRH_ZO(fov_y, aspect, z_near, z_far);
    p[1][1] *= -1.0f;
    return p;
}

void OrbitCamera::orbit(float dx, float dy) {
    yaw -= dx * mouse_sensitivity;
    pitch = std::clamp(pitch + dy * mouse_sensitivity, -kMaxPitch, kMaxPitch);
}

void OrbitCamera::zoom(float delta) { radius = std::clamp(radius - delta, kMinRadius, kMaxRadius); }
