// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace kestrel::anim {

struct Transform {
    glm::vec3 translation = glm::vec3(0.0f);
    glm::quat rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    glm::vec3 scale = glm::vec3(1.0f);

    static Transform Identity() { return Transform{}; }

    /// Lerp translation and scale, slerp rotation. t = 0 gives a, t = 1 gives b.
    static Transform Interpolate(const Transform& a, const Transform& b, float t);

    glm::mat4 ToMatrix() const;
};

} // namespace kestrel::anim
