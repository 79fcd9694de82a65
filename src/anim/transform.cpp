// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/anim/transform.h"

#include <glm/gtc/matrix_transform.hpp>

namespace kestrel::anim {

Transform Transform::Interpolate(const Transform& a, const Transform& b, float t) {
    Transform out;
    out.translation = glm::mix(a.translation, b.translation, t);
    out.rotation = glm::slerp(a.rotation, b.rotation, t);
    out.scale = glm::mix(a.scale, b.scale, t);
    return out;
}

glm::mat4 Transform::ToMatrix() const {
    glm::mat4 m = glm::translate(glm::mat4(1.0f), translation);
    m *= glm::mat4_cast(rotation);
    return glm::scale(m, scale);
}

} // namespace kestrel::anim
