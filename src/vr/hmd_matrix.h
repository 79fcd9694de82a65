// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <glm/glm.hpp>

namespace kestrel::vr {

// Runtime SDKs hand out row-major float matrices as `float m[rows][4]`.
// glm is column-major, so m[r][c] lands in column c, row r.

/// 3x4 pose (rotation plus translation in column 3); the bottom row becomes (0, 0, 0, 1).
template <typename RowMajor34>
glm::mat4 PoseToMat4(const RowMajor34& src) {
    glm::mat4 out(1.0f);
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 3; ++r) {
            out[c][r] = src.m[r][c];
        }
    }
    return out;
}

template <typename RowMajor44>
glm::mat4 MatrixToMat4(const RowMajor44& src) {
    glm::mat4 out(0.0f);
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            out[c][r] = src.m[r][c];
        }
    }
    return out;
}

} // namespace kestrel::vr
