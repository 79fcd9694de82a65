// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace kestrel::post {

/**
 * Linear RGBA float image, row-major, origin at the top-left.
 */
class FrameImage {
public:
    FrameImage() = default;
    FrameImage(uint32_t width, uint32_t height, const glm::vec4& fill = glm::vec4(0.0f));

    uint32_t GetWidth() const { return width; }
    uint32_t GetHeight() const { return height; }
    bool IsEmpty() const { return pixels.empty(); }

    glm::vec4& At(uint32_t x, uint32_t y) { return pixels[static_cast<size_t>(y) * width + x]; }
    const glm::vec4& At(uint32_t x, uint32_t y) const { return pixels[static_cast<size_t>(y) * width + x]; }

    std::vector<glm::vec4>& GetPixels() { return pixels; }
    const std::vector<glm::vec4>& GetPixels() const { return pixels; }

    /// Horizontal ramp from black to white, used when no source frame is given.
    static FrameImage Gradient(uint32_t width, uint32_t height);

private:
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<glm::vec4> pixels;
};

} // namespace kestrel::post
