// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/post/frame_image.h"

namespace kestrel::post {

FrameImage::FrameImage(uint32_t width, uint32_t height, const glm::vec4& fill)
    : width(width), height(height), pixels(static_cast<size_t>(width) * height, fill) {}

FrameImage FrameImage::Gradient(uint32_t width, uint32_t height) {
    FrameImage image(width, height);
    const float denom = width > 1 ? static_cast<float>(width - 1) : 1.0f;
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            const float v = static_cast<float>(x) / denom;
            image.At(x, y) = glm::vec4(v, v, v, 1.0f);
        }
    }
    return image;
}

} // namespace kestrel::post
