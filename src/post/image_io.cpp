// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/post/image_io.h"

#include <cmath>
#include <cstdint>
#include <vector>

#include <fmt/format.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "kestrel/core/log.h"

namespace kestrel::post {

core::Result<FrameImage> LoadFrameImage(const std::filesystem::path& path) {
    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* data = stbi_load(path.string().c_str(), &width, &height, &channels, 4);
    if (data == nullptr) {
        return core::Result<FrameImage>::Err(
            fmt::format("Failed to load image {}: {}", path.string(), stbi_failure_reason()));
    }

    FrameImage image(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    auto& pixels = image.GetPixels();
    for (size_t i = 0; i < pixels.size(); ++i) {
        const stbi_uc* texel = data + i * 4;
        pixels[i] = glm::vec4(texel[0], texel[1], texel[2], texel[3]) / 255.0f;
    }
    stbi_image_free(data);

    KESTREL_LOG_DEBUG("Loaded {} ({}x{}, {} channels)", path.string(), width, height, channels);
    return image;
}

core::Result<void> SaveFrameImagePng(const FrameImage& image, const std::filesystem::path& path) {
    if (image.IsEmpty()) {
        return core::Result<void>::Err(fmt::format("Refusing to write empty image to {}", path.string()),
                                       core::ErrorKind::Invalid);
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(image.GetPixels().size() * 4);
    for (const auto& pixel : image.GetPixels()) {
        const glm::vec4 clamped = glm::clamp(pixel, 0.0f, 1.0f);
        for (int c = 0; c < 4; ++c) {
            bytes.push_back(static_cast<uint8_t>(std::lround(clamped[c] * 255.0f)));
        }
    }

    const int width = static_cast<int>(image.GetWidth());
    const int height = static_cast<int>(image.GetHeight());
    if (stbi_write_png(path.string().c_str(), width, height, 4, bytes.data(), width * 4) == 0) {
        return core::Result<void>::Err(fmt::format("Failed to write image {}", path.string()));
    }
    return core::Result<void>::Ok();
}

} // namespace kestrel::post
