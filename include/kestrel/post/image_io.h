// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>

#include "kestrel/core/result.h"
#include "kestrel/post/frame_image.h"

namespace kestrel::post {

/// Loads any format stb_image understands as RGBA with channels normalized to [0, 1].
core::Result<FrameImage> LoadFrameImage(const std::filesystem::path& path);

/// Writes an 8-bit RGBA PNG, clamping channels to [0, 1].
core::Result<void> SaveFrameImagePng(const FrameImage& image, const std::filesystem::path& path);

} // namespace kestrel::post
