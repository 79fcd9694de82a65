// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <glm/glm.hpp>
#include <spdlog/common.h>

namespace kestrel::config {

struct ContrastConfig {
    bool enabled = true;
    glm::vec3 exponents = glm::vec3(2.2f);
    glm::vec2 brightness = glm::vec2(0.0f, 1.0f); // x = min, y = max
    glm::vec3 scales = glm::vec3(1.0f);
};

struct AppConfig {
    int frame_width = 1280;
    int frame_height = 720;
    spdlog::level::level_enum log_level = spdlog::level::info;
    ContrastConfig contrast;
    std::string vr_backend = "none";
    std::filesystem::path config_path;
};

spdlog::level::level_enum parse_log_level(const std::string& value);

AppConfig load_from_file(const std::filesystem::path& path);

} // namespace kestrel::config
