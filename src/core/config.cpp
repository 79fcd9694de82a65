// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/core/config.h"

#include <cctype>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace kestrel::config {
namespace {

template <glm::length_t N>
glm::vec<N, float> read_vec(const nlohmann::json& node, glm::vec<N, float> fallback) {
    if (!node.is_array() || node.size() != N) {
        std::cerr << "Expected an array of " << N << " numbers, keeping defaults\n";
        return fallback;
    }
    glm::vec<N, float> out;
    for (glm::length_t i = 0; i < N; ++i) {
        out[i] = node[i].get<float>();
    }
    return out;
}

int read_extent(const nlohmann::json& frame, const char* key, int fallback) {
    if (!frame.contains(key)) {
        return fallback;
    }
    const int value = frame[key].get<int>();
    if (value <= 0) {
        std::cerr << "frame." << key << " must be positive, got " << value << ", keeping " << fallback << "\n";
        return fallback;
    }
    return value;
}

} // namespace

spdlog::level::level_enum parse_log_level(const std::string& value) {
    const auto lowered = [&]() {
        std::string tmp = value;
        for (char& c : tmp) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return tmp;
    }();

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical" || lowered == "fatal") return spdlog::level::critical;
    return spdlog::level::info;
}

AppConfig load_from_file(const std::filesystem::path& path) {
    AppConfig config{};
    config.config_path = path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config; // defaults
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Failed to open config file: " << path << "\n";
            return config;
        }

        nlohmann::json json;
        file >> json;

        if (auto frame = json.find("frame"); frame != json.end()) {
            config.frame_width = read_extent(*frame, "width", config.frame_width);
            config.frame_height = read_extent(*frame, "height", config.frame_height);
        }

        if (auto logging = json.find("logging"); logging != json.end()) {
            if (logging->contains("level")) {
                config.log_level = parse_log_level((*logging)["level"].get<std::string>());
            }
        }

        if (auto post = json.find("post"); post != json.end()) {
            if (auto contrast = post->find("contrast"); contrast != post->end()) {
                auto& c = config.contrast;
                if (contrast->contains("enabled")) {
                    c.enabled = (*contrast)["enabled"].get<bool>();
                }
                if (contrast->contains("exponents")) {
                    c.exponents = read_vec<3>((*contrast)["exponents"], c.exponents);
                }
                if (contrast->contains("brightness")) {
                    c.brightness = read_vec<2>((*contrast)["brightness"], c.brightness);
                }
                if (contrast->contains("scales")) {
                    c.scales = read_vec<3>((*contrast)["scales"], c.scales);
                }
            }
        }

        if (auto vr = json.find("vr"); vr != json.end()) {
            if (vr->contains("backend")) {
                config.vr_backend = (*vr)["backend"].get<std::string>();
            }
        }
    } catch (const std::exception& err) {
        std::cerr << "Error parsing config file: " << path << " -> " << err.what() << "\n";
    }

    return config;
}

} // namespace kestrel::config
