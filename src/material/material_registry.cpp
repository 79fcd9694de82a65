// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/material/material_registry.h"

#include <cmath>

#include <fmt/format.h>

#include "kestrel/core/error.h"

namespace kestrel::material {

namespace {

// (c - min) / (max - min), clamped to [0, 1]. A collapsed range acts as a step at min.
float RemapBrightness(float c, float minBrightness, float maxBrightness) {
    const float range = maxBrightness - minBrightness;
    if (range == 0.0f) {
        return c > minBrightness ? 1.0f : 0.0f;
    }
    return glm::clamp((c - minBrightness) / range, 0.0f, 1.0f);
}

glm::vec4 ColorContrastProgram(const Material& m, const glm::vec4& color) {
    const float minBrightness = m.GetFloat("minBrightness");
    const float maxBrightness = m.GetFloat("maxBrightness");

    const glm::vec3 exponents(m.GetFloat("exp_r"), m.GetFloat("exp_g"), m.GetFloat("exp_b"));
    const glm::vec3 scales(m.GetFloat("scale_r"), m.GetFloat("scale_g"), m.GetFloat("scale_b"));

    glm::vec3 rgb;
    for (int i = 0; i < 3; ++i) {
        const float remapped = RemapBrightness(color[i], minBrightness, maxBrightness);
        rgb[i] = std::pow(remapped, exponents[i]) * scales[i];
    }
    return glm::vec4(rgb, color.a);
}

} // namespace

MaterialRegistry MaterialRegistry::WithBuiltins() {
    MaterialRegistry registry;
    registry.Register(MakeColorContrastDef());
    return registry;
}

void MaterialRegistry::Register(std::shared_ptr<const MaterialDef> def) {
    if (!def) {
        throw MaterialError("cannot register a null definition");
    }
    defs[def->GetPath()] = std::move(def);
}

bool MaterialRegistry::Contains(const std::string& path) const {
    return defs.find(path) != defs.end();
}

std::unique_ptr<Material> MaterialRegistry::Load(const std::string& path) const {
    auto it = defs.find(path);
    if (it == defs.end()) {
        throw AssetError(fmt::format("no material definition at '{}'", path));
    }
    return std::make_unique<Material>(it->second);
}

std::shared_ptr<const MaterialDef> MakeColorContrastDef() {
    return std::make_shared<MaterialDef>(
        kColorContrastMaterial,
        std::vector<FloatParamDecl>{
            {"exp_r", 2.2f},
            {"exp_g", 2.2f},
            {"exp_b", 2.2f},
            {"minBrightness", 0.0f},
            {"maxBrightness", 1.0f},
            {"scale_r", 1.0f},
            {"scale_g", 1.0f},
            {"scale_b", 1.0f},
        },
        ColorContrastProgram);
}

} // namespace kestrel::material
