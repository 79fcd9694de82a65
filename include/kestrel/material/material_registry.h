// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "kestrel/material/material.h"

namespace kestrel::material {

/// Path of the built-in color contrast post material.
inline constexpr const char* kColorContrastMaterial = "materials/post/color_contrast";

/**
 * Owns material definitions by path and instantiates materials from them.
 */
class MaterialRegistry {
public:
    MaterialRegistry() = default;

    /// Registry with every built-in definition registered.
    static MaterialRegistry WithBuiltins();

    /// Replaces any definition already registered at the same path.
    void Register(std::shared_ptr<const MaterialDef> def);

    bool Contains(const std::string& path) const;

    /// Throws AssetError if nothing is registered at path.
    std::unique_ptr<Material> Load(const std::string& path) const;

private:
    std::unordered_map<std::string, std::shared_ptr<const MaterialDef>> defs;
};

/// Definition of the color contrast material: brightness remap, per-channel power, per-channel scale.
std::shared_ptr<const MaterialDef> MakeColorContrastDef();

} // namespace kestrel::material
