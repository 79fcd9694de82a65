// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace kestrel::material {

class Material;

/// Per-pixel program evaluated by a material: input color in, output color out.
using PixelProgram = std::function<glm::vec4(const Material&, const glm::vec4&)>;

struct FloatParamDecl {
    std::string name;
    float defaultValue = 0.0f;
};

/**
 * Declares the parameters a material accepts and the program that consumes them.
 */
class MaterialDef {
public:
    MaterialDef(std::string path, std::vector<FloatParamDecl> params, PixelProgram program);

    const std::string& GetPath() const { return path; }
    const std::vector<FloatParamDecl>& GetParams() const { return params; }
    const PixelProgram& GetProgram() const { return program; }

    std::optional<float> FindDefault(const std::string& name) const;

private:
    std::string path;
    std::vector<FloatParamDecl> params;
    PixelProgram program;
};

class Material {
public:
    explicit Material(std::shared_ptr<const MaterialDef> def);

    const MaterialDef& GetDef() const { return *def; }

    /// Throws MaterialError if the definition does not declare the parameter.
    void SetFloat(const std::string& name, float value);

    /// Value set on this material, or the declared default.
    float GetFloat(const std::string& name) const;

    bool IsParamSet(const std::string& name) const;

    glm::vec4 Shade(const glm::vec4& color) const;

private:
    std::shared_ptr<const MaterialDef> def;
    std::map<std::string, float> values;
};

} // namespace kestrel::material
