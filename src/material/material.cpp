// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/material/material.h"

#include <fmt/format.h>

#include "kestrel/core/error.h"

namespace kestrel::material {

MaterialDef::MaterialDef(std::string path, std::vector<FloatParamDecl> params, PixelProgram program)
    : path(std::move(path)), params(std::move(params)), program(std::move(program)) {
    if (!this->program) {
        throw MaterialError(fmt::format("definition '{}' has no pixel program", this->path));
    }
}

std::optional<float> MaterialDef::FindDefault(const std::string& name) const {
    for (const auto& param : params) {
        if (param.name == name) {
            return param.defaultValue;
        }
    }
    return std::nullopt;
}

Material::Material(std::shared_ptr<const MaterialDef> def) : def(std::move(def)) {
    if (!this->def) {
        throw MaterialError("cannot create a material without a definition");
    }
}

void Material::SetFloat(const std::string& name, float value) {
    if (!def->FindDefault(name)) {
        throw MaterialError(fmt::format("'{}' does not declare parameter '{}'", def->GetPath(), name));
    }
    values[name] = value;
}

float Material::GetFloat(const std::string& name) const {
    if (auto it = values.find(name); it != values.end()) {
        return it->second;
    }
    if (auto fallback = def->FindDefault(name)) {
        return *fallback;
    }
    throw MaterialError(fmt::format("'{}' does not declare parameter '{}'", def->GetPath(), name));
}

bool Material::IsParamSet(const std::string& name) const {
    return values.find(name) != values.end();
}

glm::vec4 Material::Shade(const glm::vec4& color) const {
    return def->GetProgram()(*this, color);
}

} // namespace kestrel::material
