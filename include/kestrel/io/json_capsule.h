// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <memory>

#include <nlohmann/json.hpp>

#include "kestrel/core/result.h"
#include "kestrel/io/savable.h"

namespace kestrel::io {

class JsonExporter {
public:
    /// Top-level document: {"type": ..., "fields": {...}}
    static nlohmann::json ToJson(const Savable& savable);

    static core::Result<void> SaveToFile(const Savable& savable, const std::filesystem::path& path);
};

class JsonImporter {
public:
    explicit JsonImporter(const SavableFactory& factory) : factory(factory) {}

    std::unique_ptr<Savable> FromJson(const nlohmann::json& document) const;

    /// Restores an existing object, ignoring the stored type tag.
    void ReadInto(Savable& savable, const nlohmann::json& document) const;

    core::Result<std::unique_ptr<Savable>> LoadFromFile(const std::filesystem::path& path) const;

private:
    const SavableFactory& factory;
};

} // namespace kestrel::io
