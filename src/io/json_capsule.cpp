// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/io/json_capsule.h"

#include <fstream>

#include <fmt/format.h>

#include "kestrel/core/error.h"
#include "kestrel/core/log.h"

namespace kestrel::io {

nlohmann::json JsonExporter::ToJson(const Savable& savable) {
    nlohmann::json root = nlohmann::json::object();
    OutputCapsule(root).WriteSavable("root", &savable);
    return root["root"];
}

core::Result<void> JsonExporter::SaveToFile(const Savable& savable, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        return core::Result<void>::Err(fmt::format("Failed to open file for writing: {}", path.string()));
    }

    file << ToJson(savable).dump(4) << '\n';
    if (!file) {
        return core::Result<void>::Err(fmt::format("Failed to write file: {}", path.string()));
    }

    KESTREL_LOG_DEBUG("Saved {} to {}", savable.GetTypeName(), path.string());
    return core::Result<void>::Ok();
}

std::unique_ptr<Savable> JsonImporter::FromJson(const nlohmann::json& document) const {
    nlohmann::json root = nlohmann::json::object();
    root["root"] = document;
    return InputCapsule(root, &factory).ReadSavable("root");
}

void JsonImporter::ReadInto(Savable& savable, const nlohmann::json& document) const {
    static const nlohmann::json empty = nlohmann::json::object();
    const nlohmann::json* fields = &empty;
    if (document.is_object()) {
        if (auto it = document.find("fields"); it != document.end()) {
            fields = &*it;
        }
    }
    savable.Read(InputCapsule(*fields, &factory));
}

core::Result<std::unique_ptr<Savable>> JsonImporter::LoadFromFile(const std::filesystem::path& path) const {
    using R = core::Result<std::unique_ptr<Savable>>;

    std::ifstream file(path);
    if (!file) {
        return R::Err(fmt::format("Failed to open file: {}", path.string()));
    }

    try {
        nlohmann::json document;
        file >> document;
        return R::Ok(FromJson(document));
    } catch (const nlohmann::json::exception& e) {
        return R::Err(fmt::format("Malformed JSON in {}: {}", path.string(), e.what()), core::ErrorKind::Parse);
    } catch (const SerializationError& e) {
        return R::Err(fmt::format("Failed to read {}: {}", path.string(), e.what()), core::ErrorKind::Parse);
    }
}

} // namespace kestrel::io
