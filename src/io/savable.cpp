// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/io/savable.h"

#include <fmt/format.h>

#include "kestrel/core/error.h"

namespace kestrel::io {

namespace {

constexpr const char* kTypeKey = "type";
constexpr const char* kFieldsKey = "fields";

nlohmann::json Tag(const Savable& savable) {
    nlohmann::json tagged = nlohmann::json::object();
    tagged[kTypeKey] = savable.GetTypeName();
    tagged[kFieldsKey] = nlohmann::json::object();
    OutputCapsule capsule(tagged[kFieldsKey]);
    savable.Write(capsule);
    return tagged;
}

template <typename T, typename Check>
T ReadChecked(const nlohmann::json& node, const std::string& name, const T& defaultValue, Check isExpected, const char* expected) {
    auto it = node.find(name);
    if (it == node.end()) {
        return defaultValue;
    }
    if (!isExpected(*it)) {
        throw SerializationError(fmt::format("field '{}' is not a {}", name, expected));
    }
    return it->template get<T>();
}

template <glm::length_t N>
glm::vec<N, float> ReadVector(const nlohmann::json& node, const std::string& name, const glm::vec<N, float>& defaultValue) {
    auto it = node.find(name);
    if (it == node.end()) {
        return defaultValue;
    }
    if (!it->is_array() || it->size() != N) {
        throw SerializationError(fmt::format("field '{}' is not an array of {} numbers", name, N));
    }
    glm::vec<N, float> out;
    for (glm::length_t i = 0; i < N; ++i) {
        const auto& component = (*it)[i];
        if (!component.is_number()) {
            throw SerializationError(fmt::format("field '{}' has a non-numeric component", name));
        }
        out[i] = component.get<float>();
    }
    return out;
}

} // namespace

// SavableFactory

void SavableFactory::Register(const std::string& typeName, Creator creator) {
    creators[typeName] = std::move(creator);
}

bool SavableFactory::Contains(const std::string& typeName) const {
    return creators.find(typeName) != creators.end();
}

std::unique_ptr<Savable> SavableFactory::Create(const std::string& typeName) const {
    auto it = creators.find(typeName);
    if (it == creators.end()) {
        throw SerializationError(fmt::format("no savable registered for type '{}'", typeName));
    }
    return it->second();
}

// OutputCapsule

void OutputCapsule::Write(const std::string& name, float value, float defaultValue) {
    if (value == defaultValue) {
        return;
    }
    node[name] = value;
}

void OutputCapsule::Write(const std::string& name, int value, int defaultValue) {
    if (value == defaultValue) {
        return;
    }
    node[name] = value;
}

void OutputCapsule::Write(const std::string& name, bool value, bool defaultValue) {
    if (value == defaultValue) {
        return;
    }
    node[name] = value;
}

void OutputCapsule::Write(const std::string& name, const std::string& value, const std::string& defaultValue) {
    if (value == defaultValue) {
        return;
    }
    node[name] = value;
}

void OutputCapsule::Write(const std::string& name, const glm::vec2& value, const glm::vec2& defaultValue) {
    if (value == defaultValue) {
        return;
    }
    node[name] = {value.x, value.y};
}

void OutputCapsule::Write(const std::string& name, const glm::vec3& value, const glm::vec3& defaultValue) {
    if (value == defaultValue) {
        return;
    }
    node[name] = {value.x, value.y, value.z};
}

void OutputCapsule::WriteSavable(const std::string& name, const Savable* savable) {
    if (savable == nullptr) {
        return;
    }
    node[name] = Tag(*savable);
}

void OutputCapsule::WriteSavableList(const std::string& name, const std::vector<const Savable*>& savables) {
    nlohmann::json list = nlohmann::json::array();
    for (const Savable* savable : savables) {
        if (savable == nullptr) {
            throw SerializationError(fmt::format("null entry in savable list '{}'", name));
        }
        list.push_back(Tag(*savable));
    }
    node[name] = std::move(list);
}

// InputCapsule

bool InputCapsule::Contains(const std::string& name) const {
    return node.is_object() && node.contains(name);
}

float InputCapsule::ReadFloat(const std::string& name, float defaultValue) const {
    return ReadChecked<float>(node, name, defaultValue, [](const nlohmann::json& j) { return j.is_number(); }, "number");
}

int InputCapsule::ReadInt(const std::string& name, int defaultValue) const {
    return ReadChecked<int>(node, name, defaultValue, [](const nlohmann::json& j) { return j.is_number_integer(); }, "integer");
}

bool InputCapsule::ReadBool(const std::string& name, bool defaultValue) const {
    return ReadChecked<bool>(node, name, defaultValue, [](const nlohmann::json& j) { return j.is_boolean(); }, "boolean");
}

std::string InputCapsule::ReadString(const std::string& name, const std::string& defaultValue) const {
    return ReadChecked<std::string>(node, name, defaultValue, [](const nlohmann::json& j) { return j.is_string(); }, "string");
}

glm::vec2 InputCapsule::ReadVec2(const std::string& name, const glm::vec2& defaultValue) const {
    return ReadVector<2>(node, name, defaultValue);
}

glm::vec3 InputCapsule::ReadVec3(const std::string& name, const glm::vec3& defaultValue) const {
    return ReadVector<3>(node, name, defaultValue);
}

std::unique_ptr<Savable> InputCapsule::ReadSavable(const std::string& name) const {
    auto it = node.find(name);
    if (it == node.end()) {
        return nullptr;
    }
    return ReadTagged(name, *it);
}

std::vector<std::unique_ptr<Savable>> InputCapsule::ReadSavableList(const std::string& name) const {
    std::vector<std::unique_ptr<Savable>> out;
    auto it = node.find(name);
    if (it == node.end()) {
        return out;
    }
    if (!it->is_array()) {
        throw SerializationError(fmt::format("field '{}' is not a list", name));
    }
    out.reserve(it->size());
    for (const auto& tagged : *it) {
        out.push_back(ReadTagged(name, tagged));
    }
    return out;
}

std::unique_ptr<Savable> InputCapsule::ReadTagged(const std::string& name, const nlohmann::json& tagged) const {
    if (factory == nullptr) {
        throw SerializationError(fmt::format("cannot read nested savable '{}' without a factory", name));
    }
    if (!tagged.is_object() || !tagged.contains(kTypeKey) || !tagged[kTypeKey].is_string()) {
        throw SerializationError(fmt::format("nested savable '{}' has no type tag", name));
    }

    auto savable = factory->Create(tagged[kTypeKey].get<std::string>());
    static const nlohmann::json empty = nlohmann::json::object();
    auto fields = tagged.find(kFieldsKey);
    InputCapsule capsule(fields != tagged.end() ? *fields : empty, factory);
    savable->Read(capsule);
    return savable;
}

} // namespace kestrel::io
