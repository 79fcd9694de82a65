// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

namespace kestrel::io {

class OutputCapsule;
class InputCapsule;

/**
 * An object whose state is persisted as a set of named fields.
 *
 * Fields equal to their declared default are omitted on write and restored
 * from that same default on read, so both sides must agree on the defaults.
 */
class Savable {
public:
    virtual ~Savable() = default;

    /// Stable name used to recreate the object through a SavableFactory.
    virtual std::string GetTypeName() const = 0;

    virtual void Write(OutputCapsule& capsule) const = 0;
    virtual void Read(const InputCapsule& capsule) = 0;
};

/**
 * Maps type names to constructors for nested savables.
 */
class SavableFactory {
public:
    using Creator = std::function<std::unique_ptr<Savable>()>;

    void Register(const std::string& typeName, Creator creator);

    template <typename T>
    void Register() {
        Register(T().GetTypeName(), [] { return std::make_unique<T>(); });
    }

    bool Contains(const std::string& typeName) const;

    /// Throws SerializationError for unknown type names.
    std::unique_ptr<Savable> Create(const std::string& typeName) const;

private:
    std::unordered_map<std::string, Creator> creators;
};

class OutputCapsule {
public:
    explicit OutputCapsule(nlohmann::json& node) : node(node) {}

    void Write(const std::string& name, float value, float defaultValue);
    void Write(const std::string& name, int value, int defaultValue);
    void Write(const std::string& name, bool value, bool defaultValue);
    void Write(const std::string& name, const std::string& value, const std::string& defaultValue);
    void Write(const std::string& name, const glm::vec2& value, const glm::vec2& defaultValue);
    void Write(const std::string& name, const glm::vec3& value, const glm::vec3& defaultValue);

    /// Writes a nested object tagged with its type name. A null savable writes nothing.
    void WriteSavable(const std::string& name, const Savable* savable);
    void WriteSavableList(const std::string& name, const std::vector<const Savable*>& savables);

private:
    nlohmann::json& node;
};

class InputCapsule {
public:
    InputCapsule(const nlohmann::json& node, const SavableFactory* factory)
        : node(node), factory(factory) {}

    bool Contains(const std::string& name) const;

    float ReadFloat(const std::string& name, float defaultValue) const;
    int ReadInt(const std::string& name, int defaultValue) const;
    bool ReadBool(const std::string& name, bool defaultValue) const;
    std::string ReadString(const std::string& name, const std::string& defaultValue) const;
    glm::vec2 ReadVec2(const std::string& name, const glm::vec2& defaultValue) const;
    glm::vec3 ReadVec3(const std::string& name, const glm::vec3& defaultValue) const;

    /// Returns nullptr when the field is absent.
    std::unique_ptr<Savable> ReadSavable(const std::string& name) const;
    std::vector<std::unique_ptr<Savable>> ReadSavableList(const std::string& name) const;

private:
    const nlohmann::json& node;
    const SavableFactory* factory;

    std::unique_ptr<Savable> ReadTagged(const std::string& name, const nlohmann::json& tagged) const;
};

} // namespace kestrel::io
