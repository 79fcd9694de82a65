// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace kestrel
{

/**
 * @brief Base exception class for kestrel errors
 */
class KestrelError : public std::runtime_error
{
public:
    explicit KestrelError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief An object was used before it reached the state the call requires
 */
class IllegalStateError : public KestrelError
{
public:
    explicit IllegalStateError(const std::string& message) : KestrelError("Illegal state: " + message) {}
};

/**
 * @brief Material parameter errors
 */
class MaterialError : public KestrelError
{
public:
    explicit MaterialError(const std::string& message) : KestrelError("Material error: " + message) {}
};

/**
 * @brief Asset lookup/loading errors
 */
class AssetError : public KestrelError
{
public:
    explicit AssetError(const std::string& message) : KestrelError("Asset error: " + message) {}
};

/**
 * @brief Capsule read/write errors
 */
class SerializationError : public KestrelError
{
public:
    explicit SerializationError(const std::string& message) : KestrelError("Serialization error: " + message) {}
};

/**
 * @brief Animation setup errors
 */
class AnimationError : public KestrelError
{
public:
    explicit AnimationError(const std::string& message) : KestrelError("Animation error: " + message) {}
};

/**
 * @brief VR runtime errors
 */
class VrError : public KestrelError
{
public:
    explicit VrError(const std::string& message) : KestrelError("VR error: " + message) {}
};

class ConfigError : public KestrelError
{
public:
    explicit ConfigError(const std::string& message) : KestrelError("Config error: " + message) {}
};

} // namespace kestrel
