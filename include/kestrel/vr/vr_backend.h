// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace kestrel::vr {

enum class VrBackendType {
    None,
    OpenVR,
    LibOVR,
};

enum class Eye {
    Left,
    Right,
};

/// Accepts "none", "openvr", "libovr" (case-insensitive). Throws ConfigError otherwise.
VrBackendType ParseVrBackendType(const std::string& value);
const char* ToString(VrBackendType type);

/**
 * Native head-mounted display runtime.
 *
 * Poses are right-handed, meters, in the runtime's standing tracking space.
 */
class VrBackend {
public:
    virtual ~VrBackend() = default;

    virtual VrBackendType GetType() const = 0;
    virtual const char* GetName() const = 0;

    /// Returns false when no runtime or headset is present; the reason is logged.
    virtual bool Initialize() = 0;
    virtual void Shutdown() = 0;
    virtual bool IsInitialized() const = 0;

    /// Per-eye render target size suggested by the runtime.
    virtual glm::uvec2 GetRecommendedRenderTargetSize() const = 0;

    /// Blocks until the runtime hands out the poses for the next frame.
    virtual void UpdatePoses() = 0;

    /// Head-to-tracking-space matrix from the last UpdatePoses. Identity if the pose was invalid.
    virtual glm::mat4 GetHeadPose() const = 0;

    virtual glm::mat4 GetEyeToHeadTransform(Eye eye) const = 0;

    virtual glm::mat4 GetProjection(Eye eye, float zNear, float zFar) const = 0;
};

/// Backends compiled into this build, None always included.
std::vector<VrBackendType> GetAvailableVrBackends();

bool IsVrBackendAvailable(VrBackendType type);

/**
 * Creates an uninitialized backend.
 *
 * Returns nullptr for None. Throws VrError for a backend this build was
 * configured without.
 */
std::unique_ptr<VrBackend> CreateVrBackend(VrBackendType type);

} // namespace kestrel::vr
