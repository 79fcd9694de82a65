// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <array>

#include <openvr.h>

#include "kestrel/vr/vr_backend.h"

namespace kestrel::vr {

// Row-major 3x4 tracking matrix to a column-major glm matrix.
glm::mat4 ToMat4(const ::vr::HmdMatrix34_t& m);
glm::mat4 ToMat4(const ::vr::HmdMatrix44_t& m);

class OpenVrBackend : public VrBackend {
public:
    OpenVrBackend() = default;
    ~OpenVrBackend() override;

    OpenVrBackend(const OpenVrBackend&) = delete;
    OpenVrBackend& operator=(const OpenVrBackend&) = delete;

    VrBackendType GetType() const override { return VrBackendType::OpenVR; }
    const char* GetName() const override { return "OpenVR"; }

    bool Initialize() override;
    void Shutdown() override;
    bool IsInitialized() const override { return system != nullptr; }

    glm::uvec2 GetRecommendedRenderTargetSize() const override;
    void UpdatePoses() override;
    glm::mat4 GetHeadPose() const override { return headPose; }
    glm::mat4 GetEyeToHeadTransform(Eye eye) const override;
    glm::mat4 GetProjection(Eye eye, float zNear, float zFar) const override;

private:
    ::vr::IVRSystem* system = nullptr;
    ::vr::IVRCompositor* compositor = nullptr;
    std::array<::vr::TrackedDevicePose_t, ::vr::k_unMaxTrackedDeviceCount> poses{};
    glm::mat4 headPose = glm::mat4(1.0f);
};

} // namespace kestrel::vr
