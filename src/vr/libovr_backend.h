// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <OVR_CAPI.h>

#include "kestrel/vr/vr_backend.h"

namespace kestrel::vr {

class LibOvrBackend : public VrBackend {
public:
    LibOvrBackend() = default;
    ~LibOvrBackend() override;

    LibOvrBackend(const LibOvrBackend&) = delete;
    LibOvrBackend& operator=(const LibOvrBackend&) = delete;

    VrBackendType GetType() const override { return VrBackendType::LibOVR; }
    const char* GetName() const override { return "LibOVR"; }

    bool Initialize() override;
    void Shutdown() override;
    bool IsInitialized() const override { return session != nullptr; }

    glm::uvec2 GetRecommendedRenderTargetSize() const override;
    void UpdatePoses() override;
    glm::mat4 GetHeadPose() const override { return headPose; }
    glm::mat4 GetEyeToHeadTransform(Eye eye) const override;
    glm::mat4 GetProjection(Eye eye, float zNear, float zFar) const override;

private:
    ovrSession session = nullptr;
    ovrHmdDesc hmdDesc{};
    long long frameIndex = 0;
    glm::mat4 headPose = glm::mat4(1.0f);
};

} // namespace kestrel::vr
