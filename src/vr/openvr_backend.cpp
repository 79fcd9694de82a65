// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "vr/openvr_backend.h"

#include "vr/hmd_matrix.h"

#include "kestrel/core/error.h"
#include "kestrel/core/log.h"

namespace kestrel::vr {

namespace {

::vr::EVREye ToOpenVr(Eye eye) {
    return eye == Eye::Left ? ::vr::Eye_Left : ::vr::Eye_Right;
}

} // namespace

glm::mat4 ToMat4(const ::vr::HmdMatrix34_t& m) {
    return PoseToMat4(m);
}

glm::mat4 ToMat4(const ::vr::HmdMatrix44_t& m) {
    return MatrixToMat4(m);
}

OpenVrBackend::~OpenVrBackend() {
    Shutdown();
}

bool OpenVrBackend::Initialize() {
    if (system != nullptr) {
        return true;
    }

    ::vr::EVRInitError error = ::vr::VRInitError_None;
    ::vr::IVRSystem* sys = ::vr::VR_Init(&error, ::vr::VRApplication_Scene);
    if (error != ::vr::VRInitError_None || sys == nullptr) {
        KESTREL_LOG_ERROR("VR_Init failed: {}", ::vr::VR_GetVRInitErrorAsEnglishDescription(error));
        return false;
    }

    compositor = ::vr::VRCompositor();
    if (compositor == nullptr) {
        KESTREL_LOG_ERROR("OpenVR compositor initialization failed");
        ::vr::VR_Shutdown();
        return false;
    }

    system = sys;
    KESTREL_LOG_INFO("OpenVR initialized");
    return true;
}

void OpenVrBackend::Shutdown() {
    if (system == nullptr) {
        return;
    }
    ::vr::VR_Shutdown();
    system = nullptr;
    compositor = nullptr;
    headPose = glm::mat4(1.0f);
    KESTREL_LOG_INFO("OpenVR shut down");
}

glm::uvec2 OpenVrBackend::GetRecommendedRenderTargetSize() const {
    if (system == nullptr) {
        throw IllegalStateError("OpenVR backend is not initialized");
    }
    glm::uvec2 size(0);
    system->GetRecommendedRenderTargetSize(&size.x, &size.y);
    return size;
}

void OpenVrBackend::UpdatePoses() {
    if (compositor == nullptr) {
        throw IllegalStateError("OpenVR backend is not initialized");
    }

    const ::vr::EVRCompositorError result =
        compositor->WaitGetPoses(poses.data(), static_cast<uint32_t>(poses.size()), nullptr, 0);
    if (result != ::vr::VRCompositorError_None) {
        KESTREL_LOG_WARN("WaitGetPoses failed with error {}", static_cast<int>(result));
        return;
    }

    const auto& hmd = poses[::vr::k_unTrackedDeviceIndex_Hmd];
    headPose = hmd.bPoseIsValid ? ToMat4(hmd.mDeviceToAbsoluteTracking) : glm::mat4(1.0f);
}

glm::mat4 OpenVrBackend::GetEyeToHeadTransform(Eye eye) const {
    if (system == nullptr) {
        throw IllegalStateError("OpenVR backend is not initialized");
    }
    return ToMat4(system->GetEyeToHeadTransform(ToOpenVr(eye)));
}

glm::mat4 OpenVrBackend::GetProjection(Eye eye, float zNear, float zFar) const {
    if (system == nullptr) {
        throw IllegalStateError("OpenVR backend is not initialized");
    }
    return ToMat4(system->GetProjectionMatrix(ToOpenVr(eye), zNear, zFar));
}

} // namespace kestrel::vr
