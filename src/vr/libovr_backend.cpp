// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "vr/libovr_backend.h"

#include <Extras/OVR_CAPI_Util.h>
#include <glm/gtc/quaternion.hpp>

#include "kestrel/core/error.h"
#include "kestrel/core/log.h"

namespace kestrel::vr {

namespace {

ovrEyeType ToOvr(Eye eye) {
    return eye == Eye::Left ? ovrEye_Left : ovrEye_Right;
}

glm::mat4 ToMat4(const ovrPosef& pose) {
    const glm::quat rotation(pose.Orientation.w, pose.Orientation.x, pose.Orientation.y, pose.Orientation.z);
    glm::mat4 m = glm::mat4_cast(rotation);
    m[3] = glm::vec4(pose.Position.x, pose.Position.y, pose.Position.z, 1.0f);
    return m;
}

// LibOVR matrices are row-major.
glm::mat4 ToMat4(const ovrMatrix4f& m) {
    glm::mat4 out;
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            out[col][row] = m.M[row][col];
        }
    }
    return out;
}

void LogLastError(const char* what) {
    ovrErrorInfo info{};
    ovr_GetLastErrorInfo(&info);
    KESTREL_LOG_ERROR("{} failed: {}", what, info.ErrorString);
}

} // namespace

LibOvrBackend::~LibOvrBackend() {
    Shutdown();
}

bool LibOvrBackend::Initialize() {
    if (session != nullptr) {
        return true;
    }

    ovrInitParams params{};
    params.Flags = ovrInit_RequestVersion;
    params.RequestedMinorVersion = OVR_MINOR_VERSION;
    if (OVR_FAILURE(ovr_Initialize(&params))) {
        LogLastError("ovr_Initialize");
        return false;
    }

    ovrGraphicsLuid luid{};
    if (OVR_FAILURE(ovr_Create(&session, &luid))) {
        LogLastError("ovr_Create");
        session = nullptr;
        ovr_Shutdown();
        return false;
    }

    hmdDesc = ovr_GetHmdDesc(session);
    frameIndex = 0;
    KESTREL_LOG_INFO("LibOVR initialized: {}", hmdDesc.ProductName);
    return true;
}

void LibOvrBackend::Shutdown() {
    if (session == nullptr) {
        return;
    }
    ovr_Destroy(session);
    session = nullptr;
    ovr_Shutdown();
    headPose = glm::mat4(1.0f);
    KESTREL_LOG_INFO("LibOVR shut down");
}

glm::uvec2 LibOvrBackend::GetRecommendedRenderTargetSize() const {
    if (session == nullptr) {
        throw IllegalStateError("LibOVR backend is not initialized");
    }
    const ovrSizei size = ovr_GetFovTextureSize(session, ovrEye_Left, hmdDesc.DefaultEyeFov[ovrEye_Left], 1.0f);
    return glm::uvec2(static_cast<unsigned>(size.w), static_cast<unsigned>(size.h));
}

void LibOvrBackend::UpdatePoses() {
    if (session == nullptr) {
        throw IllegalStateError("LibOVR backend is not initialized");
    }

    const double displayTime = ovr_GetPredictedDisplayTime(session, frameIndex++);
    const ovrTrackingState state = ovr_GetTrackingState(session, displayTime, ovrTrue);
    const bool tracked = (state.StatusFlags & (ovrStatus_OrientationTracked | ovrStatus_PositionTracked)) != 0;
    headPose = tracked ? ToMat4(state.HeadPose.ThePose) : glm::mat4(1.0f);
}

glm::mat4 LibOvrBackend::GetEyeToHeadTransform(Eye eye) const {
    if (session == nullptr) {
        throw IllegalStateError("LibOVR backend is not initialized");
    }
    const ovrEyeRenderDesc desc = ovr_GetRenderDesc(session, ToOvr(eye), hmdDesc.DefaultEyeFov[ToOvr(eye)]);
    return ToMat4(desc.HmdToEyePose);
}

glm::mat4 LibOvrBackend::GetProjection(Eye eye, float zNear, float zFar) const {
    if (session == nullptr) {
        throw IllegalStateError("LibOVR backend is not initialized");
    }
    return ToMat4(ovrMatrix4f_Projection(hmdDesc.DefaultEyeFov[ToOvr(eye)], zNear, zFar, ovrProjection_None));
}

} // namespace kestrel::vr
