// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/vr/vr_backend.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "kestrel/core/error.h"

#if defined(KESTREL_HAS_OPENVR)
#include "vr/openvr_backend.h"
#endif
#if defined(KESTREL_HAS_LIBOVR)
#include "vr/libovr_backend.h"
#endif

namespace kestrel::vr {

VrBackendType ParseVrBackendType(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "none" || lowered.empty()) return VrBackendType::None;
    if (lowered == "openvr") return VrBackendType::OpenVR;
    if (lowered == "libovr" || lowered == "oculus") return VrBackendType::LibOVR;
    throw ConfigError(fmt::format("unknown VR backend '{}'", value));
}

const char* ToString(VrBackendType type) {
    switch (type) {
        case VrBackendType::None: return "none";
        case VrBackendType::OpenVR: return "openvr";
        case VrBackendType::LibOVR: return "libovr";
    }
    return "none";
}

std::vector<VrBackendType> GetAvailableVrBackends() {
    std::vector<VrBackendType> types{VrBackendType::None};
#if defined(KESTREL_HAS_OPENVR)
    types.push_back(VrBackendType::OpenVR);
#endif
#if defined(KESTREL_HAS_LIBOVR)
    types.push_back(VrBackendType::LibOVR);
#endif
    return types;
}

bool IsVrBackendAvailable(VrBackendType type) {
    const auto types = GetAvailableVrBackends();
    return std::find(types.begin(), types.end(), type) != types.end();
}

std::unique_ptr<VrBackend> CreateVrBackend(VrBackendType type) {
    switch (type) {
        case VrBackendType::None:
            return nullptr;
        case VrBackendType::OpenVR:
#if defined(KESTREL_HAS_OPENVR)
            return std::make_unique<OpenVrBackend>();
#else
            break;
#endif
        case VrBackendType::LibOVR:
#if defined(KESTREL_HAS_LIBOVR)
            return std::make_unique<LibOvrBackend>();
#else
            break;
#endif
    }
    throw VrError(fmt::format("backend '{}' is not part of this build", ToString(type)));
}

} // namespace kestrel::vr
