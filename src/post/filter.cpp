// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/post/filter.h"

#include "kestrel/core/log.h"

namespace kestrel::post {

void Filter::Init(const material::MaterialRegistry* registry, ViewportSize viewport) {
    if (registry == nullptr || viewport.width == 0 || viewport.height == 0) {
        KESTREL_LOG_DEBUG("Filter '{}' not initialized: no registry or empty viewport", name);
        return;
    }

    if (initialized) {
        Cleanup();
    }

    initialized = InitFilter(*registry, viewport);
    if (initialized) {
        KESTREL_LOG_DEBUG("Filter '{}' initialized for {}x{}", name, viewport.width, viewport.height);
    }
}

void Filter::Cleanup() {
    if (!initialized) {
        return;
    }
    CleanupFilter();
    initialized = false;
    KESTREL_LOG_DEBUG("Filter '{}' cleaned up", name);
}

void Filter::Apply(FrameImage& frame) {
    const material::Material& material = GetMaterial();
    for (auto& pixel : frame.GetPixels()) {
        pixel = material.Shade(pixel);
    }
}

void Filter::Write(io::OutputCapsule& capsule) const {
    capsule.Write("name", name, std::string());
    capsule.Write("enabled", enabled, true);
}

void Filter::Read(const io::InputCapsule& capsule) {
    name = capsule.ReadString("name", std::string());
    enabled = capsule.ReadBool("enabled", true);
}

} // namespace kestrel::post
