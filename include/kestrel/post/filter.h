// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include "kestrel/io/savable.h"
#include "kestrel/material/material.h"
#include "kestrel/material/material_registry.h"
#include "kestrel/post/frame_image.h"

namespace kestrel::post {

struct ViewportSize {
    uint32_t width = 0;
    uint32_t height = 0;
};

/**
 * A full-screen pass applied to the rendered frame through a material.
 *
 * Subclasses create their material in InitFilter and hand it out through
 * GetMaterial. Until Init succeeds the filter is skipped by the processor.
 */
class Filter : public io::Savable {
public:
    explicit Filter(std::string name) : name(std::move(name)) {}
    ~Filter() override = default;

    Filter(const Filter&) = delete;
    Filter& operator=(const Filter&) = delete;

    const std::string& GetName() const { return name; }
    void SetName(const std::string& value) { name = value; }

    bool IsEnabled() const { return enabled; }
    void SetEnabled(bool value) { enabled = value; }

    bool IsInitialized() const { return initialized; }

    /**
     * Creates the filter's resources for a viewport.
     *
     * A null registry or a zero-sized viewport leaves the filter uninitialized.
     */
    void Init(const material::MaterialRegistry* registry, ViewportSize viewport);

    void Cleanup();

    /// Runs every pixel of the frame through the filter's material.
    void Apply(FrameImage& frame);

    /// Throws IllegalStateError when the filter has not been initialized.
    virtual material::Material& GetMaterial() = 0;

    void Write(io::OutputCapsule& capsule) const override;
    void Read(const io::InputCapsule& capsule) override;

protected:
    /// Returns false if the filter could not set itself up for this viewport.
    virtual bool InitFilter(const material::MaterialRegistry& registry, ViewportSize viewport) = 0;
    virtual void CleanupFilter() {}

    std::string name;

private:
    bool enabled = true;
    bool initialized = false;
};

} // namespace kestrel::post
