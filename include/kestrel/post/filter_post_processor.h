// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include "kestrel/io/savable.h"
#include "kestrel/material/material_registry.h"
#include "kestrel/post/filter.h"
#include "kestrel/post/frame_image.h"

namespace kestrel::post {

/**
 * Ordered chain of filters applied to a rendered frame.
 */
class FilterPostProcessor : public io::Savable {
public:
    FilterPostProcessor() = default;

    std::string GetTypeName() const override { return "FilterPostProcessor"; }

    /// Filters added after Initialize are initialized immediately.
    void AddFilter(std::shared_ptr<Filter> filter);

    /// Returns false if the filter was not part of the chain.
    bool RemoveFilter(const std::shared_ptr<Filter>& filter);

    void RemoveAllFilters();

    const std::vector<std::shared_ptr<Filter>>& GetFilters() const { return filters; }

    bool IsInitialized() const { return registry != nullptr; }

    /// The registry must outlive the processor or the next Cleanup.
    void Initialize(const material::MaterialRegistry& registry, ViewportSize viewport);

    /// Re-initializes every filter for a new viewport size.
    void Reshape(ViewportSize viewport);

    void Cleanup();

    /// Applies each enabled, initialized filter in order.
    void Render(FrameImage& frame);

    void Write(io::OutputCapsule& capsule) const override;
    void Read(const io::InputCapsule& capsule) override;

private:
    std::vector<std::shared_ptr<Filter>> filters;
    const material::MaterialRegistry* registry = nullptr;
    ViewportSize viewport;
};

/// Registers every filter type this library ships, and the processor itself.
void RegisterPostTypes(io::SavableFactory& factory);

} // namespace kestrel::post
