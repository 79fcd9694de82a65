// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/post/filter_post_processor.h"

#include <algorithm>

#include <fmt/format.h>

#include "kestrel/core/error.h"
#include "kestrel/core/log.h"
#include "kestrel/post/contrast_adjustment_filter.h"

namespace kestrel::post {

void FilterPostProcessor::AddFilter(std::shared_ptr<Filter> filter) {
    if (!filter) {
        throw IllegalStateError("Filter can't be null");
    }
    if (registry != nullptr) {
        filter->Init(registry, viewport);
    }
    filters.push_back(std::move(filter));
}

bool FilterPostProcessor::RemoveFilter(const std::shared_ptr<Filter>& filter) {
    auto it = std::find(filters.begin(), filters.end(), filter);
    if (it == filters.end()) {
        return false;
    }
    (*it)->Cleanup();
    filters.erase(it);
    return true;
}

void FilterPostProcessor::RemoveAllFilters() {
    for (auto& filter : filters) {
        filter->Cleanup();
    }
    filters.clear();
}

void FilterPostProcessor::Initialize(const material::MaterialRegistry& registry, ViewportSize viewport) {
    this->registry = &registry;
    this->viewport = viewport;

    KESTREL_LOG_INFO("Initializing post processor with {} filter(s) at {}x{}", filters.size(), viewport.width, viewport.height);
    for (auto& filter : filters) {
        filter->Init(this->registry, viewport);
    }
}

void FilterPostProcessor::Reshape(ViewportSize viewport) {
    if (registry == nullptr) {
        throw IllegalStateError("post processor reshaped before Initialize");
    }
    Initialize(*registry, viewport);
}

void FilterPostProcessor::Cleanup() {
    for (auto& filter : filters) {
        filter->Cleanup();
    }
    registry = nullptr;
}

void FilterPostProcessor::Render(FrameImage& frame) {
    for (auto& filter : filters) {
        if (!filter->IsEnabled() || !filter->IsInitialized()) {
            continue;
        }
        filter->Apply(frame);
    }
}

void FilterPostProcessor::Write(io::OutputCapsule& capsule) const {
    std::vector<const io::Savable*> list;
    list.reserve(filters.size());
    for (const auto& filter : filters) {
        list.push_back(filter.get());
    }
    capsule.Write("numFilters", static_cast<int>(filters.size()), 0);
    capsule.WriteSavableList("filters", list);
}

void FilterPostProcessor::Read(const io::InputCapsule& capsule) {
    const int expected = capsule.ReadInt("numFilters", 0);
    auto savables = capsule.ReadSavableList("filters");
    if (static_cast<int>(savables.size()) != expected) {
        throw SerializationError(fmt::format("expected {} filters, found {}", expected, savables.size()));
    }

    RemoveAllFilters();
    for (auto& savable : savables) {
        auto* raw = dynamic_cast<Filter*>(savable.get());
        if (raw == nullptr) {
            throw SerializationError(fmt::format("'{}' is not a filter", savable->GetTypeName()));
        }
        savable.release();
        AddFilter(std::shared_ptr<Filter>(raw));
    }
}

void RegisterPostTypes(io::SavableFactory& factory) {
    factory.Register<ContrastAdjustmentFilter>();
    factory.Register<FilterPostProcessor>();
}

} // namespace kestrel::post
