// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/anim/linear_blend_space.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "kestrel/anim/blend_action.h"
#include "kestrel/core/error.h"

namespace kestrel::anim {

LinearBlendSpace::LinearBlendSpace(float minValue, float maxValue)
    : value(minValue), minValue(minValue), maxValue(maxValue) {
    if (!(minValue < maxValue)) {
        throw AnimationError(fmt::format("blend space range [{}, {}] is empty", minValue, maxValue));
    }
}

void LinearBlendSpace::SetBlendAction(BlendAction* action) {
    this->action = action;
    step = 0.0f;
    if (action != nullptr) {
        step = (maxValue - minValue) / static_cast<float>(action->GetActionCount() - 1);
    }
}

float LinearBlendSpace::GetWeight() {
    if (action == nullptr) {
        throw IllegalStateError("blend space has no blend action");
    }

    const int lastPair = static_cast<int>(action->GetActionCount()) - 2;

    // Position in units of steps; a value sitting on a step belongs to the pair below it.
    const float position = (value - minValue) / step;
    const int lowIndex = std::clamp(static_cast<int>(std::ceil(position)) - 1, 0, lastPair);

    action->SetFirstActiveIndex(static_cast<size_t>(lowIndex));
    action->SetSecondActiveIndex(static_cast<size_t>(lowIndex + 1));

    return std::clamp(position - static_cast<float>(lowIndex), 0.0f, 1.0f);
}

void LinearBlendSpace::SetValue(float value) {
    // Non-finite input keeps the previous value.
    if (!std::isfinite(value)) {
        return;
    }
    this->value = std::clamp(value, minValue, maxValue);
}

} // namespace kestrel::anim
