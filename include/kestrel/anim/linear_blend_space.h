// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "kestrel/anim/blend_space.h"

namespace kestrel::anim {

/**
 * Spreads the actions of a blend action evenly over [minValue, maxValue].
 *
 * The value selects the two neighbouring actions around it; the weight is the
 * normalized position of the value between them. Values outside the range are
 * clamped to it.
 */
class LinearBlendSpace : public BlendSpace {
public:
    /// Throws AnimationError unless minValue < maxValue.
    LinearBlendSpace(float minValue, float maxValue);

    void SetBlendAction(BlendAction* action) override;
    BlendAction* GetBlendAction() const override { return action; }

    /// Also selects the active pair on the bound action. Throws IllegalStateError if unbound.
    float GetWeight() override;

    /// Ignores NaN and infinities.
    void SetValue(float value) override;

    float GetValue() const { return value; }
    float GetMinValue() const { return minValue; }
    float GetMaxValue() const { return maxValue; }

private:
    BlendAction* action = nullptr;
    float value = 0.0f;
    float minValue;
    float maxValue;
    float step = 0.0f;
};

} // namespace kestrel::anim
