// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

namespace kestrel::anim {

class BlendAction;

/**
 * Drives the blending between 2 successive actions of a BlendAction by
 * producing a blend weight at runtime from an arbitrary value.
 *
 * The weight is the interpolation value for the target transforms and should
 * lie in [0, 1]:
 *  - 0: only the first action runs, at interpolation value 1.
 *  - 1: blending is finished, only the second action runs.
 *  - in between: both actions run each update; the first at 1, the second at
 *    the blend space weight.
 *
 * See LinearBlendSpace for an implementation.
 */
class BlendSpace {
public:
    virtual ~BlendSpace() = default;

    /// Binds the blend action consuming the weight. nullptr unbinds.
    virtual void SetBlendAction(BlendAction* action) = 0;
    virtual BlendAction* GetBlendAction() const = 0;

    /// Weight handed to the bound blend action for interpolating its active pair.
    virtual float GetWeight() = 0;

    /// Arbitrary value the weight is derived from.
    virtual void SetValue(float value) = 0;
};

} // namespace kestrel::anim
