// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include "kestrel/anim/action.h"
#include "kestrel/anim/has_local_transform.h"

namespace kestrel::anim {

/**
 * An action whose output transforms can be mixed with other actions.
 *
 * Without a delegate the action writes its targets itself, ramping in over the
 * transition length. With a delegate every sampled transform is handed to the
 * delegate's CollectTransform instead, and the delegate decides how to mix.
 */
class BlendableAction : public Action {
public:
    static constexpr double kDefaultTransitionLength = 0.4;

    ~BlendableAction() override = default;

    /// Skips interpolation entirely while the weight is 0.
    bool Interpolate(double t) override;

    /// Non-owning. Pass nullptr to write targets directly again.
    void SetCollectTransformDelegate(BlendableAction* delegate) { collectTransformDelegate = delegate; }
    BlendableAction* GetCollectTransformDelegate() const { return collectTransformDelegate; }

    float GetWeight() const { return weight; }
    void SetWeight(float value) { weight = value; }

    double GetTransitionLength() const { return transitionLength; }
    void SetTransitionLength(double value) { transitionLength = value; }

    float GetTransitionWeight() const { return transitionWeight; }

    virtual void CollectTransform(HasLocalTransform& target, const Transform& t, float weight, BlendableAction& source) = 0;

    virtual std::vector<std::shared_ptr<HasLocalTransform>> GetTargets() const = 0;

protected:
    virtual void DoInterpolate(double t) = 0;

    /// Writes a transform to a target honoring the current transition weight.
    void ApplyToTarget(HasLocalTransform& target, const Transform& t, float weight) const;

    BlendableAction* collectTransformDelegate = nullptr;

private:
    float weight = 1.0f;
    float transitionWeight = 1.0f;
    double transitionLength = kDefaultTransitionLength;
};

} // namespace kestrel::anim
