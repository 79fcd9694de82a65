// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/anim/blendable_action.h"

#include <algorithm>

namespace kestrel::anim {

bool BlendableAction::Interpolate(double t) {
    const double local = t * GetSpeed();
    if (weight == 0.0f) {
        return local < GetLength();
    }

    if (collectTransformDelegate == nullptr && transitionLength > 0.0) {
        transitionWeight = static_cast<float>(std::clamp(local / transitionLength, 0.0, 1.0));
    } else {
        transitionWeight = 1.0f;
    }

    DoInterpolate(local);
    return local < GetLength();
}

void BlendableAction::ApplyToTarget(HasLocalTransform& target, const Transform& t, float weight) const {
    const float mix = weight * transitionWeight;
    if (mix >= 1.0f) {
        target.SetLocalTransform(t);
        return;
    }
    target.SetLocalTransform(Transform::Interpolate(target.GetLocalTransform(), t, mix));
}

} // namespace kestrel::anim
