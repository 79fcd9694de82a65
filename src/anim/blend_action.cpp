// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/anim/blend_action.h"

#include <algorithm>

#include <fmt/format.h>

#include "kestrel/core/error.h"

namespace kestrel::anim {

BlendAction::BlendAction(std::shared_ptr<BlendSpace> blendSpace, std::vector<std::shared_ptr<BlendableAction>> actions)
    : blendSpace(std::move(blendSpace)), actions(std::move(actions)) {
    if (!this->blendSpace) {
        throw AnimationError("blend action needs a blend space");
    }
    if (this->actions.size() < 2) {
        throw AnimationError(fmt::format("blend action needs at least 2 actions, got {}", this->actions.size()));
    }

    for (const auto& action : this->actions) {
        if (!action) {
            throw AnimationError("blend action got a null action");
        }
        length = std::max(length, action->GetLength());

        for (auto& target : action->GetTargets()) {
            if (blended.emplace(target.get(), Transform::Identity()).second) {
                targets.push_back(target);
            }
        }
    }

    // Stretch shorter actions so every child spans the blend length.
    timeFactors.assign(this->actions.size(), 1.0);
    for (size_t i = 0; i < this->actions.size(); ++i) {
        const double actionLength = this->actions[i]->GetLength();
        if (actionLength != length && actionLength > 0.0 && length > 0.0) {
            timeFactors[i] = actionLength / length;
        }
    }

    this->blendSpace->SetBlendAction(this);
}

BlendAction::~BlendAction() {
    // The space may have been rebound to another blend action since.
    if (blendSpace->GetBlendAction() == this) {
        blendSpace->SetBlendAction(nullptr);
    }
}

void BlendAction::SetFirstActiveIndex(size_t index) {
    if (index >= actions.size()) {
        throw AnimationError(fmt::format("active index {} out of range for {} actions", index, actions.size()));
    }
    firstActiveIndex = index;
}

void BlendAction::SetSecondActiveIndex(size_t index) {
    if (index >= actions.size()) {
        throw AnimationError(fmt::format("active index {} out of range for {} actions", index, actions.size()));
    }
    secondActiveIndex = index;
}

void BlendAction::DoInterpolate(double t) {
    blendWeight = blendSpace->GetWeight();

    BlendableAction& first = *actions[firstActiveIndex];
    BlendableAction& second = *actions[secondActiveIndex];
    first.SetCollectTransformDelegate(this);
    second.SetCollectTransformDelegate(this);

    // The first action only contributes while the blend is not finished.
    if (blendWeight < 1.0f) {
        first.SetWeight(1.0f);
        first.Interpolate(t * timeFactors[firstActiveIndex]);
        if (blendWeight == 0.0f) {
            for (auto& target : targets) {
                Collect(*target, blended[target.get()]);
            }
        }
    }

    second.SetWeight(blendWeight);
    second.Interpolate(t * timeFactors[secondActiveIndex]);

    first.SetCollectTransformDelegate(nullptr);
    second.SetCollectTransformDelegate(nullptr);
}

void BlendAction::CollectTransform(HasLocalTransform& target, const Transform& t, float weight, BlendableAction& source) {
    auto it = blended.find(&target);
    if (it == blended.end()) {
        throw AnimationError("collected a transform for a target outside the blend");
    }

    Transform& tr = it->second;
    if (weight == 1.0f) {
        tr = t;
    } else {
        tr = Transform::Interpolate(tr, t, weight);
    }

    if (&source == actions[secondActiveIndex].get()) {
        Collect(target, tr);
    }
}

std::vector<std::shared_ptr<HasLocalTransform>> BlendAction::GetTargets() const {
    return targets;
}

void BlendAction::Collect(HasLocalTransform& target, const Transform& t) {
    if (collectTransformDelegate != nullptr) {
        collectTransformDelegate->CollectTransform(target, t, GetWeight(), *this);
    } else {
        ApplyToTarget(target, t, 1.0f);
    }
}

} // namespace kestrel::anim
