// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <unordered_map>
#include <vector>

#include "kestrel/anim/blend_space.h"
#include "kestrel/anim/blendable_action.h"

namespace kestrel::anim {

/**
 * Mixes a pair of its child actions, chosen and weighted by a BlendSpace.
 *
 * Every child is time-stretched to the length of the longest child so the
 * blended motion stays in phase.
 */
class BlendAction : public BlendableAction {
public:
    /// Throws AnimationError with fewer than 2 actions or a null blend space.
    BlendAction(std::shared_ptr<BlendSpace> blendSpace, std::vector<std::shared_ptr<BlendableAction>> actions);
    ~BlendAction() override;

    BlendAction(const BlendAction&) = delete;
    BlendAction& operator=(const BlendAction&) = delete;

    size_t GetActionCount() const { return actions.size(); }
    const std::vector<std::shared_ptr<BlendableAction>>& GetActions() const { return actions; }

    BlendSpace& GetBlendSpace() const { return *blendSpace; }

    void SetFirstActiveIndex(size_t index);
    void SetSecondActiveIndex(size_t index);
    size_t GetFirstActiveIndex() const { return firstActiveIndex; }
    size_t GetSecondActiveIndex() const { return secondActiveIndex; }

    /// Weight computed by the blend space on the last interpolation.
    float GetBlendWeight() const { return blendWeight; }

    /// Ratio of a child's own length to the blend length, used to scale its local time.
    double GetTimeFactor(size_t index) const { return timeFactors.at(index); }

    void CollectTransform(HasLocalTransform& target, const Transform& t, float weight, BlendableAction& source) override;

    std::vector<std::shared_ptr<HasLocalTransform>> GetTargets() const override;

protected:
    void DoInterpolate(double t) override;

private:
    void Collect(HasLocalTransform& target, const Transform& t);

    std::shared_ptr<BlendSpace> blendSpace;
    std::vector<std::shared_ptr<BlendableAction>> actions;
    std::vector<double> timeFactors;

    std::vector<std::shared_ptr<HasLocalTransform>> targets;
    std::unordered_map<HasLocalTransform*, Transform> blended;

    size_t firstActiveIndex = 0;
    size_t secondActiveIndex = 1;
    float blendWeight = 0.0f;
};

} // namespace kestrel::anim
