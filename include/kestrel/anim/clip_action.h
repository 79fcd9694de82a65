// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "kestrel/anim/blendable_action.h"

namespace kestrel::anim {

/**
 * Keyframed transform of a single target.
 *
 * Translation, rotation and scale keys are optional; an empty list leaves that
 * component of the sampled transform untouched.
 */
class TransformTrack {
public:
    TransformTrack(std::shared_ptr<HasLocalTransform> target,
                   std::vector<double> times,
                   std::vector<glm::vec3> translations,
                   std::vector<glm::quat> rotations,
                   std::vector<glm::vec3> scales);

    const std::shared_ptr<HasLocalTransform>& GetTarget() const { return target; }
    double GetLength() const { return times.back(); }

    /// Writes the keyed components at time t into transform. Clamped outside the key range.
    void Sample(double t, Transform& transform) const;

private:
    std::shared_ptr<HasLocalTransform> target;
    std::vector<double> times;
    std::vector<glm::vec3> translations;
    std::vector<glm::quat> rotations;
    std::vector<glm::vec3> scales;
};

/**
 * Plays a set of transform tracks, like a single clip of an animation.
 */
class ClipAction : public BlendableAction {
public:
    explicit ClipAction(std::vector<TransformTrack> tracks);

    const std::vector<TransformTrack>& GetTracks() const { return tracks; }

    /// Clips only produce transforms; receiving one is an AnimationError.
    void CollectTransform(HasLocalTransform& target, const Transform& t, float weight, BlendableAction& source) override;

    std::vector<std::shared_ptr<HasLocalTransform>> GetTargets() const override;

protected:
    void DoInterpolate(double t) override;

private:
    std::vector<TransformTrack> tracks;
};

} // namespace kestrel::anim
