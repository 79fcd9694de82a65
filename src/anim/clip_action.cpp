// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/anim/clip_action.h"

#include <algorithm>

#include <fmt/format.h>

#include "kestrel/core/common.h"
#include "kestrel/core/error.h"

namespace kestrel::anim {

namespace {

// Index of the key at or before t and the blend factor towards the next key.
std::pair<size_t, float> FindSegment(const std::vector<double>& times, double t) {
    if (t <= times.front() || times.size() == 1) {
        return {0, 0.0f};
    }
    if (t >= times.back()) {
        return {times.size() - 1, 0.0f};
    }
    auto upper = std::upper_bound(times.begin(), times.end(), t);
    const size_t next = static_cast<size_t>(upper - times.begin());
    const size_t prev = next - 1;
    const double span = times[next] - times[prev];
    return {prev, static_cast<float>((t - times[prev]) / span)};
}

template <typename T>
void CheckKeyCount(const std::vector<T>& keys, size_t expected, const char* what) {
    if (!keys.empty() && keys.size() != expected) {
        throw AnimationError(fmt::format("track has {} {} keys for {} times", keys.size(), what, expected));
    }
}

} // namespace

TransformTrack::TransformTrack(std::shared_ptr<HasLocalTransform> target,
                               std::vector<double> times,
                               std::vector<glm::vec3> translations,
                               std::vector<glm::quat> rotations,
                               std::vector<glm::vec3> scales)
    : target(std::move(target)),
      times(std::move(times)),
      translations(std::move(translations)),
      rotations(std::move(rotations)),
      scales(std::move(scales)) {
    if (!this->target) {
        throw AnimationError("track has no target");
    }
    if (this->times.empty()) {
        throw AnimationError("track has no keyframes");
    }
    for (size_t i = 1; i < this->times.size(); ++i) {
        if (this->times[i] <= this->times[i - 1]) {
            throw AnimationError("track key times must be strictly increasing");
        }
    }
    CheckKeyCount(this->translations, this->times.size(), "translation");
    CheckKeyCount(this->rotations, this->times.size(), "rotation");
    CheckKeyCount(this->scales, this->times.size(), "scale");
}

void TransformTrack::Sample(double t, Transform& transform) const {
    const auto [index, factor] = FindSegment(times, t);
    const size_t next = std::min(index + 1, times.size() - 1);

    if (!translations.empty()) {
        transform.translation = glm::mix(translations[index], translations[next], factor);
    }
    if (!rotations.empty()) {
        transform.rotation = glm::slerp(rotations[index], rotations[next], factor);
    }
    if (!scales.empty()) {
        transform.scale = glm::mix(scales[index], scales[next], factor);
    }
}

ClipAction::ClipAction(std::vector<TransformTrack> tracks) : tracks(std::move(tracks)) {
    for (const auto& track : this->tracks) {
        length = std::max(length, track.GetLength());
    }
}

void ClipAction::CollectTransform(HasLocalTransform& target, const Transform& t, float weight, BlendableAction& source) {
    KESTREL_UNUSED(target);
    KESTREL_UNUSED(t);
    KESTREL_UNUSED(weight);
    KESTREL_UNUSED(source);
    throw AnimationError("a clip cannot collect transforms from other actions");
}

std::vector<std::shared_ptr<HasLocalTransform>> ClipAction::GetTargets() const {
    std::vector<std::shared_ptr<HasLocalTransform>> targets;
    targets.reserve(tracks.size());
    for (const auto& track : tracks) {
        targets.push_back(track.GetTarget());
    }
    return targets;
}

void ClipAction::DoInterpolate(double t) {
    for (const auto& track : tracks) {
        HasLocalTransform& target = *track.GetTarget();
        Transform sampled = target.GetLocalTransform();
        track.Sample(t, sampled);

        if (collectTransformDelegate != nullptr) {
            collectTransformDelegate->CollectTransform(target, sampled, GetWeight(), *this);
        } else {
            ApplyToTarget(target, sampled, GetWeight());
        }
    }
}

} // namespace kestrel::anim
