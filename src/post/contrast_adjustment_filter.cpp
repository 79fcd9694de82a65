// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/post/contrast_adjustment_filter.h"

#include "kestrel/core/common.h"
#include "kestrel/core/error.h"

namespace kestrel::post {

ContrastAdjustmentFilter::ContrastAdjustmentFilter()
    : Filter("ContrastAdjustmentFilter") {}

ContrastAdjustmentFilter::ContrastAdjustmentFilter(float expR, float expG, float expB)
    : Filter("ContrastAdjustmentFilter"), expR(expR), expG(expG), expB(expB) {}

ContrastAdjustmentFilter::ContrastAdjustmentFilter(const glm::vec3& exponents, const glm::vec2& brightness, const glm::vec3& scales)
    : Filter("ContrastAdjustmentFilter"),
      expR(exponents.x), expG(exponents.y), expB(exponents.z),
      minBrightness(brightness.x), maxBrightness(brightness.y),
      scaleR(scales.x), scaleG(scales.y), scaleB(scales.z) {}

void ContrastAdjustmentFilter::SetExponents(float expR, float expG, float expB) {
    this->expR = expR;
    this->expG = expG;
    this->expB = expB;
    PushExponents();
}

void ContrastAdjustmentFilter::SetBrightness(float minValue, float maxValue) {
    minBrightness = minValue;
    maxBrightness = maxValue;
    PushBrightness();
}

void ContrastAdjustmentFilter::SetScales(float scaleR, float scaleG, float scaleB) {
    this->scaleR = scaleR;
    this->scaleG = scaleG;
    this->scaleB = scaleB;
    PushScales();
}

material::Material& ContrastAdjustmentFilter::GetMaterial() {
    if (!material) {
        throw IllegalStateError("Cannot create a color filter from a null reference !");
    }
    return *material;
}

bool ContrastAdjustmentFilter::InitFilter(const material::MaterialRegistry& registry, ViewportSize viewport) {
    KESTREL_UNUSED(viewport);

    material = registry.Load(material::kColorContrastMaterial);

    PushExponents();
    PushBrightness();
    PushScales();
    return true;
}

void ContrastAdjustmentFilter::CleanupFilter() {
    material.reset();
}

void ContrastAdjustmentFilter::PushExponents() {
    if (!material) {
        return;
    }
    material->SetFloat("exp_r", expR);
    material->SetFloat("exp_g", expG);
    material->SetFloat("exp_b", expB);
}

void ContrastAdjustmentFilter::PushBrightness() {
    if (!material) {
        return;
    }
    material->SetFloat("minBrightness", minBrightness);
    material->SetFloat("maxBrightness", maxBrightness);
}

void ContrastAdjustmentFilter::PushScales() {
    if (!material) {
        return;
    }
    material->SetFloat("scale_r", scaleR);
    material->SetFloat("scale_g", scaleG);
    material->SetFloat("scale_b", scaleB);
}

void ContrastAdjustmentFilter::Write(io::OutputCapsule& capsule) const {
    Filter::Write(capsule);
    capsule.Write("exp_r", expR, kDefaultExponent);
    capsule.Write("exp_g", expG, kDefaultExponent);
    capsule.Write("exp_b", expB, kDefaultExponent);
    capsule.Write("minBrightness", minBrightness, kDefaultMinBrightness);
    capsule.Write("maxBrightness", maxBrightness, kDefaultMaxBrightness);
    capsule.Write("scale_r", scaleR, kDefaultScale);
    capsule.Write("scale_g", scaleG, kDefaultScale);
    capsule.Write("scale_b", scaleB, kDefaultScale);
}

void ContrastAdjustmentFilter::Read(const io::InputCapsule& capsule) {
    Filter::Read(capsule);
    expR = capsule.ReadFloat("exp_r", kDefaultExponent);
    expG = capsule.ReadFloat("exp_g", kDefaultExponent);
    expB = capsule.ReadFloat("exp_b", kDefaultExponent);
    minBrightness = capsule.ReadFloat("minBrightness", kDefaultMinBrightness);
    maxBrightness = capsule.ReadFloat("maxBrightness", kDefaultMaxBrightness);
    scaleR = capsule.ReadFloat("scale_r", kDefaultScale);
    scaleG = capsule.ReadFloat("scale_g", kDefaultScale);
    scaleB = capsule.ReadFloat("scale_b", kDefaultScale);

    PushExponents();
    PushBrightness();
    PushScales();
}

} // namespace kestrel::post
