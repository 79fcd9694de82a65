// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>

#include <glm/glm.hpp>

#include "kestrel/post/filter.h"

namespace kestrel::post {

/**
 * Color filter changing the contrast of each channel independently and the
 * brightness of the scene based on a simple transfer function.
 *
 * Per channel c of the incoming color:
 *   c = clamp((c - minBrightness) / (maxBrightness - minBrightness), 0, 1)
 *   c = pow(c, exp_c) * scale_c
 *
 * Raising minBrightness or widening the [min, max] range darkens the image,
 * lowering minBrightness brightens it. The scales are applied on the final pass
 * and are expected to lie in [0, 1].
 */
class ContrastAdjustmentFilter : public Filter {
public:
    static constexpr float kDefaultExponent = 2.2f;
    static constexpr float kDefaultMinBrightness = 0.0f;
    static constexpr float kDefaultMaxBrightness = 1.0f;
    static constexpr float kDefaultScale = 1.0f;

    /// Exponent 2.2 on all channels, brightness range [0, 1], scale 1.
    ContrastAdjustmentFilter();

    /// Default brightness and scale.
    ContrastAdjustmentFilter(float expR, float expG, float expB);

    /**
     * @param exponents x = red, y = green, z = blue exponent
     * @param brightness x = minBrightness, y = maxBrightness
     * @param scales x = red, y = green, z = blue final pass scale
     */
    ContrastAdjustmentFilter(const glm::vec3& exponents, const glm::vec2& brightness, const glm::vec3& scales);

    std::string GetTypeName() const override { return "ContrastAdjustmentFilter"; }

    void SetExponents(float expR, float expG, float expB);
    float GetExpR() const { return expR; }
    float GetExpG() const { return expG; }
    float GetExpB() const { return expB; }

    void SetBrightness(float minValue, float maxValue);
    float GetMinBrightness() const { return minBrightness; }
    float GetMaxBrightness() const { return maxBrightness; }

    void SetScales(float scaleR, float scaleG, float scaleB);
    float GetScaleR() const { return scaleR; }
    float GetScaleG() const { return scaleG; }
    float GetScaleB() const { return scaleB; }

    material::Material& GetMaterial() override;

    void Write(io::OutputCapsule& capsule) const override;
    void Read(const io::InputCapsule& capsule) override;

protected:
    bool InitFilter(const material::MaterialRegistry& registry, ViewportSize viewport) override;
    void CleanupFilter() override;

private:
    void PushExponents();
    void PushBrightness();
    void PushScales();

    float expR = kDefaultExponent;
    float expG = kDefaultExponent;
    float expB = kDefaultExponent;
    float minBrightness = kDefaultMinBrightness;
    float maxBrightness = kDefaultMaxBrightness;
    float scaleR = kDefaultScale;
    float scaleG = kDefaultScale;
    float scaleB = kDefaultScale;

    std::unique_ptr<material::Material> material;
};

} // namespace kestrel::post
