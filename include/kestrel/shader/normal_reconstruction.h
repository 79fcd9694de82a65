// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace kestrel::shader {

/**
 * Screen-space derivatives of a fragment's position and texture coordinate,
 * the CPU counterpart of dFdx/dFdy.
 */
struct FragmentDerivatives {
    glm::vec3 dpdx = glm::vec3(0.0f);
    glm::vec3 dpdy = glm::vec3(0.0f);
    glm::vec2 duvdx = glm::vec2(0.0f);
    glm::vec2 duvdy = glm::vec2(0.0f);
};

/**
 * Builds a tangent frame (T, B, N columns) for a fragment from derivatives
 * alone, for geometry that carries no precomputed tangents.
 *
 * T and B are scaled together so the frame stays invariant to uv scale.
 * Degenerate derivatives return a frame with zero T and B.
 */
glm::mat3 CotangentFrame(const glm::vec3& normal, const FragmentDerivatives& derivatives);

/// Maps an 8-bit style normal map sample in [0, 1] to a vector in [-1, 1].
inline glm::vec3 DecodeNormalMapSample(const glm::vec3& sample) {
    return sample * 2.0f - 1.0f;
}

/**
 * Perturbs the interpolated normal by a tangent-space normal map sample.
 *
 * @param normal interpolated surface normal, need not be normalized
 * @param sample normal map texel in [0, 1]
 * @return normalized normal; the unperturbed normal when the frame is degenerate
 */
glm::vec3 PerturbNormal(const glm::vec3& normal, const glm::vec3& sample, const FragmentDerivatives& derivatives);

/**
 * Regular height grid with a tangent-space normal map laid over it once.
 * Heights are row-major, x along +X, z along +Z, height along +Y.
 */
struct Heightfield {
    uint32_t width = 0;
    uint32_t depth = 0;
    float spacing = 1.0f;
    std::vector<float> heights;

    float HeightAt(uint32_t x, uint32_t z) const { return heights[static_cast<size_t>(z) * width + x]; }
    glm::vec3 PositionAt(uint32_t x, uint32_t z) const;
};

struct NormalMap {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<glm::vec3> texels; // [0, 1] encoded

    /// Nearest texel lookup, uv wrapped to [0, 1).
    glm::vec3 Sample(const glm::vec2& uv) const;
};

/**
 * Per-vertex terrain normals with the normal map applied, using grid finite
 * differences as the fragment derivatives. Throws KestrelError on size mismatch.
 */
std::vector<glm::vec3> ReconstructTerrainNormals(const Heightfield& terrain, const NormalMap& normalMap);

} // namespace kestrel::shader
