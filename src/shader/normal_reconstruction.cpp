// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/shader/normal_reconstruction.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "kestrel/core/error.h"

namespace kestrel::shader {

glm::mat3 CotangentFrame(const glm::vec3& normal, const FragmentDerivatives& d) {
    // Solve the linear system relating position and uv derivatives.
    const glm::vec3 dp2perp = glm::cross(d.dpdy, normal);
    const glm::vec3 dp1perp = glm::cross(normal, d.dpdx);
    const glm::vec3 t = dp2perp * d.duvdx.x + dp1perp * d.duvdy.x;
    const glm::vec3 b = dp2perp * d.duvdx.y + dp1perp * d.duvdy.y;

    const float maxLength2 = std::max(glm::dot(t, t), glm::dot(b, b));
    if (!(maxLength2 > 0.0f) || !std::isfinite(maxLength2)) {
        return glm::mat3(glm::vec3(0.0f), glm::vec3(0.0f), normal);
    }
    const float invMax = 1.0f / std::sqrt(maxLength2);
    return glm::mat3(t * invMax, b * invMax, normal);
}

glm::vec3 PerturbNormal(const glm::vec3& normal, const glm::vec3& sample, const FragmentDerivatives& derivatives) {
    const glm::vec3 n = glm::normalize(normal);
    const glm::mat3 tbn = CotangentFrame(n, derivatives);
    if (tbn[0] == glm::vec3(0.0f) && tbn[1] == glm::vec3(0.0f)) {
        return n;
    }

    const glm::vec3 perturbed = tbn * DecodeNormalMapSample(sample);
    const float len = glm::length(perturbed);
    if (!(len > 0.0f)) {
        return n;
    }
    return perturbed / len;
}

glm::vec3 Heightfield::PositionAt(uint32_t x, uint32_t z) const {
    return glm::vec3(static_cast<float>(x) * spacing, HeightAt(x, z), static_cast<float>(z) * spacing);
}

glm::vec3 NormalMap::Sample(const glm::vec2& uv) const {
    const glm::vec2 wrapped = uv - glm::floor(uv);
    const uint32_t x = std::min(static_cast<uint32_t>(wrapped.x * static_cast<float>(width)), width - 1);
    const uint32_t y = std::min(static_cast<uint32_t>(wrapped.y * static_cast<float>(height)), height - 1);
    return texels[static_cast<size_t>(y) * width + x];
}

std::vector<glm::vec3> ReconstructTerrainNormals(const Heightfield& terrain, const NormalMap& normalMap) {
    if (terrain.width < 2 || terrain.depth < 2) {
        throw KestrelError(fmt::format("terrain needs at least 2x2 samples, got {}x{}", terrain.width, terrain.depth));
    }
    if (terrain.heights.size() != static_cast<size_t>(terrain.width) * terrain.depth) {
        throw KestrelError(fmt::format("terrain has {} heights for {}x{} samples",
                                       terrain.heights.size(), terrain.width, terrain.depth));
    }
    if (normalMap.width == 0 || normalMap.height == 0
        || normalMap.texels.size() != static_cast<size_t>(normalMap.width) * normalMap.height) {
        throw KestrelError("normal map size does not match its texel count");
    }

    const glm::vec2 uvStep(1.0f / static_cast<float>(terrain.width - 1), 1.0f / static_cast<float>(terrain.depth - 1));

    std::vector<glm::vec3> normals;
    normals.reserve(terrain.heights.size());

    for (uint32_t z = 0; z < terrain.depth; ++z) {
        for (uint32_t x = 0; x < terrain.width; ++x) {
            // Central differences inside the grid, one-sided on the borders.
            const uint32_t x0 = x > 0 ? x - 1 : x;
            const uint32_t x1 = x + 1 < terrain.width ? x + 1 : x;
            const uint32_t z0 = z > 0 ? z - 1 : z;
            const uint32_t z1 = z + 1 < terrain.depth ? z + 1 : z;

            FragmentDerivatives d;
            d.dpdx = terrain.PositionAt(x1, z) - terrain.PositionAt(x0, z);
            // +Z first so that (dpdx, dpdy, N) is right-handed with N pointing up.
            d.dpdy = terrain.PositionAt(x, z0) - terrain.PositionAt(x, z1);
            d.duvdx = glm::vec2(static_cast<float>(x1 - x0) * uvStep.x, 0.0f);
            d.duvdy = glm::vec2(0.0f, -static_cast<float>(z1 - z0) * uvStep.y);

            const glm::vec3 geometric = glm::cross(d.dpdx, d.dpdy);
            const glm::vec2 uv(static_cast<float>(x) * uvStep.x, static_cast<float>(z) * uvStep.y);
            normals.push_back(PerturbNormal(geometric, normalMap.Sample(uv), d));
        }
    }
    return normals;
}

} // namespace kestrel::shader
