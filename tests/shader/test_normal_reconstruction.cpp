#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <kestrel/core/error.h>
#include <kestrel/shader/normal_reconstruction.h>

#include <cmath>

using namespace kestrel::shader;

namespace {

FragmentDerivatives PlaneXY(float uvScale) {
    FragmentDerivatives d;
    d.dpdx = glm::vec3(1.0f, 0.0f, 0.0f);
    d.dpdy = glm::vec3(0.0f, 1.0f, 0.0f);
    d.duvdx = glm::vec2(uvScale, 0.0f);
    d.duvdy = glm::vec2(0.0f, uvScale);
    return d;
}

NormalMap Uniform(const glm::vec3& texel) {
    NormalMap map;
    map.width = 2;
    map.height = 2;
    map.texels.assign(4, texel);
    return map;
}

} // namespace

TEST_CASE("Cotangent frame from derivatives", "[shader][normal]") {
    const glm::vec3 n(0.0f, 0.0f, 1.0f);

    SECTION("Axis aligned plane gives the canonical basis") {
        const glm::mat3 tbn = CotangentFrame(n, PlaneXY(1.0f));
        REQUIRE(tbn[0].x == Catch::Approx(1.0f));
        REQUIRE(tbn[1].y == Catch::Approx(1.0f));
        REQUIRE(tbn[2].z == Catch::Approx(1.0f));
    }

    SECTION("Frame is invariant to uv scale") {
        const glm::mat3 a = CotangentFrame(n, PlaneXY(1.0f));
        const glm::mat3 b = CotangentFrame(n, PlaneXY(8.0f));
        REQUIRE(b[0].x == Catch::Approx(a[0].x));
        REQUIRE(b[1].y == Catch::Approx(a[1].y));
    }

    SECTION("Degenerate derivatives keep the normal") {
        const glm::mat3 tbn = CotangentFrame(n, FragmentDerivatives{});
        REQUIRE(tbn[0] == glm::vec3(0.0f));
        REQUIRE(tbn[2] == n);
    }
}

TEST_CASE("Perturbed normals", "[shader][normal]") {
    const glm::vec3 n(0.0f, 0.0f, 1.0f);

    SECTION("Flat normal map sample returns the surface normal") {
        const glm::vec3 out = PerturbNormal(n, glm::vec3(0.5f, 0.5f, 1.0f), PlaneXY(1.0f));
        REQUIRE(out.z == Catch::Approx(1.0f));
        REQUIRE(out.x == Catch::Approx(0.0f).margin(1e-6));
    }

    SECTION("Tangent-pointing sample bends towards +u") {
        const glm::vec3 out = PerturbNormal(n, glm::vec3(1.0f, 0.5f, 1.0f), PlaneXY(1.0f));
        REQUIRE(out.x == Catch::Approx(std::sqrt(0.5f)));
        REQUIRE(out.z == Catch::Approx(std::sqrt(0.5f)));
        REQUIRE(glm::length(out) == Catch::Approx(1.0f));
    }

    SECTION("Degenerate derivatives return the normalized input") {
        const glm::vec3 out = PerturbNormal(glm::vec3(0.0f, 0.0f, 3.0f), glm::vec3(1.0f, 0.5f, 0.5f), FragmentDerivatives{});
        REQUIRE(out.z == Catch::Approx(1.0f));
    }
}

TEST_CASE("Terrain normal reconstruction", "[shader][terrain]") {
    Heightfield terrain;
    terrain.width = 4;
    terrain.depth = 4;
    terrain.spacing = 1.0f;

    SECTION("Flat terrain with a flat map points up") {
        terrain.heights.assign(16, 2.0f);
        const auto normals = ReconstructTerrainNormals(terrain, Uniform(glm::vec3(0.5f, 0.5f, 1.0f)));

        REQUIRE(normals.size() == 16);
        for (const auto& normal : normals) {
            REQUIRE(normal.y == Catch::Approx(1.0f));
        }
    }

    SECTION("Map texels pointing along the tangent tilt towards +X") {
        terrain.heights.assign(16, 0.0f);
        const auto normals = ReconstructTerrainNormals(terrain, Uniform(glm::vec3(1.0f, 0.5f, 0.5f)));
        REQUIRE(normals[5].x == Catch::Approx(1.0f));
        REQUIRE(normals[5].y == Catch::Approx(0.0f).margin(1e-6));
    }

    SECTION("A slope follows the geometry") {
        terrain.heights.resize(16);
        for (uint32_t z = 0; z < 4; ++z) {
            for (uint32_t x = 0; x < 4; ++x) {
                terrain.heights[z * 4 + x] = static_cast<float>(x);
            }
        }
        const auto normals = ReconstructTerrainNormals(terrain, Uniform(glm::vec3(0.5f, 0.5f, 1.0f)));
        for (const auto& normal : normals) {
            REQUIRE(normal.x == Catch::Approx(-std::sqrt(0.5f)));
            REQUIRE(normal.y == Catch::Approx(std::sqrt(0.5f)));
        }
    }

    SECTION("Size mismatches are rejected") {
        terrain.heights.assign(3, 0.0f);
        REQUIRE_THROWS_AS(ReconstructTerrainNormals(terrain, Uniform(glm::vec3(0.5f))), kestrel::KestrelError);

        terrain.heights.assign(16, 0.0f);
        NormalMap empty;
        REQUIRE_THROWS_AS(ReconstructTerrainNormals(terrain, empty), kestrel::KestrelError);
    }
}
