#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <kestrel/core/config.h>

#include <filesystem>
#include <fstream>

using namespace kestrel::config;

namespace {

std::filesystem::path WriteTempConfig(const std::string& name, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << contents;
    return path;
}

} // namespace

TEST_CASE("Config defaults", "[core][config]") {
    const auto config = load_from_file("does/not/exist.json");

    REQUIRE(config.frame_width == 1280);
    REQUIRE(config.frame_height == 720);
    REQUIRE(config.log_level == spdlog::level::info);
    REQUIRE(config.contrast.enabled);
    REQUIRE(config.contrast.exponents == glm::vec3(2.2f));
    REQUIRE(config.contrast.brightness == glm::vec2(0.0f, 1.0f));
    REQUIRE(config.contrast.scales == glm::vec3(1.0f));
    REQUIRE(config.vr_backend == "none");
}

TEST_CASE("Config file parsing", "[core][config]") {
    const auto path = WriteTempConfig("kestrel_test_config.json", R"({
        "frame": { "width": 320, "height": 200 },
        "logging": { "level": "Warning" },
        "post": { "contrast": {
            "enabled": false,
            "exponents": [1.0, 2.0, 3.0],
            "brightness": [0.1, 0.9],
            "scales": [0.5, 0.6, 0.7]
        } },
        "vr": { "backend": "openvr" }
    })");

    const auto config = load_from_file(path);

    REQUIRE(config.frame_width == 320);
    REQUIRE(config.frame_height == 200);
    REQUIRE(config.log_level == spdlog::level::warn);
    REQUIRE_FALSE(config.contrast.enabled);
    REQUIRE(config.contrast.exponents.z == Catch::Approx(3.0f));
    REQUIRE(config.contrast.brightness.x == Catch::Approx(0.1f));
    REQUIRE(config.contrast.brightness.y == Catch::Approx(0.9f));
    REQUIRE(config.contrast.scales.y == Catch::Approx(0.6f));
    REQUIRE(config.vr_backend == "openvr");

    std::filesystem::remove(path);
}

TEST_CASE("Config tolerates bad input", "[core][config]") {
    SECTION("Malformed JSON keeps defaults") {
        const auto path = WriteTempConfig("kestrel_test_bad.json", "{ not json");
        const auto config = load_from_file(path);
        REQUIRE(config.frame_width == 1280);
        std::filesystem::remove(path);
    }

    SECTION("Wrong vector length keeps that field's default") {
        const auto path = WriteTempConfig("kestrel_test_vec.json", R"({"post": {"contrast": {"scales": [1, 2]}}})");
        const auto config = load_from_file(path);
        REQUIRE(config.contrast.scales == glm::vec3(1.0f));
        std::filesystem::remove(path);
    }

    SECTION("Non-positive frame sizes keep their defaults") {
        const auto path = WriteTempConfig("kestrel_test_frame.json", R"({"frame": {"width": -5, "height": 0}})");
        const auto config = load_from_file(path);
        REQUIRE(config.frame_width == 1280);
        REQUIRE(config.frame_height == 720);
        std::filesystem::remove(path);
    }

    SECTION("Log level names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("ERROR") == spdlog::level::err);
        REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
        REQUIRE(parse_log_level("bogus") == spdlog::level::info);
    }
}
