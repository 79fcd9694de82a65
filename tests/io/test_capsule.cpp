#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <kestrel/core/error.h>
#include <kestrel/io/json_capsule.h>
#include <kestrel/io/savable.h>

#include <filesystem>
#include <fstream>

using namespace kestrel::io;

namespace {

class Probe : public Savable {
public:
    std::string GetTypeName() const override { return "Probe"; }

    void Write(OutputCapsule& capsule) const override {
        capsule.Write("gain", gain, 1.0f);
        capsule.Write("count", count, 0);
        capsule.Write("label", label, std::string("probe"));
        capsule.Write("offset", offset, glm::vec3(0.0f));
        capsule.WriteSavable("child", child.get());
    }

    void Read(const InputCapsule& capsule) override {
        gain = capsule.ReadFloat("gain", 1.0f);
        count = capsule.ReadInt("count", 0);
        label = capsule.ReadString("label", "probe");
        offset = capsule.ReadVec3("offset", glm::vec3(0.0f));
        child.reset();
        if (auto nested = capsule.ReadSavable("child")) {
            child.reset(static_cast<Probe*>(nested.release()));
        }
    }

    float gain = 1.0f;
    int count = 0;
    std::string label = "probe";
    glm::vec3 offset = glm::vec3(0.0f);
    std::unique_ptr<Probe> child;
};

} // namespace

TEST_CASE("Output capsule omits defaults", "[io][capsule]") {
    Probe probe;
    probe.gain = 0.5f;

    const auto document = JsonExporter::ToJson(probe);

    REQUIRE(document["type"] == "Probe");
    REQUIRE(document["fields"].size() == 1);
    REQUIRE(document["fields"]["gain"].get<float>() == Catch::Approx(0.5f));
}

TEST_CASE("Input capsule reads fields and defaults", "[io][capsule]") {
    SavableFactory factory;
    factory.Register<Probe>();
    JsonImporter importer(factory);

    SECTION("Missing fields fall back to defaults") {
        Probe probe;
        probe.count = 9;
        importer.ReadInto(probe, nlohmann::json{{"type", "Probe"}, {"fields", {{"gain", 3.0}}}});

        REQUIRE(probe.gain == Catch::Approx(3.0f));
        REQUIRE(probe.count == 0);
        REQUIRE(probe.label == "probe");
    }

    SECTION("Nested savables are recreated by type") {
        Probe parent;
        parent.child = std::make_unique<Probe>();
        parent.child->label = "inner";
        parent.child->offset = glm::vec3(1.0f, 2.0f, 3.0f);

        auto restored = importer.FromJson(JsonExporter::ToJson(parent));
        auto* probe = dynamic_cast<Probe*>(restored.get());

        REQUIRE(probe != nullptr);
        REQUIRE(probe->child != nullptr);
        REQUIRE(probe->child->label == "inner");
        REQUIRE(probe->child->offset.z == Catch::Approx(3.0f));
    }

    SECTION("Type mismatch is a serialization error") {
        Probe probe;
        REQUIRE_THROWS_AS(
            importer.ReadInto(probe, nlohmann::json{{"fields", {{"gain", "loud"}}}}),
            kestrel::SerializationError);
        REQUIRE_THROWS_AS(
            importer.ReadInto(probe, nlohmann::json{{"fields", {{"offset", {1.0, 2.0}}}}}),
            kestrel::SerializationError);
    }

    SECTION("Unknown type is a serialization error") {
        REQUIRE_THROWS_AS(importer.FromJson(nlohmann::json{{"type", "Nope"}}), kestrel::SerializationError);
    }
}

TEST_CASE("Capsule files", "[io][capsule]") {
    SavableFactory factory;
    factory.Register<Probe>();
    JsonImporter importer(factory);

    const auto path = std::filesystem::temp_directory_path() / "kestrel_probe.json";

    Probe probe;
    probe.count = 4;
    REQUIRE(JsonExporter::SaveToFile(probe, path).IsOk());

    auto loaded = importer.LoadFromFile(path);
    REQUIRE(loaded.IsOk());
    REQUIRE(static_cast<Probe&>(*loaded.Value()).count == 4);

    std::ofstream(path) << "{ broken";
    auto broken = importer.LoadFromFile(path);
    REQUIRE(broken.IsErr());
    REQUIRE(broken.GetError().Kind == kestrel::core::ErrorKind::Parse);

    std::filesystem::remove(path);
    auto missing = importer.LoadFromFile(path);
    REQUIRE(missing.IsErr());
    REQUIRE(missing.GetError().Kind == kestrel::core::ErrorKind::Io);
}
