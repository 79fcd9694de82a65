#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <kestrel/core/error.h>
#include <kestrel/io/json_capsule.h>
#include <kestrel/post/contrast_adjustment_filter.h>
#include <kestrel/post/filter_post_processor.h>

using namespace kestrel::post;
using kestrel::material::MaterialRegistry;

namespace {

std::shared_ptr<ContrastAdjustmentFilter> MakeHalfScale() {
    auto filter = std::make_shared<ContrastAdjustmentFilter>(1.0f, 1.0f, 1.0f);
    filter->SetScales(0.5f, 0.5f, 0.5f);
    return filter;
}

} // namespace

TEST_CASE("Post processor chain", "[post][processor]") {
    const auto registry = MaterialRegistry::WithBuiltins();
    FilterPostProcessor processor;

    SECTION("Filters run in order, disabled ones are skipped") {
        auto first = MakeHalfScale();
        auto second = MakeHalfScale();
        auto disabled = MakeHalfScale();
        disabled->SetEnabled(false);

        processor.AddFilter(first);
        processor.AddFilter(disabled);
        processor.AddFilter(second);
        processor.Initialize(registry, {4, 4});

        FrameImage frame(4, 4, glm::vec4(1.0f));
        processor.Render(frame);

        REQUIRE(frame.At(3, 3).r == Catch::Approx(0.25f));
        REQUIRE(frame.At(0, 0).a == Catch::Approx(1.0f));
    }

    SECTION("Filters added after Initialize are initialized immediately") {
        processor.Initialize(registry, {4, 4});
        auto filter = MakeHalfScale();
        processor.AddFilter(filter);
        REQUIRE(filter->IsInitialized());
    }

    SECTION("Uninitialized processor leaves the frame untouched") {
        processor.AddFilter(MakeHalfScale());
        FrameImage frame(2, 2, glm::vec4(1.0f));
        processor.Render(frame);
        REQUIRE(frame.At(1, 1).g == Catch::Approx(1.0f));
    }

    SECTION("Remove and cleanup") {
        auto filter = MakeHalfScale();
        processor.AddFilter(filter);
        processor.Initialize(registry, {4, 4});

        REQUIRE(processor.RemoveFilter(filter));
        REQUIRE_FALSE(filter->IsInitialized());
        REQUIRE_FALSE(processor.RemoveFilter(filter));
        REQUIRE(processor.GetFilters().empty());

        processor.Cleanup();
        REQUIRE_FALSE(processor.IsInitialized());
    }

    SECTION("Reshape requires Initialize and re-inits filters") {
        REQUIRE_THROWS_AS(processor.Reshape({8, 8}), kestrel::IllegalStateError);

        auto filter = MakeHalfScale();
        processor.AddFilter(filter);
        processor.Initialize(registry, {4, 4});
        processor.Reshape({8, 8});
        REQUIRE(filter->IsInitialized());
        REQUIRE(filter->GetMaterial().GetFloat("scale_r") == Catch::Approx(0.5f));
    }

    SECTION("Null filter is rejected") {
        REQUIRE_THROWS_AS(processor.AddFilter(nullptr), kestrel::IllegalStateError);
    }
}

TEST_CASE("Post processor persistence", "[post][processor]") {
    kestrel::io::SavableFactory factory;
    RegisterPostTypes(factory);
    kestrel::io::JsonImporter importer(factory);

    FilterPostProcessor processor;
    auto filter = std::make_shared<ContrastAdjustmentFilter>(1.0f, 2.0f, 3.0f);
    filter->SetName("grade");
    processor.AddFilter(filter);
    processor.AddFilter(std::make_shared<ContrastAdjustmentFilter>());

    const auto document = kestrel::io::JsonExporter::ToJson(processor);
    REQUIRE(document["fields"]["numFilters"] == 2);
    REQUIRE(document["fields"]["filters"].size() == 2);

    auto restored = importer.FromJson(document);
    auto& copy = dynamic_cast<FilterPostProcessor&>(*restored);
    REQUIRE(copy.GetFilters().size() == 2);

    auto& grade = dynamic_cast<ContrastAdjustmentFilter&>(*copy.GetFilters()[0]);
    REQUIRE(grade.GetName() == "grade");
    REQUIRE(grade.GetExpB() == Catch::Approx(3.0f));

    SECTION("Filter count mismatch is rejected") {
        auto tampered = document;
        tampered["fields"]["numFilters"] = 5;
        REQUIRE_THROWS_AS(importer.FromJson(tampered), kestrel::SerializationError);
    }
}

TEST_CASE("Frame image", "[post][image]") {
    const FrameImage gradient = FrameImage::Gradient(5, 2);

    REQUIRE(gradient.GetWidth() == 5);
    REQUIRE(gradient.GetHeight() == 2);
    REQUIRE(gradient.At(0, 1).r == Catch::Approx(0.0f));
    REQUIRE(gradient.At(2, 0).g == Catch::Approx(0.5f));
    REQUIRE(gradient.At(4, 1).b == Catch::Approx(1.0f));
    REQUIRE(FrameImage().IsEmpty());
}
