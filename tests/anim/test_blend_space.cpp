#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <kestrel/anim/blend_action.h>
#include <kestrel/anim/clip_action.h>
#include <kestrel/anim/linear_blend_space.h>
#include <kestrel/core/error.h>

#include <limits>
#include <memory>

using namespace kestrel::anim;

namespace {

// A clip holding the node at a constant x offset for `length` seconds.
std::shared_ptr<ClipAction> HoldX(const std::shared_ptr<Node>& node, float x, double length) {
    return std::make_shared<ClipAction>(std::vector<TransformTrack>{
        TransformTrack(node, {0.0, length}, {glm::vec3(x, 0.0f, 0.0f), glm::vec3(x, 0.0f, 0.0f)}, {}, {})});
}

float NodeX(const std::shared_ptr<Node>& node) {
    return node->GetLocalTransform().translation.x;
}

} // namespace

TEST_CASE("Linear blend space weights", "[anim][blendspace]") {
    auto node = std::make_shared<Node>();

    SECTION("Two actions over [0, 1]") {
        auto space = std::make_shared<LinearBlendSpace>(0.0f, 1.0f);
        BlendAction action(space, {HoldX(node, 0.0f, 1.0), HoldX(node, 10.0f, 1.0)});

        space->SetValue(0.0f);
        REQUIRE(space->GetWeight() == Catch::Approx(0.0f));

        space->SetValue(0.25f);
        REQUIRE(space->GetWeight() == Catch::Approx(0.25f));
        REQUIRE(action.GetFirstActiveIndex() == 0);
        REQUIRE(action.GetSecondActiveIndex() == 1);

        space->SetValue(1.0f);
        REQUIRE(space->GetWeight() == Catch::Approx(1.0f));
    }

    SECTION("Three actions pick the neighbouring pair") {
        auto space = std::make_shared<LinearBlendSpace>(0.0f, 2.0f);
        BlendAction action(space, {HoldX(node, 0.0f, 1.0), HoldX(node, 1.0f, 1.0), HoldX(node, 2.0f, 1.0)});

        space->SetValue(1.5f);
        REQUIRE(space->GetWeight() == Catch::Approx(0.5f));
        REQUIRE(action.GetFirstActiveIndex() == 1);
        REQUIRE(action.GetSecondActiveIndex() == 2);

        // A value on a step belongs to the pair below it.
        space->SetValue(1.0f);
        REQUIRE(space->GetWeight() == Catch::Approx(1.0f));
        REQUIRE(action.GetFirstActiveIndex() == 0);
        REQUIRE(action.GetSecondActiveIndex() == 1);

        space->SetValue(2.0f);
        REQUIRE(space->GetWeight() == Catch::Approx(1.0f));
        REQUIRE(action.GetSecondActiveIndex() == 2);
    }

    SECTION("Values outside the range are clamped") {
        auto space = std::make_shared<LinearBlendSpace>(-1.0f, 1.0f);
        BlendAction action(space, {HoldX(node, 0.0f, 1.0), HoldX(node, 1.0f, 1.0), HoldX(node, 2.0f, 1.0)});

        space->SetValue(5.0f);
        REQUIRE(space->GetValue() == Catch::Approx(1.0f));
        REQUIRE(space->GetWeight() == Catch::Approx(1.0f));
        REQUIRE(action.GetSecondActiveIndex() == 2);

        space->SetValue(-5.0f);
        REQUIRE(space->GetWeight() == Catch::Approx(0.0f));
        REQUIRE(action.GetFirstActiveIndex() == 0);
    }

    SECTION("Invalid setups") {
        REQUIRE_THROWS_AS(LinearBlendSpace(1.0f, 1.0f), kestrel::AnimationError);

        LinearBlendSpace unbound(0.0f, 1.0f);
        REQUIRE_THROWS_AS(unbound.GetWeight(), kestrel::IllegalStateError);
    }

    SECTION("Destroying the blend action unbinds the space") {
        auto space = std::make_shared<LinearBlendSpace>(0.0f, 1.0f);
        {
            BlendAction action(space, {HoldX(node, 0.0f, 1.0), HoldX(node, 1.0f, 1.0)});
            REQUIRE_NOTHROW(space->GetWeight());
        }
        REQUIRE_THROWS_AS(space->GetWeight(), kestrel::IllegalStateError);
    }

    SECTION("Destroying a stale blend action leaves the current binding alone") {
        auto space = std::make_shared<LinearBlendSpace>(0.0f, 1.0f);
        auto first = std::make_unique<BlendAction>(
            space, std::vector<std::shared_ptr<BlendableAction>>{HoldX(node, 0.0f, 1.0), HoldX(node, 1.0f, 1.0)});
        BlendAction second(space, {HoldX(node, 0.0f, 1.0), HoldX(node, 1.0f, 1.0)});
        REQUIRE(space->GetBlendAction() == &second);

        first.reset();
        REQUIRE(space->GetBlendAction() == &second);
        REQUIRE_NOTHROW(space->GetWeight());
    }

    SECTION("Non-finite values are ignored") {
        auto space = std::make_shared<LinearBlendSpace>(0.0f, 1.0f);
        BlendAction action(space, {HoldX(node, 0.0f, 1.0), HoldX(node, 10.0f, 1.0)});

        space->SetValue(0.25f);
        space->SetValue(std::numeric_limits<float>::quiet_NaN());
        REQUIRE(space->GetValue() == Catch::Approx(0.25f));
        space->SetValue(std::numeric_limits<float>::infinity());
        REQUIRE(space->GetWeight() == Catch::Approx(0.25f));
    }
}

TEST_CASE("Blend action mixes its active pair", "[anim][blend]") {
    auto node = std::make_shared<Node>();
    auto space = std::make_shared<LinearBlendSpace>(0.0f, 1.0f);
    BlendAction action(space, {HoldX(node, 0.0f, 1.0), HoldX(node, 10.0f, 2.0)});
    action.SetTransitionLength(0.0);

    SECTION("Length and time stretching follow the longest action") {
        REQUIRE(action.GetLength() == Catch::Approx(2.0));
        REQUIRE(action.GetTimeFactor(0) == Catch::Approx(0.5));
        REQUIRE(action.GetTimeFactor(1) == Catch::Approx(1.0));
        REQUIRE(action.GetTargets().size() == 1);
    }

    SECTION("Weight 0 runs only the first action") {
        space->SetValue(0.0f);
        REQUIRE(action.Interpolate(1.0));
        REQUIRE(action.GetBlendWeight() == Catch::Approx(0.0f));
        REQUIRE(NodeX(node) == Catch::Approx(0.0f));
    }

    SECTION("Weight between 0 and 1 interpolates both") {
        space->SetValue(0.25f);
        action.Interpolate(1.0);
        REQUIRE(NodeX(node) == Catch::Approx(2.5f));
    }

    SECTION("Weight 1 runs only the second action") {
        space->SetValue(1.0f);
        action.Interpolate(1.0);
        REQUIRE(NodeX(node) == Catch::Approx(10.0f));
    }

    SECTION("Children stop delegating after each update") {
        space->SetValue(0.5f);
        action.Interpolate(0.5);
        for (const auto& child : action.GetActions()) {
            REQUIRE(child->GetCollectTransformDelegate() == nullptr);
        }
    }

    SECTION("Finishes at its length") {
        REQUIRE_FALSE(action.Interpolate(2.0));
    }

    SECTION("Transforms from unknown targets are rejected") {
        Node stranger;
        REQUIRE_THROWS_AS(action.CollectTransform(stranger, Transform{}, 1.0f, *action.GetActions()[0]),
                          kestrel::AnimationError);
    }
}

TEST_CASE("Blend action construction", "[anim][blend]") {
    auto node = std::make_shared<Node>();
    auto space = std::make_shared<LinearBlendSpace>(0.0f, 1.0f);

    REQUIRE_THROWS_AS(BlendAction(space, {HoldX(node, 0.0f, 1.0)}), kestrel::AnimationError);
    REQUIRE_THROWS_AS(BlendAction(nullptr, {HoldX(node, 0.0f, 1.0), HoldX(node, 1.0f, 1.0)}), kestrel::AnimationError);
}

TEST_CASE("Nested blend actions forward to their parent", "[anim][blend]") {
    auto node = std::make_shared<Node>();

    auto innerSpace = std::make_shared<LinearBlendSpace>(0.0f, 1.0f);
    auto inner = std::make_shared<BlendAction>(
        innerSpace, std::vector<std::shared_ptr<BlendableAction>>{HoldX(node, 0.0f, 1.0), HoldX(node, 4.0f, 1.0)});
    innerSpace->SetValue(0.5f);

    auto outerSpace = std::make_shared<LinearBlendSpace>(0.0f, 1.0f);
    BlendAction outer(outerSpace, {HoldX(node, 0.0f, 1.0), inner});
    outer.SetTransitionLength(0.0);
    outerSpace->SetValue(0.5f);

    outer.Interpolate(0.5);

    // inner yields 2, outer mixes 0 and 2 at one half
    REQUIRE(NodeX(node) == Catch::Approx(1.0f));
}
