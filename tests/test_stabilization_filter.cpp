#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "stabilization_filter.h"

#include <cmath>
#include <numbers>

using Catch::Matchers::WithinAbs;

namespace {

Pose At(float x, float y, float z) {
    Pose p;
    p.position = {x, y, z};
    return p;
}

} // anonymous namespace

TEST_CASE("Stabilizer smoothing coefficient", "[stabilizer]") {
    REQUIRE(StabilizationFilter::Alpha(0.05f) == Catch::Approx(1.0f - std::exp(-1.0f)));
    REQUIRE(StabilizationFilter::Alpha(1.0f / 60.0f) == Catch::Approx(0.2835f).epsilon(0.001));

    // Zero, negative and NaN frame times are floored, never zero or negative
    REQUIRE(StabilizationFilter::Alpha(0.0f) > 0.0f);
    REQUIRE(StabilizationFilter::Alpha(-1.0f) > 0.0f);
    REQUIRE(StabilizationFilter::Alpha(std::nanf("")) > 0.0f);
    REQUIRE(StabilizationFilter::Alpha(0.0f) < 1e-3f);
}

TEST_CASE("Stabilizer first update adopts raw values", "[stabilizer]") {
    StabilizationFilter filter;
    REQUIRE_FALSE(filter.IsInitialized());

    Pose optic = At(0.0f, 0.0f, 0.0f);
    optic.rotation = AxisAngle({0.0f, 1.0f, 0.0f}, 0.3f);
    filter.Update(At(0.0f, 0.0f, 0.0f), At(0.2f, -0.1f, 0.5f), optic, 1.0f / 60.0f);

    REQUIRE(filter.IsInitialized());
    REQUIRE(filter.LensCamSmoothed().x == 0.2f);
    REQUIRE(filter.LensCamSmoothed().y == -0.1f);
    REQUIRE(filter.LensCamSmoothed().z == 0.5f);
    REQUIRE(filter.OpticRotSmoothed().y == optic.rotation.y);
    REQUIRE(filter.LensDeltaCam() == 0.0f);
}

TEST_CASE("Stabilizer works in camera space", "[stabilizer]") {
    StabilizationFilter filter;

    Pose camera = At(1.0f, 0.0f, 0.0f);
    camera.rotation = AxisAngle({0.0f, 1.0f, 0.0f}, static_cast<float>(std::numbers::pi / 2.0));
    filter.Update(camera, At(1.0f, 0.0f, 1.0f), Pose{}, 1.0f / 60.0f);

    REQUIRE_THAT(filter.LensCamSmoothed().x, WithinAbs(-1.0, 1e-5));
    REQUIRE_THAT(filter.LensCamSmoothed().y, WithinAbs(0.0, 1e-5));
    REQUIRE_THAT(filter.LensCamSmoothed().z, WithinAbs(0.0, 1e-5));

    // Camera and lens moving together is no motion at all
    camera.position = {5.0f, 2.0f, -3.0f};
    filter.Update(camera, At(5.0f, 2.0f, -2.0f), Pose{}, 1.0f / 60.0f);
    REQUIRE_THAT(filter.LensCamSmoothed().x, WithinAbs(-1.0, 1e-5));
    REQUIRE_THAT(filter.LensDeltaCam(), WithinAbs(0.0, 1e-5));
}

TEST_CASE("Stabilizer converges monotonically on a step", "[stabilizer]") {
    StabilizationFilter filter;
    const Pose camera;
    filter.Update(camera, At(0.0f, 0.0f, 0.0f), Pose{}, 1.0f / 60.0f);

    const Pose target = At(0.1f, 0.0f, 0.0f);
    float previous = 0.1f;
    for (int frame = 0; frame < 120; ++frame) {
        filter.Update(camera, target, Pose{}, 1.0f / 60.0f);
        const float remaining = 0.1f - filter.LensCamSmoothed().x;
        REQUIRE(remaining >= 0.0f);
        REQUIRE(remaining <= previous);
        previous = remaining;
    }

    // Stops inside the deadzone, never overshoots
    REQUIRE(previous <= 0.0005f);
    REQUIRE(filter.LensCamSmoothed().x <= 0.1f);
}

TEST_CASE("Stabilizer ignores motion inside the deadzone", "[stabilizer]") {
    StabilizationFilter filter;
    const Pose camera;
    filter.Update(camera, At(0.0f, 0.0f, 0.0f), Pose{}, 1.0f / 60.0f);

    for (int frame = 0; frame < 30; ++frame) {
        filter.Update(camera, At(0.0004f, 0.0f, 0.0f), Pose{}, 1.0f / 60.0f);
    }
    REQUIRE(filter.LensCamSmoothed().x == 0.0f);
    REQUIRE_THAT(filter.LensDeltaCam(), WithinAbs(0.0004, 1e-6));
}

TEST_CASE("Stabilizer is frame-rate independent", "[stabilizer]") {
    const Pose camera;
    const Pose target = At(1.0f, 0.0f, 0.0f);

    StabilizationFilter fast;
    fast.Update(camera, At(0.0f, 0.0f, 0.0f), Pose{}, 0.01f);
    fast.Update(camera, target, Pose{}, 0.01f);
    fast.Update(camera, target, Pose{}, 0.01f);

    StabilizationFilter slow;
    slow.Update(camera, At(0.0f, 0.0f, 0.0f), Pose{}, 0.02f);
    slow.Update(camera, target, Pose{}, 0.02f);

    REQUIRE_THAT(fast.LensCamSmoothed().x, WithinAbs(slow.LensCamSmoothed().x, 1e-5));
    REQUIRE_THAT(slow.LensCamSmoothed().x, WithinAbs(1.0 - std::exp(-0.4), 1e-5));
}

TEST_CASE("Stabilizer rotation tracks the optic", "[stabilizer]") {
    StabilizationFilter filter;
    filter.Update(Pose{}, Pose{}, Pose{}, 1.0f / 60.0f);

    Pose optic;
    optic.rotation = AxisAngle({1.0f, 0.0f, 0.0f}, 1.2f);
    filter.Update(Pose{}, Pose{}, optic, 1.0f / 60.0f);

    REQUIRE(filter.OpticRotSmoothed().x == optic.rotation.x);
    REQUIRE(filter.OpticRotSmoothed().w == optic.rotation.w);
}

TEST_CASE("Stabilizer reset re-initializes on the next update", "[stabilizer]") {
    StabilizationFilter filter;
    filter.Update(Pose{}, At(0.0f, 0.0f, 0.0f), Pose{}, 1.0f / 60.0f);
    filter.Update(Pose{}, At(1.0f, 0.0f, 0.0f), Pose{}, 1.0f / 60.0f);
    REQUIRE(filter.LensCamSmoothed().x < 1.0f);

    filter.Reset();
    REQUIRE_FALSE(filter.IsInitialized());
    REQUIRE(filter.LensDeltaCam() == 0.0f);

    filter.Update(Pose{}, At(3.0f, 0.0f, 0.0f), Pose{}, 1.0f / 60.0f);
    REQUIRE(filter.LensCamSmoothed().x == 3.0f);
}
