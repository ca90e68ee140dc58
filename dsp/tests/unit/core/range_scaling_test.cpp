// ==============================================================================
// Layer 0: Core Utility Tests - Range Scaling
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vernier/dsp/core/range_scaling.h>

#include <array>

using Catch::Approx;
using namespace Vernier::DSP;

// ==============================================================================
// valueToNormalized
// ==============================================================================

TEST_CASE("valueToNormalized maps range endpoints to 0 and 1", "[range_scaling]") {
    REQUIRE(valueToNormalized(0.0f, 0.0f, 100.0f) == 0.0f);
    REQUIRE(valueToNormalized(100.0f, 0.0f, 100.0f) == 1.0f);
    REQUIRE(valueToNormalized(12.0f, 12.0f, 20000.0f) == 0.0f);
    REQUIRE(valueToNormalized(20000.0f, 12.0f, 20000.0f) == 1.0f);
}

TEST_CASE("valueToNormalized maps midpoint to 0.5", "[range_scaling]") {
    REQUIRE(valueToNormalized(50.0f, 0.0f, 100.0f) == 0.5f);
    REQUIRE(valueToNormalized(0.0f, -1.0f, 1.0f) == 0.5f);
}

TEST_CASE("valueToNormalized does not clamp", "[range_scaling][edge]") {
    REQUIRE(valueToNormalized(150.0f, 0.0f, 100.0f) == Approx(1.5f));
    REQUIRE(valueToNormalized(-50.0f, 0.0f, 100.0f) == Approx(-0.5f));
}

// ==============================================================================
// normalizedToValue
// ==============================================================================

TEST_CASE("normalizedToValue returns minimum at 0 and maximum at 1", "[range_scaling]") {
    REQUIRE(normalizedToValue(0.0f, 10.0f, 20.0f) == 10.0f);
    REQUIRE(normalizedToValue(1.0f, 10.0f, 20.0f) == 20.0f);
}

TEST_CASE("normalizedToValue quarter position", "[range_scaling]") {
    REQUIRE(normalizedToValue(0.25f, 10.0f, 20.0f) == Approx(12.5f));
}

TEST_CASE("normalizedToValue handles negative ranges", "[range_scaling]") {
    REQUIRE(normalizedToValue(0.5f, -1.0f, 1.0f) == Approx(0.0f).margin(1e-7));
    REQUIRE(normalizedToValue(0.0f, -60.0f, -10.0f) == -60.0f);
    REQUIRE(normalizedToValue(1.0f, -60.0f, -10.0f) == -10.0f);
}

TEST_CASE("normalizedToValue inverts valueToNormalized", "[range_scaling]") {
    constexpr std::array<float, 5> values{12.0f, 100.0f, 1000.0f, 7777.7f, 20000.0f};
    for (float v : values) {
        float n = valueToNormalized(v, 12.0f, 20000.0f);
        CHECK(normalizedToValue(n, 12.0f, 20000.0f) == Approx(v).epsilon(1e-5));
    }
}

TEST_CASE("range scaling is usable in constant expressions", "[range_scaling]") {
    constexpr float half = valueToNormalized(50.0f, 0.0f, 100.0f);
    constexpr float value = normalizedToValue(half, 0.0f, 100.0f);
    static_assert(half == 0.5f);
    static_assert(value == 50.0f);
    SUCCEED();
}

// ==============================================================================
// clampToRange / isInRange
// ==============================================================================

TEST_CASE("clampToRange limits to bounds", "[range_scaling]") {
    REQUIRE(clampToRange(-5.0f, 0.0f, 1.0f) == 0.0f);
    REQUIRE(clampToRange(5.0f, 0.0f, 1.0f) == 1.0f);
    REQUIRE(clampToRange(0.3f, 0.0f, 1.0f) == 0.3f);
}

TEST_CASE("isInRange is inclusive", "[range_scaling]") {
    REQUIRE(isInRange(0.0f, 0.0f, 1.0f));
    REQUIRE(isInRange(1.0f, 0.0f, 1.0f));
    REQUIRE_FALSE(isInRange(1.0001f, 0.0f, 1.0f));
    REQUIRE_FALSE(isInRange(-0.0001f, 0.0f, 1.0f));
}
