#include <gtest/gtest.h>
#include "combination/range_builder.hpp"
#include "test_helpers.hpp"

using namespace combination;
using test_utils::fixed_component;
using test_utils::ranged_component;

// =============================================================================
// decimal_places
// =============================================================================

TEST(RangeBuilder, DecimalPlaces) {
    EXPECT_EQ(decimal_places(0.0), 0);
    EXPECT_EQ(decimal_places(1.0), 0);
    EXPECT_EQ(decimal_places(0.1), 1);
    EXPECT_EQ(decimal_places(0.25), 2);
    EXPECT_EQ(decimal_places(0.005), 3);
    EXPECT_EQ(decimal_places(12.5), 1);
    EXPECT_EQ(decimal_places(-0.75), 2);
}

TEST(RangeBuilder, DecimalPlacesIgnoresBinaryNoise) {
    EXPECT_EQ(decimal_places(0.1 + 0.2), 1);
    EXPECT_EQ(decimal_places(0.1 * 3), 1);
}

// =============================================================================
// Component values
// =============================================================================

TEST(RangeBuilder, UnitIntervalTenthSteps) {
    auto values = build_component_values(ranged_component("c", "A", 0.0, 1.0, 0.1));

    ASSERT_EQ(values.size(), 11u);
    for (size_t i = 0; i < values.size(); ++i) {
        EXPECT_EQ(values[i], round_value(static_cast<double>(i) / 10.0)) << "index " << i;
    }
    EXPECT_EQ(values.front(), 0.0);
    EXPECT_EQ(values.back(), 1.0);
    EXPECT_EQ(values[3], 0.3);
}

TEST(RangeBuilder, NoFloatingPointDrift) {
    // A naive accumulation overshoots: 0.1 + 0.1 + 0.1 != 0.3
    EXPECT_NE(0.1 + 0.1 + 0.1, 0.3);
    EXPECT_EQ(round_value(0.1 + 0.1 + 0.1), 0.3);

    // Lattice values are exact decimal values regardless of step count
    auto values = build_component_values(ranged_component("c", "A", 0.0, 1.0, 0.01));
    ASSERT_EQ(values.size(), 101u);
    EXPECT_EQ(values[7], 0.07);
    EXPECT_EQ(values[29], 0.29);
    EXPECT_EQ(values.back(), 1.0);
}

TEST(RangeBuilder, FixedValueShortCircuits) {
    ComponentSpec spec = fixed_component("c", "A", 0.5);
    spec.min = 0.0;
    spec.max = 10.0;
    spec.step = 0.001;

    auto values = build_component_values(spec);
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values[0], 0.5);
}

TEST(RangeBuilder, StepNotDividingRange) {
    // 0.2, 0.5, 0.8 - max of 1.0 is not on the lattice
    auto values = build_component_values(ranged_component("c", "A", 0.2, 1.0, 0.3));
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], 0.2);
    EXPECT_EQ(values[1], 0.5);
    EXPECT_EQ(values[2], 0.8);
}

TEST(RangeBuilder, MixedPrecisionBounds) {
    // min has more digits than step: scale comes from the finest of the three
    auto values = build_component_values(ranged_component("c", "A", 0.05, 0.45, 0.1));
    ASSERT_EQ(values.size(), 5u);
    EXPECT_EQ(values[0], 0.05);
    EXPECT_EQ(values[4], 0.45);
}

TEST(RangeBuilder, SinglePointRange) {
    auto values = build_component_values(ranged_component("c", "A", 0.4, 0.4, 0.1));
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values[0], 0.4);
}

TEST(RangeBuilder, EmptyRangeFallsBackToMin) {
    auto values = build_component_values(ranged_component("c", "A", 0.7, 0.2, 0.1));
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values[0], 0.7);
}

TEST(RangeBuilder, TenthAndQuarterSteps) {
    auto values = build_component_values(ranged_component("c", "A", 0.0, 0.3, 0.1));
    EXPECT_EQ(values.size(), 4u);

    auto fine = build_component_values(ranged_component("c", "A", 0.0, 1.0, 0.25));
    ASSERT_EQ(fine.size(), 5u);
    EXPECT_EQ(fine[1], 0.25);
    EXPECT_EQ(fine[3], 0.75);
}

TEST(RangeBuilder, IntegerRanges) {
    auto values = build_component_values(ranged_component("c", "A", 0.0, 10.0, 2.5));
    ASSERT_EQ(values.size(), 5u);
    EXPECT_EQ(values[2], 5.0);
    EXPECT_EQ(values[4], 10.0);
}

// =============================================================================
// CandidateLattice
// =============================================================================

TEST(CandidateLattice, TotalCombinations) {
    SearchRequest request;
    request.components = {
        ranged_component("a", "A", 0.0, 1.0, 0.1),   // 11
        ranged_component("b", "A", 0.0, 1.0, 0.5),   // 3
        fixed_component("c", "B", 0.2),              // 1
    };
    auto lattice = build_lattice(request);

    ASSERT_EQ(lattice->num_dimensions(), 3u);
    EXPECT_EQ(lattice->dimension_size(0), 11u);
    EXPECT_EQ(lattice->dimension_size(1), 3u);
    EXPECT_EQ(lattice->dimension_size(2), 1u);
    EXPECT_EQ(lattice->total_combinations(), 33u);
    EXPECT_EQ(lattice->leaves_below(1), 3u);
    EXPECT_EQ(lattice->leaves_below(2), 1u);
    EXPECT_EQ(lattice->leaves_below(3), 1u);
}

TEST(CandidateLattice, TotalSaturatesInsteadOfOverflowing) {
    std::vector<std::vector<double>> dims(8, std::vector<double>(1000, 0.0));
    CandidateLattice lattice(std::move(dims));
    EXPECT_EQ(lattice.total_combinations(), UINT64_MAX);
}

TEST(CandidateLattice, SaturatingMul) {
    EXPECT_EQ(saturating_mul(0, UINT64_MAX), 0u);
    EXPECT_EQ(saturating_mul(3, 7), 21u);
    EXPECT_EQ(saturating_mul(UINT64_MAX / 2, 3), UINT64_MAX);
}
