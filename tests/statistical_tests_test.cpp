// statistical_tests_test.cpp — two-sided Mann-Whitney U test
//
// Tests for:
//   - average ranks with ties and the tie term
//   - asymptotic p-values against reference values (tie + continuity correction)
//   - exact permutation p-values for small samples
//   - AUTO method selection
//   - symmetry under swapping the two groups
//   - NaN p-value when a group is empty

#include <gtest/gtest.h>

#include "analysis/statistical_tests.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {

// Deterministic pseudo-random values in [0, 100).
std::vector<double> make_values(int n, uint32_t seed) {
    std::vector<double> v(n);
    uint32_t state = seed;
    for (int i = 0; i < n; ++i) {
        state = state * 1664525u + 1013904223u;
        v[i] = static_cast<double>(state >> 8) / 16777216.0 * 100.0;
    }
    return v;
}

}  // anonymous namespace

// ===========================================================================
// Ranks
// ===========================================================================

class AverageRanksTest : public ::testing::Test {};

TEST_F(AverageRanksTest, DistinctValues) {
    double tie_sum = -1.0;
    auto ranks = detail::average_ranks({3.0, 1.0, 2.0}, tie_sum);
    EXPECT_DOUBLE_EQ(ranks[0], 3.0);
    EXPECT_DOUBLE_EQ(ranks[1], 1.0);
    EXPECT_DOUBLE_EQ(ranks[2], 2.0);
    EXPECT_DOUBLE_EQ(tie_sum, 0.0);
}

TEST_F(AverageRanksTest, TiesShareAverageRank) {
    double tie_sum = 0.0;
    auto ranks = detail::average_ranks({5.0, 2.0, 2.0, 7.0, 2.0}, tie_sum);
    EXPECT_DOUBLE_EQ(ranks[1], 2.0);
    EXPECT_DOUBLE_EQ(ranks[2], 2.0);
    EXPECT_DOUBLE_EQ(ranks[4], 2.0);
    EXPECT_DOUBLE_EQ(ranks[0], 4.0);
    EXPECT_DOUBLE_EQ(ranks[3], 5.0);
    EXPECT_DOUBLE_EQ(tie_sum, 24.0);  // 3^3 - 3
}

// ===========================================================================
// Mann-Whitney U
// ===========================================================================

class MannWhitneyTest : public ::testing::Test {};

TEST_F(MannWhitneyTest, SeparatedGroupsAsymptotic) {
    auto r = mann_whitney_u_test({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0});
    EXPECT_DOUBLE_EQ(r.u_statistic, 0.0);
    EXPECT_NEAR(r.p_value, 0.0808555983700523, 1e-12);
    EXPECT_EQ(r.method, MannWhitneyMethod::ASYMPTOTIC);
}

TEST_F(MannWhitneyTest, TieCorrectionApplied) {
    auto r = mann_whitney_u_test({1.0, 2.0, 2.0, 3.0}, {2.0, 3.0, 4.0, 5.0, 5.0});
    EXPECT_DOUBLE_EQ(r.u_statistic, 2.5);
    EXPECT_NEAR(r.p_value, 0.0785458509511907, 1e-12);
}

TEST_F(MannWhitneyTest, InterleavedGroupsGivePValueOne) {
    auto r = mann_whitney_u_test({10, 20, 30, 40, 50}, {15, 25, 35, 45});
    EXPECT_DOUBLE_EQ(r.u_statistic, 10.0);
    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
}

TEST_F(MannWhitneyTest, AllValuesTiedGivesPValueOne) {
    auto r = mann_whitney_u_test({5.0, 5.0, 5.0}, {5.0, 5.0});
    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
}

TEST_F(MannWhitneyTest, SymmetricUnderGroupSwap) {
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        auto x = make_values(5 + static_cast<int>(seed % 7), seed);
        auto y = make_values(4 + static_cast<int>(seed % 5), seed * 31u + 7u);
        if (seed % 3 == 0) y[0] = x[0];  // introduce a tie

        for (auto method : {MannWhitneyMethod::ASYMPTOTIC, MannWhitneyMethod::AUTO}) {
            auto xy = mann_whitney_u_test(x, y, method);
            auto yx = mann_whitney_u_test(y, x, method);
            EXPECT_DOUBLE_EQ(xy.p_value, yx.p_value) << "seed " << seed;
            EXPECT_DOUBLE_EQ(xy.u_statistic + yx.u_statistic,
                             static_cast<double>(x.size() * y.size()));
        }
    }
}

TEST_F(MannWhitneyTest, EmptyGroupGivesNaN) {
    auto a = mann_whitney_u_test({}, {1.0, 2.0});
    auto b = mann_whitney_u_test({1.0, 2.0}, {});
    auto c = mann_whitney_u_test({}, {});
    EXPECT_TRUE(std::isnan(a.p_value));
    EXPECT_TRUE(std::isnan(b.p_value));
    EXPECT_TRUE(std::isnan(c.p_value));
    EXPECT_TRUE(std::isnan(a.u_statistic));
}

TEST_F(MannWhitneyTest, PValueWithinUnitInterval) {
    for (uint32_t seed = 100; seed < 120; ++seed) {
        auto x = make_values(12, seed);
        auto y = make_values(9, seed + 1000u);
        for (double& v : y) v += 20.0 * static_cast<double>(seed % 3);
        auto r = mann_whitney_u_test(x, y);
        EXPECT_GE(r.p_value, 0.0);
        EXPECT_LE(r.p_value, 1.0);
    }
}

TEST_F(MannWhitneyTest, StrongShiftIsSignificant) {
    auto x = make_values(30, 7);
    auto y = make_values(30, 8);
    for (double& v : y) v += 100.0;
    auto r = mann_whitney_u_test(x, y);
    EXPECT_LT(r.p_value, 1e-6);
}

TEST_F(MannWhitneyTest, ExactSeparatedGroups) {
    // All 20 arrangements of 3+3 are equally likely; U = 9 is the single most extreme.
    auto r = mann_whitney_u_test({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}, MannWhitneyMethod::EXACT);
    EXPECT_NEAR(r.p_value, 0.1, 1e-12);
    EXPECT_EQ(r.method, MannWhitneyMethod::EXACT);
}

TEST_F(MannWhitneyTest, ExactUnequalSizes) {
    // n1 = 2, n2 = 4: 15 arrangements, P(U >= 8) = 1/15
    auto r = mann_whitney_u_test({10.0, 11.0}, {1.0, 2.0, 3.0, 4.0}, MannWhitneyMethod::EXACT);
    EXPECT_DOUBLE_EQ(r.u_statistic, 8.0);
    EXPECT_NEAR(r.p_value, 2.0 / 15.0, 1e-12);
}

TEST_F(MannWhitneyTest, ExactDistributionSumsToOne) {
    EXPECT_NEAR(detail::mann_whitney_exact_sf(0.0, 4, 5), 1.0, 1e-12);
    double below = 1.0 - detail::mann_whitney_exact_sf(11.0, 4, 5);
    double above = detail::mann_whitney_exact_sf(10.0, 4, 5) -
                   detail::mann_whitney_exact_sf(11.0, 4, 5);
    EXPECT_GT(below, 0.0);
    EXPECT_GT(above, 0.0);
}

TEST_F(MannWhitneyTest, AutoPicksExactForSmallUntiedSamples) {
    auto small = mann_whitney_u_test({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}, MannWhitneyMethod::AUTO);
    EXPECT_EQ(small.method, MannWhitneyMethod::EXACT);

    auto tied = mann_whitney_u_test({1.0, 2.0, 4.0}, {4.0, 5.0, 6.0}, MannWhitneyMethod::AUTO);
    EXPECT_EQ(tied.method, MannWhitneyMethod::ASYMPTOTIC);

    auto large = mann_whitney_u_test(make_values(9, 1), make_values(9, 2),
                                     MannWhitneyMethod::AUTO);
    EXPECT_EQ(large.method, MannWhitneyMethod::ASYMPTOTIC);
}

TEST_F(MannWhitneyTest, AutoPicksExactWhenOnlyOneGroupIsSmall) {
    std::vector<double> x = {3.5, 12.5, 15.5, 18.5, 19.5};
    std::vector<double> y;
    for (int i = 1; i <= 20; ++i) y.push_back(i);

    auto r = mann_whitney_u_test(x, y, MannWhitneyMethod::AUTO);
    EXPECT_EQ(r.method, MannWhitneyMethod::EXACT);
    EXPECT_DOUBLE_EQ(r.u_statistic, 67.0);
    EXPECT_NEAR(r.p_value, 0.2717861848296631, 1e-12);

    auto swapped = mann_whitney_u_test(y, x, MannWhitneyMethod::AUTO);
    EXPECT_EQ(swapped.method, MannWhitneyMethod::EXACT);
    EXPECT_DOUBLE_EQ(swapped.p_value, r.p_value);

    auto asymptotic = mann_whitney_u_test(x, y);
    EXPECT_NEAR(asymptotic.p_value, 0.2623073310289476, 1e-12);
}

TEST_F(MannWhitneyTest, ExactDistributionSymmetricInSizes) {
    for (double u : {0.0, 3.0, 7.0, 10.0, 14.0}) {
        EXPECT_NEAR(detail::mann_whitney_exact_sf(u, 2, 7),
                    detail::mann_whitney_exact_sf(u, 7, 2), 1e-15);
    }
}

TEST_F(MannWhitneyTest, ExactFallsBackToAsymptoticAboveSizeCap) {
    auto x = make_values(200, 11);
    auto y = make_values(200, 12);
    ASSERT_FALSE(detail::exact_feasible(x.size(), y.size()));

    auto r = mann_whitney_u_test(x, y, MannWhitneyMethod::EXACT);
    EXPECT_EQ(r.method, MannWhitneyMethod::ASYMPTOTIC);
    EXPECT_DOUBLE_EQ(r.p_value, mann_whitney_u_test(x, y).p_value);

    EXPECT_TRUE(detail::exact_feasible(8, 2500));
    EXPECT_FALSE(detail::exact_feasible(8, 2501));
}

TEST_F(MannWhitneyTest, MethodNamesRoundTrip) {
    for (auto m : {MannWhitneyMethod::ASYMPTOTIC, MannWhitneyMethod::EXACT,
                   MannWhitneyMethod::AUTO}) {
        EXPECT_EQ(parse_method(method_name(m)), m);
    }
    EXPECT_THROW(parse_method("bootstrap"), std::invalid_argument);
}

// ===========================================================================
// Normal distribution helpers
// ===========================================================================

TEST(NormalDistributionTest, TailsAreComplementary) {
    for (double z : {-3.0, -1.0, 0.0, 0.5, 2.0}) {
        EXPECT_NEAR(detail::normal_sf(-z) + detail::normal_sf(z), 1.0, 1e-15);
    }
    EXPECT_DOUBLE_EQ(detail::normal_sf(0.0), 0.5);
    EXPECT_NEAR(detail::normal_sf(1.959963984540054), 0.025, 1e-12);
}
