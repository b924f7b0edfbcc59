// multiple_comparison_test.cpp — Benjamini-Hochberg step-up correction
//
// Tests for:
//   - the worked example [0.01, 0.02, 0.03, 0.50]
//   - original order preserved, monotone in rank order, adjusted >= raw, [0,1]
//   - determinism and permutation equivariance
//   - NaN entries excluded from n and re-inserted as NaN
//   - significance never granted to a NaN adjusted value

#include <gtest/gtest.h>

#include "analysis/multiple_comparison.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <vector>

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

std::vector<double> make_pvalues(int n, uint32_t seed) {
    std::vector<double> v(n);
    uint32_t state = seed;
    for (int i = 0; i < n; ++i) {
        state = state * 1664525u + 1013904223u;
        double u = static_cast<double>(state >> 8) / 16777216.0;
        v[i] = u * u;  // skew toward small p-values
    }
    return v;
}

}  // anonymous namespace

class BenjaminiHochbergTest : public ::testing::Test {};

TEST_F(BenjaminiHochbergTest, WorkedExample) {
    auto adj = benjamini_hochberg_correct({0.01, 0.02, 0.03, 0.50});
    ASSERT_EQ(adj.size(), 4u);
    EXPECT_NEAR(adj[0], 0.04, 1e-12);
    EXPECT_NEAR(adj[1], 0.04, 1e-12);
    EXPECT_NEAR(adj[2], 0.04, 1e-12);
    EXPECT_NEAR(adj[3], 0.50, 1e-12);
}

TEST_F(BenjaminiHochbergTest, WorkedExampleInShuffledOrder) {
    auto adj = benjamini_hochberg_correct({0.50, 0.03, 0.01, 0.02});
    EXPECT_NEAR(adj[0], 0.50, 1e-12);
    EXPECT_NEAR(adj[1], 0.04, 1e-12);
    EXPECT_NEAR(adj[2], 0.04, 1e-12);
    EXPECT_NEAR(adj[3], 0.04, 1e-12);
}

TEST_F(BenjaminiHochbergTest, StepUpWithoutMonotoneCap) {
    // 0.01*3/1 = 0.03, 0.04*3/2 = 0.06, 0.045*3/3 = 0.045 -> running min from top
    auto adj = benjamini_hochberg_correct({0.01, 0.04, 0.045});
    EXPECT_NEAR(adj[0], 0.03, 1e-12);
    EXPECT_NEAR(adj[1], 0.045, 1e-12);
    EXPECT_NEAR(adj[2], 0.045, 1e-12);
}

TEST_F(BenjaminiHochbergTest, EmptyAndSingle) {
    EXPECT_TRUE(benjamini_hochberg_correct({}).empty());
    auto one = benjamini_hochberg_correct({0.2});
    ASSERT_EQ(one.size(), 1u);
    EXPECT_DOUBLE_EQ(one[0], 0.2);
}

TEST_F(BenjaminiHochbergTest, ClippedToOne) {
    auto adj = benjamini_hochberg_correct({0.9, 0.95, 1.0, 0.99});
    for (double v : adj) EXPECT_LE(v, 1.0);
    EXPECT_DOUBLE_EQ(adj[2], 1.0);
}

TEST_F(BenjaminiHochbergTest, PropertiesOnRandomInputs) {
    for (uint32_t seed = 1; seed <= 25; ++seed) {
        int n = 1 + static_cast<int>(seed % 17);
        auto raw = make_pvalues(n, seed);
        auto adj = benjamini_hochberg_correct(raw);
        ASSERT_EQ(adj.size(), raw.size());

        std::vector<size_t> order(raw.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&](size_t a, size_t b) { return raw[a] < raw[b]; });

        for (size_t i = 0; i < raw.size(); ++i) {
            EXPECT_GE(adj[i], raw[i] - 1e-15);
            EXPECT_GE(adj[i], 0.0);
            EXPECT_LE(adj[i], 1.0);
        }
        // Non-decreasing with rank (equivalently non-increasing reading from the top).
        for (size_t k = 1; k < order.size(); ++k) {
            EXPECT_LE(adj[order[k - 1]], adj[order[k]] + 1e-15);
        }
    }
}

TEST_F(BenjaminiHochbergTest, DeterministicAndPermutationEquivariant) {
    auto raw = make_pvalues(12, 99);
    auto first = benjamini_hochberg_correct(raw);
    auto second = benjamini_hochberg_correct(raw);
    EXPECT_EQ(first, second);

    // Re-sorting the input re-sorts the output identically.
    std::vector<size_t> perm(raw.size());
    std::iota(perm.begin(), perm.end(), 0);
    std::reverse(perm.begin(), perm.end());
    std::rotate(perm.begin(), perm.begin() + 5, perm.end());

    std::vector<double> shuffled(raw.size());
    for (size_t i = 0; i < perm.size(); ++i) shuffled[i] = raw[perm[i]];
    auto adj_shuffled = benjamini_hochberg_correct(shuffled);
    for (size_t i = 0; i < perm.size(); ++i) {
        EXPECT_DOUBLE_EQ(adj_shuffled[i], first[perm[i]]);
    }
}

TEST_F(BenjaminiHochbergTest, RepeatedCorrectionOfSameInputIsStable) {
    std::vector<double> raw = {0.04, 0.04, 0.04, 0.5};
    auto adj = benjamini_hochberg_correct(raw);
    for (int i = 0; i < 3; ++i) EXPECT_NEAR(adj[i], 0.04 * 4.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(adj[3], 0.5);
    EXPECT_EQ(benjamini_hochberg_correct(raw), adj);

    // Adjusted values are not a fixed point of the correction.
    auto twice = benjamini_hochberg_correct(adj);
    EXPECT_NEAR(twice[0], 0.04 * 16.0 / 9.0, 1e-12);
    EXPECT_GT(twice[0], adj[0]);
}

TEST_F(BenjaminiHochbergTest, TiedPValuesAdjustEqually) {
    auto adj = benjamini_hochberg_correct({0.02, 0.02, 0.02, 0.02});
    for (double v : adj) EXPECT_NEAR(v, 0.02, 1e-15);
}

TEST_F(BenjaminiHochbergTest, NaNExcludedFromCount) {
    // With NaN excluded, n = 4 and the worked example is unchanged.
    auto adj = benjamini_hochberg_correct({0.01, NaN, 0.02, 0.03, NaN, 0.50});
    ASSERT_EQ(adj.size(), 6u);
    EXPECT_NEAR(adj[0], 0.04, 1e-12);
    EXPECT_TRUE(std::isnan(adj[1]));
    EXPECT_NEAR(adj[2], 0.04, 1e-12);
    EXPECT_NEAR(adj[3], 0.04, 1e-12);
    EXPECT_TRUE(std::isnan(adj[4]));
    EXPECT_NEAR(adj[5], 0.50, 1e-12);
}

TEST_F(BenjaminiHochbergTest, AllNaN) {
    auto adj = benjamini_hochberg_correct({NaN, NaN, NaN});
    ASSERT_EQ(adj.size(), 3u);
    for (double v : adj) EXPECT_TRUE(std::isnan(v));
}

TEST_F(BenjaminiHochbergTest, SignificanceThreshold) {
    EXPECT_TRUE(is_significant(0.049, 0.05));
    EXPECT_FALSE(is_significant(0.05, 0.05));
    EXPECT_FALSE(is_significant(0.2, 0.05));
    EXPECT_FALSE(is_significant(NaN, 0.05));
    EXPECT_TRUE(is_significant(0.09, 0.1));
}
