#include <gtest/gtest.h>
#include "qrank/constants.hpp"
#include "qrank/statistics.hpp"
#include "qrank/types.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace qrank;
using namespace qrank::stats;

static constexpr double kInf = std::numeric_limits<double>::infinity();
static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// ─── is_valid ────────────────────────────────────────────────────────────────

TEST(Stats_IsValid, Missing_False) {
    EXPECT_FALSE(is_valid(FactorValue{}));
}

TEST(Stats_IsValid, NonFinite_False) {
    EXPECT_FALSE(is_valid(FactorValue{kNaN}));
    EXPECT_FALSE(is_valid(FactorValue{kInf}));
    EXPECT_FALSE(is_valid(FactorValue{-kInf}));
}

TEST(Stats_IsValid, Zero_True) {
    EXPECT_TRUE(is_valid(FactorValue{0.0}));
}

// ─── cross_sectional_stats ───────────────────────────────────────────────────

TEST(Stats_CrossSectional, Empty_Nullopt) {
    std::vector<double> v;
    EXPECT_FALSE(cross_sectional_stats(v).has_value());
}

TEST(Stats_CrossSectional, PopulationStddev) {
    std::vector<double> v{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    auto s = cross_sectional_stats(v);
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->mean, 5.0);
    EXPECT_DOUBLE_EQ(s->stddev, 2.0);
    EXPECT_EQ(s->count, 8u);
    EXPECT_FALSE(s->flat);
}

TEST(Stats_CrossSectional, SingleValue_Flat) {
    std::vector<double> v{42.0};
    auto s = cross_sectional_stats(v);
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->stddev, 0.0);
    EXPECT_TRUE(s->flat);
}

TEST(Stats_CrossSectional, IdenticalValues_Flat) {
    std::vector<double> v(37, 0.1);
    auto s = cross_sectional_stats(v);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->flat);
}

// ─── clipped_zscore / rescale_zscore ─────────────────────────────────────────

TEST(Stats_ZScore, FlatStats_Zero) {
    FactorStats s{.mean = 3.0, .stddev = 0.0, .count = 4, .flat = true};
    EXPECT_DOUBLE_EQ(clipped_zscore(10.0, s), 0.0);
}

TEST(Stats_ZScore, ClippedAtThree) {
    FactorStats s{.mean = 0.0, .stddev = 1.0, .count = 10, .flat = false};
    EXPECT_DOUBLE_EQ(clipped_zscore(10.0, s), constants::Z_CLIP);
    EXPECT_DOUBLE_EQ(clipped_zscore(-10.0, s), -constants::Z_CLIP);
    EXPECT_DOUBLE_EQ(clipped_zscore(1.5, s), 1.5);
}

TEST(Stats_Rescale, Endpoints) {
    EXPECT_DOUBLE_EQ(rescale_zscore(-3.0), 0.0);
    EXPECT_DOUBLE_EQ(rescale_zscore(0.0), 50.0);
    EXPECT_DOUBLE_EQ(rescale_zscore(3.0), 100.0);
    EXPECT_DOUBLE_EQ(rescale_zscore(99.0), 100.0);
}

// ─── normalize_value ─────────────────────────────────────────────────────────

TEST(Stats_NormalizeValue, Invalid_Neutral) {
    FactorStats s{.mean = 0.0, .stddev = 1.0, .count = 10, .flat = false};
    EXPECT_DOUBLE_EQ(normalize_value(FactorValue{}, s), constants::NEUTRAL_SCORE);
    EXPECT_DOUBLE_EQ(normalize_value(FactorValue{kNaN}, s), constants::NEUTRAL_SCORE);
}

TEST(Stats_NormalizeValue, NoObservations_Neutral) {
    EXPECT_DOUBLE_EQ(normalize_value(FactorValue{5.0}, FactorStats{}), constants::NEUTRAL_SCORE);
}

TEST(Stats_NormalizeValue, OneSigmaAbove) {
    FactorStats s{.mean = 10.0, .stddev = 2.0, .count = 10, .flat = false};
    // z = 1 → (1 + 3) · 100 / 6
    EXPECT_NEAR(normalize_value(FactorValue{12.0}, s), 400.0 / 6.0, 1e-12);
}
