#include <gtest/gtest.h>
#include "qrank/config.hpp"
#include "qrank/scoring.hpp"

#include <cmath>

using namespace qrank;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static NormalizedFactorSet all_at(const CategoryWeightTable& t, double value) {
    NormalizedFactorSet n;
    for (const auto& [factor, w] : t.factor_weights) {
        n[factor] = value;
    }
    return n;
}

static double weight_sum(const CategoryWeightTable& t) {
    double s = 0.0;
    for (const auto& [factor, w] : t.factor_weights) {
        s += w;
    }
    return s;
}

// ─── score ───────────────────────────────────────────────────────────────────

TEST(WeightedScorer_Score, NeutralUniverse_WeightSumTimesFifty) {
    auto t = default_weight_table();
    WeightedScorer scorer(t, {});
    auto s = scorer.score("600000", all_at(t, 50.0), {});

    EXPECT_EQ(s.stock_id, "600000");
    EXPECT_NEAR(s.total_score, 50.0 * weight_sum(t), 1e-9);
}

TEST(WeightedScorer_Score, DefaultTable_TotalWithinFusionRange) {
    auto t = default_weight_table();
    WeightedScorer scorer(t, {});

    NormalizedFactorSet best  = all_at(t, 100.0);
    NormalizedFactorSet worst = all_at(t, 0.0);
    best["volatility_20d"]  = 0.0;
    worst["volatility_20d"] = 100.0;

    const double hi = scorer.score("hi", best, {}).total_score;
    const double lo = scorer.score("lo", worst, {}).total_score;
    // Extremes of the 0-100 scale stay near ±2 instead of reaching ~100.
    EXPECT_NEAR(hi, 2.06, 1e-9);
    EXPECT_NEAR(lo, -0.1, 1e-9);
}

TEST(WeightedScorer_Score, ResidualIncluded) {
    auto t = default_weight_table();
    WeightedScorer scorer(t, {});
    auto s = scorer.score("X", {{"change_pct", 100.0}}, {});

    ASSERT_EQ(s.breakdown.residual.size(), 1u);
    EXPECT_EQ(s.breakdown.residual[0].factor, "change_pct");
    EXPECT_NEAR(s.breakdown.residual_score, 0.0004 * 100.0, 1e-12);
    EXPECT_NEAR(s.total_score, 0.04, 1e-12);
}

TEST(WeightedScorer_Score, NegativeRiskWeight_LowersScore) {
    auto t = default_weight_table();
    WeightedScorer scorer(t, {});
    auto calm    = scorer.score("A", {{"volatility_20d", 10.0}}, {});
    auto jittery = scorer.score("B", {{"volatility_20d", 90.0}}, {});
    EXPECT_GT(calm.total_score, jittery.total_score);
}

// ─── Additivity ──────────────────────────────────────────────────────────────

TEST(WeightedScorer_Additivity, BreakdownReconstructsTotal) {
    auto t = default_weight_table();
    WeightedScorer scorer(t, default_rationale_rules());

    NormalizedFactorSet n;
    double v = 3.0;
    for (const auto& [factor, w] : t.factor_weights) {
        n[factor] = std::fmod(v, 100.0);
        v *= 1.7;
    }
    auto s = scorer.score("Z", n, {});

    double reconstructed = 0.0;
    for (const auto& c : s.breakdown.categories) {
        double cat = 0.0;
        for (const auto& fc : c.contributions) {
            cat += fc.contribution;
        }
        EXPECT_NEAR(cat, c.sub_score, 1e-12);
        reconstructed += c.sub_score;
    }
    reconstructed += s.breakdown.residual_score;

    EXPECT_NEAR(reconstructed, s.total_score, 1e-9);
    EXPECT_EQ(WeightedScorer::total_score(s.breakdown), s.total_score);
}

TEST(WeightedScorer_Breakdown, SubScoreLookup) {
    auto t = default_weight_table();
    WeightedScorer scorer(t, {});
    auto s = scorer.score("A", {{"momentum_5d", 100.0}}, {});
    EXPECT_NEAR(s.breakdown.sub_score("momentum").value(), 0.2, 1e-12);
    EXPECT_FALSE(s.breakdown.sub_score("no_such_category").has_value());
}

TEST(WeightedScorer_Breakdown, CategoriesInConfiguredOrder) {
    auto t = default_weight_table();
    WeightedScorer scorer(t, {});
    auto s = scorer.score("A", {}, {});
    ASSERT_EQ(s.breakdown.categories.size(), t.categories.size());
    for (std::size_t i = 0; i < t.categories.size(); ++i) {
        EXPECT_EQ(s.breakdown.categories[i].category, t.categories[i].name);
    }
    EXPECT_DOUBLE_EQ(s.total_score, 0.0);
}
