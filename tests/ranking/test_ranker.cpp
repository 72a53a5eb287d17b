#include <gtest/gtest.h>
#include "qrank/ranking.hpp"

#include <chrono>
#include <limits>
#include <string>
#include <vector>

using namespace qrank;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static RankCandidate candidate(std::string id,
                               double final_score,
                               std::optional<double> ml = 0.7,
                               double total = 1.0,
                               double price = 10.0,
                               double change_pct = 1.0) {
    RankCandidate c;
    c.fusion.stock_id       = id;
    c.fusion.final_score    = final_score;
    c.fusion.total_score    = total;
    c.fusion.ml_probability = ml;
    c.meta = StockMeta{.name = "name-" + id, .last_price = price, .change_pct = change_pct};
    return c;
}

static std::vector<std::string> ids(const RankedList& list) {
    std::vector<std::string> out;
    for (const auto& r : list.recommendations) {
        out.push_back(r.stock_id());
    }
    return out;
}

static const Timestamp kNow = Timestamp{} + std::chrono::hours(24 * 365 * 50);

// ─── Ordering ────────────────────────────────────────────────────────────────

TEST(Ranker_Order, FinalScoreDescending) {
    std::vector<RankCandidate> c{candidate("A", 0.565), candidate("B", 0.8), candidate("C", 0.7)};
    auto out = RecommendationRanker{}.rank(c, kNow);
    EXPECT_EQ(ids(out), (std::vector<std::string>{"B", "C", "A"}));
}

TEST(Ranker_Order, TieBrokenByMlThenId) {
    std::vector<RankCandidate> c{
        candidate("000002", 0.7, 0.7),
        candidate("000001", 0.7, 0.7),
        candidate("000003", 0.7, 0.9),
        candidate("000000", 0.7, std::nullopt),
    };
    auto out = RecommendationRanker{}.rank(c, kNow);
    EXPECT_EQ(ids(out), (std::vector<std::string>{"000003", "000001", "000002", "000000"}));
}

TEST(Ranker_Order, RanksContiguous_TimestampStamped) {
    std::vector<RankCandidate> c;
    for (int i = 0; i < 25; ++i) {
        c.push_back(candidate("S" + std::to_string(i), 0.01 * i));
    }
    auto out = RecommendationRanker{}.rank(c, kNow);
    ASSERT_EQ(out.recommendations.size(), 10u);
    for (std::size_t i = 0; i < out.recommendations.size(); ++i) {
        EXPECT_EQ(out.recommendations[i].rank, i + 1);
        EXPECT_EQ(out.recommendations[i].generated_at, kNow);
    }
    EXPECT_EQ(out.recommendations.front().stock_id(), "S24");
}

// ─── Validity ────────────────────────────────────────────────────────────────

TEST(Ranker_Validity, NonPositiveTotal_Dropped) {
    std::vector<RankCandidate> c{candidate("A", 0.9, 0.7, -0.1), candidate("B", 0.5)};
    auto out = RecommendationRanker{}.rank(c, kNow);
    EXPECT_EQ(ids(out), (std::vector<std::string>{"B"}));
    EXPECT_EQ(out.invalid, 1u);
}

TEST(Ranker_Validity, FinalScoreField) {
    RankerConfig cfg;
    cfg.rules.score_field = ScoreField::FinalScore;
    std::vector<RankCandidate> c{candidate("A", 0.9, 0.7, -0.1), candidate("B", -0.5)};
    auto out = RecommendationRanker{cfg}.rank(c, kNow);
    EXPECT_EQ(ids(out), (std::vector<std::string>{"A"}));
}

TEST(Ranker_Validity, PositivityDisabled) {
    RankerConfig cfg;
    cfg.rules.require_positive_score = false;
    std::vector<RankCandidate> c{candidate("A", 0.9, 0.7, -3.0)};
    EXPECT_EQ(RecommendationRanker{cfg}.rank(c, kNow).recommendations.size(), 1u);
}

TEST(Ranker_Validity, PriceAndChangeRules) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<RankCandidate> c{
        candidate("zero_price", 0.9, 0.7, 1.0, 0.0),
        candidate("nan_price", 0.9, 0.7, 1.0, nan),
        candidate("limit_up", 0.9, 0.7, 1.0, 10.0, 10.0),
        candidate("limit_down", 0.9, 0.7, 1.0, 10.0, -10.02),
        candidate("nan_change", 0.9, 0.7, 1.0, 10.0, nan),
        candidate("ok", 0.1, 0.7, 1.0, 10.0, 9.99),
    };
    auto out = RecommendationRanker{}.rank(c, kNow);
    EXPECT_EQ(ids(out), (std::vector<std::string>{"ok"}));
    EXPECT_EQ(out.invalid, 5u);
}

TEST(Ranker_Validity, NonFiniteFinal_Dropped) {
    std::vector<RankCandidate> c{
        candidate("A", std::numeric_limits<double>::infinity()),
    };
    auto out = RecommendationRanker{}.rank(c, kNow);
    EXPECT_TRUE(out.recommendations.empty());
}

// ─── Dedupe / truncation ─────────────────────────────────────────────────────

TEST(Ranker_Dedupe, BestOccurrenceWins) {
    std::vector<RankCandidate> c{candidate("A", 0.3), candidate("B", 0.5), candidate("A", 0.9)};
    auto out = RecommendationRanker{}.rank(c, kNow);
    EXPECT_EQ(ids(out), (std::vector<std::string>{"A", "B"}));
    EXPECT_DOUBLE_EQ(out.recommendations[0].fusion.final_score, 0.9);
    EXPECT_EQ(out.duplicates, 1u);
}

TEST(Ranker_Truncate, TopN) {
    RankerConfig cfg;
    cfg.top_n = 2;
    std::vector<RankCandidate> c{candidate("A", 0.3), candidate("B", 0.5), candidate("C", 0.4)};
    auto out = RecommendationRanker{cfg}.rank(c, kNow);
    EXPECT_EQ(ids(out), (std::vector<std::string>{"B", "C"}));
}

TEST(Ranker_Empty, NoCandidates_EmptyList) {
    std::vector<RankCandidate> c;
    auto out = RecommendationRanker{}.rank(c, kNow);
    EXPECT_TRUE(out.recommendations.empty());
    EXPECT_EQ(out.invalid, 0u);
}

// ─── Rendering ───────────────────────────────────────────────────────────────

TEST(Ranker_Render, RecommendationToString) {
    auto c = candidate("600519", 0.8123, 0.8, 1.2);
    c.fusion.confidence_level = ConfidenceLevel::High;
    c.fusion.risk_level       = RiskLevel::Low;
    std::vector<RankCandidate> in{c};
    auto out = RecommendationRanker{}.rank(in, kNow);
    ASSERT_EQ(out.recommendations.size(), 1u);

    const auto text = out.recommendations[0].to_string();
    EXPECT_EQ(text.rfind("#1 600519 name-600519 final=0.8123 total=1.2000 ml=80.0% conf=high risk=low", 0),
              0u);
}

TEST(Ranker_ScoreField, Parse) {
    EXPECT_EQ(parse_score_field("total_score"), ScoreField::TotalScore);
    EXPECT_EQ(parse_score_field("final_score"), ScoreField::FinalScore);
    EXPECT_FALSE(parse_score_field("score").has_value());
}
