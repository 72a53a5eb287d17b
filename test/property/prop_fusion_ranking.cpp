/**
 * @file  prop_fusion_ranking.cpp
 * @brief Properties of fusion and ranking over random candidate sets.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_fusion_ranking
 *
 *   1. filter_first never emits a stock with ml < ml_threshold
 *   2. Ranks are exactly 1..n with unique stock ids
 *   3. Ranking is deterministic
 *   4. Without any ML input, weighted_average and consensus_boost fuse
 *      every stock and rank in total_score order (ties by stock id)
 *   5. The same holds end to end with the built-in configuration
 */

#include <rapidcheck.h>
#include <chrono>
#include <set>
#include <string>
#include <vector>

#include "qrank/config.hpp"
#include "qrank/engine.hpp"
#include "qrank/fusion.hpp"
#include "qrank/log.hpp"
#include "qrank/ranking.hpp"

using namespace qrank;

static std::vector<FusionInput> random_inputs(bool with_ml) {
    const auto n = *rc::gen::inRange<std::size_t>(0, 40);
    std::vector<FusionInput> in;
    in.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        FusionInput x;
        // Small id space so duplicates occur.
        x.stock_id    = "S" + std::to_string(*rc::gen::inRange(0, 25));
        x.total_score = *rc::gen::inRange(-4000, 4000) / 1000.0;
        if (with_ml && *rc::gen::inRange(0, 5) != 0) {
            x.ml_probability = *rc::gen::inRange(0, 1001) / 1000.0;
        }
        in.push_back(std::move(x));
    }
    return in;
}

/// Unique ids, totals inside the fusion range, no ML.
static std::vector<FusionInput> factor_only_inputs() {
    const auto n = *rc::gen::inRange<std::size_t>(2, 40);
    std::vector<FusionInput> in(n);
    for (std::size_t i = 0; i < n; ++i) {
        in[i].stock_id    = "S" + std::to_string(i);
        in[i].total_score = *rc::gen::inRange(-2000, 2001) / 1000.0;
    }
    return in;
}

static bool in_factor_order(const Recommendation& a, const Recommendation& b) {
    if (a.fusion.total_score != b.fusion.total_score) {
        return a.fusion.total_score > b.fusion.total_score;
    }
    return a.stock_id() < b.stock_id();
}

static std::vector<RankCandidate> to_candidates(const FusionBatch& batch) {
    std::vector<RankCandidate> out;
    for (const auto& r : batch.results) {
        RankCandidate c;
        c.fusion = r;
        c.meta   = StockMeta{.name = r.stock_id, .last_price = 10.0, .change_pct = 0.0};
        out.push_back(std::move(c));
    }
    return out;
}

int main() {
    qrank::log::set_level("warn");
    const Timestamp now{};

    // ── Property 1: filter_first exclusivity ─────────────────────────────────
    rc::check(
        "fusion: filter_first never emits ml below threshold",
        []() {
            FusionConfig cfg{.method = FusionMethod::FilterFirst};
            cfg.params.ml_threshold = *rc::gen::inRange(0, 101) / 100.0;
            const auto batch = FusionEngine(cfg).fuse_all(random_inputs(true));
            for (const auto& r : batch.results) {
                RC_ASSERT(r.ml_probability.has_value());
                RC_ASSERT(*r.ml_probability >= cfg.params.ml_threshold);
                RC_ASSERT(r.total_score >= cfg.params.factor_threshold);
            }
        }
    );

    // ── Property 2: rank contiguity and uniqueness ───────────────────────────
    rc::check(
        "ranking: ranks are 1..n with unique ids",
        [now]() {
            const auto method = *rc::gen::element(FusionMethod::WeightedAverage,
                                                  FusionMethod::FilterFirst,
                                                  FusionMethod::RankAdjustment,
                                                  FusionMethod::ConsensusBoost);
            const auto batch = FusionEngine(FusionConfig{.method = method})
                                   .fuse_all(random_inputs(true));
            RankerConfig rc_cfg;
            rc_cfg.top_n = *rc::gen::inRange<std::size_t>(1, 30);
            const auto ranked = RecommendationRanker(rc_cfg).rank(to_candidates(batch), now);

            RC_ASSERT(ranked.recommendations.size() <= rc_cfg.top_n);
            std::set<std::string> ids;
            for (std::size_t i = 0; i < ranked.recommendations.size(); ++i) {
                RC_ASSERT(ranked.recommendations[i].rank == i + 1);
                RC_ASSERT(ids.insert(ranked.recommendations[i].stock_id()).second);
                if (i > 0) {
                    RC_ASSERT(ranked.recommendations[i - 1].fusion.final_score
                              >= ranked.recommendations[i].fusion.final_score);
                }
            }
        }
    );

    // ── Property 3: determinism ──────────────────────────────────────────────
    rc::check(
        "ranking: identical inputs give identical output",
        [now]() {
            const auto inputs = random_inputs(true);
            const FusionEngine engine(FusionConfig{.method = FusionMethod::ConsensusBoost});
            const RecommendationRanker ranker;

            const auto a = ranker.rank(to_candidates(engine.fuse_all(inputs)), now);
            const auto b = ranker.rank(to_candidates(engine.fuse_all(inputs)), now);
            RC_ASSERT(a.recommendations.size() == b.recommendations.size());
            for (std::size_t i = 0; i < a.recommendations.size(); ++i) {
                RC_ASSERT(a.recommendations[i].to_string() == b.recommendations[i].to_string());
            }
        }
    );

    // ── Property 4: missing-ML degradation ───────────────────────────────────
    rc::check(
        "fusion: without ML, ranking follows total_score",
        [now]() {
            const auto inputs = factor_only_inputs();
            RankerConfig rc_cfg;
            rc_cfg.top_n = inputs.size();
            rc_cfg.rules.require_positive_score = false;

            for (auto method : {FusionMethod::WeightedAverage, FusionMethod::ConsensusBoost}) {
                const auto batch = FusionEngine(FusionConfig{.method = method}).fuse_all(inputs);
                RC_ASSERT(batch.results.size() == inputs.size());
                RC_ASSERT(batch.excluded == 0u);
                RC_ASSERT(batch.failed == 0u);

                const auto ranked = RecommendationRanker(rc_cfg).rank(to_candidates(batch), now);
                RC_ASSERT(ranked.recommendations.size() == inputs.size());
                for (std::size_t i = 1; i < ranked.recommendations.size(); ++i) {
                    RC_ASSERT(in_factor_order(ranked.recommendations[i - 1],
                                              ranked.recommendations[i]));
                }
            }
        }
    );

    // ── Property 5: built-in configuration, whole engine ─────────────────────
    rc::check(
        "engine: default config without ML ranks by total_score",
        [now]() {
            const auto weights = default_weight_table();
            // At most 6 stocks keeps |z| < 3, well inside the fusion range.
            const auto n = *rc::gen::inRange<std::size_t>(2, 7);

            Universe    u;
            MetadataMap meta;
            for (std::size_t i = 0; i < n; ++i) {
                StockFactors s;
                s.stock_id = "S" + std::to_string(i);
                for (const auto& [factor, w] : weights.factor_weights) {
                    s.factors[factor] = *rc::gen::inRange(-100, 101) / 10.0;
                }
                meta[s.stock_id] = StockMeta{.name = s.stock_id, .last_price = 10.0,
                                             .change_pct = 0.0};
                u.push_back(std::move(s));
            }

            for (auto method : {FusionMethod::WeightedAverage, FusionMethod::ConsensusBoost}) {
                auto cfg = default_engine_config();
                cfg.fusion.method = method;
                const auto report = RecommendationEngine(cfg).run(u, {}, meta, now);

                RC_ASSERT(report.recommendations.size() == n);
                for (std::size_t i = 0; i < n; ++i) {
                    RC_ASSERT(report.recommendations[i].fusion.score_detail.at("factor_normalized")
                              < 1.0);
                    if (i > 0) {
                        RC_ASSERT(in_factor_order(report.recommendations[i - 1],
                                                  report.recommendations[i]));
                    }
                }
            }
        }
    );

    return 0;
}
