/// @file src/engine/recommendation_engine.cpp
/// @brief RecommendationEngine: wires the pipeline stages together.

#include "qrank/engine.hpp"
#include "qrank/log.hpp"

#include <map>
#include <set>

namespace qrank {

namespace {

EngineConfig validated(EngineConfig config) {
    config.validate();
    return config;
}

}  // namespace

RecommendationEngine::RecommendationEngine(EngineConfig config)
    : config_(validated(std::move(config)))
    , normalizer_()
    , scorer_(config_.weights, config_.rules)
    , fusion_(config_.fusion)
    , ranker_(config_.ranker)
{}

RunReport RecommendationEngine::run(const Universe&      universe,
                                    const MlPredictions& predictions,
                                    const MetadataMap&   metadata,
                                    Timestamp            generated_at,
                                    const VolatilityMap& volatility) const {
    log::logger()->info("run started: {} stocks, {} ML predictions, method {}",
                        universe.size(), predictions.size(),
                        to_string(config_.fusion.method));

    // ── 1. Normalize ─────────────────────────────────────────────────────────
    const NormalizedUniverse normalized = normalizer_.normalize(universe);

    // ── 2. Score ─────────────────────────────────────────────────────────────
    std::map<std::string, ScoreBreakdown> breakdowns;
    std::vector<FusionInput>              inputs;
    inputs.reserve(normalized.by_stock.size());

    std::set<std::string> seen;
    for (const auto& stock : universe) {
        if (!seen.insert(stock.stock_id).second) {
            continue;
        }
        const auto& factors = normalized.by_stock.at(stock.stock_id);
        StockScore  score   = scorer_.score(stock.stock_id, factors, stock.factors);

        FusionInput in;
        in.stock_id    = stock.stock_id;
        in.total_score = score.total_score;
        if (const auto ml = predictions.find(stock.stock_id); ml != predictions.end()) {
            in.ml_probability = ml->second;
        }
        if (const auto v = volatility.find(stock.stock_id); v != volatility.end()) {
            in.volatility = v->second;
        }
        inputs.push_back(std::move(in));
        breakdowns.emplace(stock.stock_id, std::move(score.breakdown));
    }

    // ── 3. Fuse ──────────────────────────────────────────────────────────────
    FusionBatch batch = fusion_.fuse_all(inputs);

    // ── 4. Rank ──────────────────────────────────────────────────────────────
    std::vector<RankCandidate> candidates;
    candidates.reserve(batch.results.size());
    for (auto& result : batch.results) {
        RankCandidate c;
        if (const auto m = metadata.find(result.stock_id); m != metadata.end()) {
            c.meta = m->second;
        } else {
            log::logger()->debug("no metadata for {}", result.stock_id);
        }
        c.breakdown = breakdowns.at(result.stock_id);
        c.fusion    = std::move(result);
        candidates.push_back(std::move(c));
    }

    RankedList ranked = ranker_.rank(candidates, generated_at);

    RunReport report;
    report.summary = summarize(ranked, config_.fusion.method, batch.failed, batch.excluded);
    report.recommendations = std::move(ranked.recommendations);

    log::logger()->info("run finished: {}", report.summary.to_string());
    return report;
}

}  // namespace qrank
