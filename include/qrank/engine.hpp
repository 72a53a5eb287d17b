#pragma once

/// @file include/qrank/engine.hpp
/// @brief RecommendationEngine: normalize, score, fuse and rank in one call.
///
/// # Module: Recommendation Engine
///
/// ## Pipeline
///   Universe ──► FactorNormalizer ──► WeightedScorer ──► FusionEngine
///            ──► RecommendationRanker ──► RunReport
///
/// ## Guarantees
/// - Configuration is validated in the constructor; `run` never throws
///   ConfigError and never fails because of a single bad stock
/// - `run` is const and holds no per-run state, so concurrent runs with
///   different Universes do not interfere

#include "qrank/config.hpp"
#include "qrank/fusion.hpp"
#include "qrank/normalizer.hpp"
#include "qrank/ranking.hpp"
#include "qrank/scoring.hpp"
#include "qrank/types.hpp"

#include <vector>

namespace qrank {

/// Output of one run.
struct RunReport {
    std::vector<Recommendation> recommendations;
    RunSummary                  summary;
};

class RecommendationEngine {
public:
    /// Validate `config`. The "qrank" logger level is process-wide and is
    /// left to the host (see log::set_level).
    ///
    /// # Errors
    /// ConfigError when any setting is invalid.
    explicit RecommendationEngine(EngineConfig config);

    /// Produce the ranked recommendation list for one Universe.
    ///
    /// # Arguments
    /// * `universe`     - Raw factors per stock.
    /// * `predictions`  - ML up-probability per stock id; stocks without one
    ///                    are fused with ML unavailable.
    /// * `metadata`     - Name, price and change per stock id; stocks without
    ///                    metadata fail the price rule and are dropped.
    /// * `generated_at` - Timestamp stamped on every Recommendation.
    /// * `volatility`   - Optional external volatility per stock id.
    [[nodiscard]] RunReport run(const Universe&      universe,
                                const MlPredictions& predictions,
                                const MetadataMap&   metadata,
                                Timestamp            generated_at,
                                const VolatilityMap& volatility = {}) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig         config_;
    FactorNormalizer     normalizer_;
    WeightedScorer       scorer_;
    FusionEngine         fusion_;
    RecommendationRanker ranker_;
};

}  // namespace qrank
