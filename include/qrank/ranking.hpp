#pragma once

/// @file include/qrank/ranking.hpp
/// @brief RecommendationRanker and RunSummary: the final ordered list.
///
/// # Module: Recommendation Ranker
///
/// ## Responsibility
/// Filter fused results through tradability rules, order them, drop
/// duplicates, truncate to top_n and assign contiguous 1-based ranks.
///
/// ## Ordering
///   1. final_score      descending
///   2. ml_probability   descending (absent after present)
///   3. stock_id         ascending
///
/// ## Validity
/// A candidate is kept when:
///   - the configured score field is finite (and > 0 when required)
///   - final_score is finite
///   - last_price is finite and > 0
///   - change_pct is finite and |change_pct| < max_abs_change_pct
///
/// ## Guarantees
/// - Ranks are exactly 1..n with no gaps
/// - Each stock_id appears at most once
/// - The returned list is never mutated afterwards

#include "qrank/constants.hpp"
#include "qrank/fusion.hpp"
#include "qrank/scoring.hpp"
#include "qrank/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qrank {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Score checked by the positivity rule.
enum class ScoreField { TotalScore, FinalScore };

[[nodiscard]] std::string_view to_string(ScoreField field) noexcept;

[[nodiscard]] std::optional<ScoreField> parse_score_field(std::string_view name) noexcept;

struct ValidityRules {
    ScoreField score_field            = ScoreField::TotalScore;
    bool       require_positive_score = true;
    double     max_abs_change_pct     = constants::DEFAULT_MAX_ABS_CHANGE_PCT;
};

struct RankerConfig {
    std::size_t   top_n = constants::DEFAULT_TOP_N;
    ValidityRules rules{};
};

// ─── Records ──────────────────────────────────────────────────────────────────

/// One stock entering the ranker.
struct RankCandidate {
    FusionResult   fusion;
    StockMeta      meta;
    ScoreBreakdown breakdown;
};

using Timestamp = std::chrono::system_clock::time_point;

/// A ranked, validated recommendation.
struct Recommendation {
    std::size_t    rank = 0;  ///< 1-based
    FusionResult   fusion;
    ScoreBreakdown breakdown;
    StockMeta      meta;
    std::string    rationale;  ///< Fusion rationale followed by category notes
    Timestamp      generated_at{};

    [[nodiscard]] const std::string& stock_id() const noexcept { return fusion.stock_id; }

    /// "#1 600519 Kweichow final=0.8120 total=1.2000 ml=80.0% conf=high risk=low | ..."
    [[nodiscard]] std::string to_string() const;
};

struct RankedList {
    std::vector<Recommendation> recommendations;
    std::size_t                 invalid    = 0;  ///< Failed a validity rule
    std::size_t                 duplicates = 0;  ///< Repeated stock_id
};

/// Full human-readable rationale: fusion rationale plus non-empty category notes.
[[nodiscard]] std::string compose_rationale(const FusionResult&   fusion,
                                            const ScoreBreakdown& breakdown);

// ─── RecommendationRanker ─────────────────────────────────────────────────────

class RecommendationRanker {
public:
    explicit RecommendationRanker(RankerConfig config = RankerConfig{}) noexcept;

    /// True when `candidate` passes every validity rule.
    [[nodiscard]] bool is_valid(const RankCandidate& candidate) const noexcept;

    /// Strict ordering used for ranking (final desc, ml desc, id asc).
    [[nodiscard]] static bool ranks_before(const FusionResult& a,
                                           const FusionResult& b) noexcept;

    /// Validate, sort, deduplicate, truncate and number the candidates.
    ///
    /// # Arguments
    /// * `candidates`   - Fused stocks with their metadata and breakdown.
    /// * `generated_at` - Timestamp stamped on every Recommendation.
    ///
    /// # Returns
    /// At most `top_n` recommendations ranked 1..n, plus drop counts.
    [[nodiscard]] RankedList rank(std::span<const RankCandidate> candidates,
                                  Timestamp                      generated_at) const;

    [[nodiscard]] const RankerConfig& config() const noexcept { return config_; }

private:
    RankerConfig config_;
};

// ─── RunSummary ───────────────────────────────────────────────────────────────

/// Aggregate view of one run.
struct RunSummary {
    FusionMethod          method = FusionMethod::WeightedAverage;
    std::size_t           count  = 0;
    double                avg_final = 0.0;
    double                avg_total = 0.0;
    std::optional<double> avg_ml;  ///< Over recommendations that carry ML
    double                min_final = 0.0;
    double                max_final = 0.0;
    std::map<ConfidenceLevel, std::size_t> confidence_counts;
    std::map<RiskLevel, std::size_t>       risk_counts;
    std::size_t           high_confidence = 0;
    std::size_t           low_risk        = 0;
    std::size_t           skipped  = 0;  ///< Fusion failures
    std::size_t           excluded = 0;  ///< Strategy exclusions
    std::size_t           invalid  = 0;  ///< Validity-rule drops

    [[nodiscard]] std::string to_string() const;
};

/// Build a RunSummary from a ranked list and the upstream drop counts.
[[nodiscard]] RunSummary summarize(const RankedList& ranked,
                                   FusionMethod      method,
                                   std::size_t       skipped,
                                   std::size_t       excluded);

}  // namespace qrank
