#pragma once

/// @file include/qrank/fusion.hpp
/// @brief FusionEngine: combine the factor score with an ML up-probability.
///
/// # Module: Fusion Engine
///
/// ## Responsibility
/// Combine `total_score` (rule-based, unbounded) with an optional external
/// ML up-probability (in [0, 1]) into a `final_score`, and label the result
/// with confidence, risk and a structured rationale.
///
/// ## Strategies
/// Shared normalization: factor_norm = clip((total + 2) / 4, 0, 1),
///                       ml_norm     = clip(ml, 0, 1)
///
/// - weighted_average: final = ml_weight · ml_norm + factor_weight · factor_norm
///                     (ML absent ⇒ the ML term is dropped)
/// - filter_first:     exclude ml < ml_threshold (or ML absent), then exclude
///                     total < factor_threshold;
///                     final = total + factor_boost · ml
/// - rank_adjustment:  final = total + (ml − 0.5) · 2   (ML absent ⇒ + 0)
/// - consensus_boost:  base = base_weight · ml_norm + base_weight · factor_norm;
///                     + consensus_bonus when the ML and factor signs agree
///                     and both clear their thresholds
///
/// ## Labels
///   ml_strength     = |ml − 0.5| · 2
///   factor_strength = min(|total|, 2) / 2
///   confidence      = signs agree ? mean(strengths) : |ml_s − factor_s|
///   risk            = mean(1 − ml_s, 1 − factor_s), blended with volatility
///
/// ## Guarantees
/// - Every strategy is a pure function of (input, parameters)
/// - Bad input never throws: a stock that cannot be fused is reported as
///   Failed with a reason and the batch carries on. Only allocation
///   failure propagates.
/// - Exclusion (filter_first) is absence from the output, not a low score

#include "qrank/constants.hpp"
#include "qrank/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace qrank {

// ─── Parameters ───────────────────────────────────────────────────────────────

/// Numeric parameters of all strategies. Immutable for a run.
struct FusionParams {
    double ml_weight            = constants::DEFAULT_ML_WEIGHT;
    double factor_weight        = constants::DEFAULT_FACTOR_WEIGHT;
    double ml_threshold         = constants::DEFAULT_ML_THRESHOLD;
    double factor_threshold     = constants::DEFAULT_FACTOR_THRESHOLD;
    double confidence_threshold = constants::DEFAULT_CONFIDENCE_THRESHOLD;
    double risk_threshold       = constants::DEFAULT_RISK_THRESHOLD;
    double consensus_bonus      = constants::DEFAULT_CONSENSUS_BONUS;
    double base_weight          = constants::DEFAULT_BASE_WEIGHT;
    double factor_boost         = constants::DEFAULT_FACTOR_BOOST;
};

/// Strategy selection plus its parameters.
struct FusionConfig {
    FusionMethod method = FusionMethod::WeightedAverage;
    FusionParams params{};
};

// ─── Input / output ───────────────────────────────────────────────────────────

struct FusionInput {
    std::string           stock_id;
    double                total_score = 0.0;
    std::optional<double> ml_probability;  ///< Absent when the model is unavailable
    std::optional<double> volatility;      ///< External, blended into risk
};

/// Rationale label for consensus_boost, chosen by the applied bonus.
enum class ConsensusLabel { HighConsensus, Consensus, Divergent };

[[nodiscard]] std::string_view to_string(ConsensusLabel label) noexcept;

/// Structured explanation of a fusion decision. `render` turns it into text.
struct FusionRationale {
    FusionMethod                  method = FusionMethod::WeightedAverage;
    bool                          ml_available = false;
    std::optional<double>         ml_probability;
    double                        total_score = 0.0;
    ConfidenceLevel               confidence = ConfidenceLevel::Low;
    std::optional<RiskLevel>      risk;
    std::optional<double>         ml_threshold;      ///< filter_first gate passed
    std::optional<double>         adjustment;        ///< rank_adjustment nudge
    std::optional<ConsensusLabel> consensus;         ///< consensus_boost only
    std::optional<double>         applied_bonus;     ///< consensus_boost only
};

/// "ML up-probability 80.0%; factor score 1.20; confidence high, risk low".
[[nodiscard]] std::string render(const FusionRationale& rationale);

/// Fused score of one stock. Immutable once produced.
struct FusionResult {
    std::string                   stock_id;
    double                        final_score = 0.0;
    double                        total_score = 0.0;
    std::optional<double>         ml_probability;
    ConfidenceLevel               confidence_level = ConfidenceLevel::Low;
    std::optional<RiskLevel>      risk_level;       ///< Unset for rank_adjustment
    bool                          consensus_flag = false;
    FusionMethod                  method = FusionMethod::WeightedAverage;
    FusionRationale               rationale;
    std::map<std::string, double> score_detail;
};

/// What happened to one input.
enum class FusionDisposition {
    Fused,     ///< `result` holds a FusionResult
    Excluded,  ///< Filtered out by the strategy; not an error
    Failed,    ///< Input could not be fused (e.g. non-finite total_score)
};

struct FusionOutcome {
    FusionDisposition           disposition = FusionDisposition::Failed;
    std::optional<FusionResult> result;
    std::string                 reason;  ///< Empty when Fused
};

/// Results of fusing a whole Universe.
struct FusionBatch {
    std::vector<FusionResult> results;
    std::size_t               excluded = 0;
    std::size_t               failed   = 0;
};

// ─── Classification ───────────────────────────────────────────────────────────

/// Directional agreement between the two signals.
///   ml_signal     = +1 if ml > 0.5 else −1
///   factor_signal = +1 if total > 0 else −1
[[nodiscard]] bool signs_agree(double ml_probability, double total_score) noexcept;

/// Raw confidence in [0, 1]. ML absent ⇒ factor_strength / 2.
[[nodiscard]] double confidence_score(std::optional<double> ml_probability,
                                      double total_score) noexcept;

/// Raw risk in [0, 1]. ML absent ⇒ ml_strength = 0.
[[nodiscard]] double risk_score(std::optional<double> ml_probability,
                                double total_score,
                                std::optional<double> volatility) noexcept;

[[nodiscard]] ConfidenceLevel classify_confidence(double confidence_raw,
                                                  double confidence_threshold) noexcept;

[[nodiscard]] RiskLevel classify_risk(double risk_raw, double risk_threshold) noexcept;

// ─── FusionEngine ─────────────────────────────────────────────────────────────

/// Applies the configured strategy to each stock.
class FusionEngine {
public:
    explicit FusionEngine(FusionConfig config = FusionConfig{}) noexcept;

    /// Fuse one stock. Invalid input yields a Failed outcome, not an exception.
    [[nodiscard]] FusionOutcome fuse(const FusionInput& input) const;

    /// Fuse every input, skipping exclusions and failures.
    ///
    /// For rank_adjustment the results come back in factor order (total_score
    /// descending, then stock id); for the other strategies in input order.
    [[nodiscard]] FusionBatch fuse_all(std::span<const FusionInput> inputs) const;

    [[nodiscard]] const FusionConfig& config() const noexcept { return config_; }

private:
    FusionConfig config_;
};

}  // namespace qrank
