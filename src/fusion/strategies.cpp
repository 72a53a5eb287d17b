/// @file src/fusion/strategies.cpp
/// @brief weighted_average, filter_first, rank_adjustment, consensus_boost.

#include "strategies.hpp"

#include "qrank/statistics.hpp"

#include <fmt/format.h>

namespace qrank::detail {

namespace {

/// Fields shared by every strategy: identity, inputs, confidence, consensus.
FusionResult make_result(const FusionInput&  input,
                         const FusionParams& params,
                         FusionMethod        method) {
    const double confidence_raw = confidence_score(input.ml_probability, input.total_score);

    FusionResult r;
    r.stock_id         = input.stock_id;
    r.total_score      = input.total_score;
    r.ml_probability   = input.ml_probability;
    r.confidence_level = classify_confidence(confidence_raw, params.confidence_threshold);
    r.consensus_flag   = input.ml_probability.has_value()
                      && signs_agree(*input.ml_probability, input.total_score);
    r.method           = method;

    r.rationale.method         = method;
    r.rationale.ml_available   = input.ml_probability.has_value();
    r.rationale.ml_probability = input.ml_probability;
    r.rationale.total_score    = input.total_score;
    r.rationale.confidence     = r.confidence_level;

    r.score_detail["confidence_raw"] = confidence_raw;
    return r;
}

void attach_risk(FusionResult& r, const FusionInput& input, const FusionParams& params) {
    const double risk_raw = risk_score(input.ml_probability, input.total_score, input.volatility);
    r.risk_level           = classify_risk(risk_raw, params.risk_threshold);
    r.rationale.risk       = r.risk_level;
    r.score_detail["risk_raw"] = risk_raw;
}

FusionOutcome fused(FusionResult r) {
    return FusionOutcome{
        .disposition = FusionDisposition::Fused,
        .result      = std::move(r),
        .reason      = {},
    };
}

FusionOutcome excluded(std::string reason) {
    return FusionOutcome{
        .disposition = FusionDisposition::Excluded,
        .result      = std::nullopt,
        .reason      = std::move(reason),
    };
}

}  // namespace

// ─── Shared normalization ─────────────────────────────────────────────────────

double factor_norm(double total_score) noexcept {
    return stats::clip((total_score + constants::FACTOR_SCORE_HALF_RANGE)
                           / (2.0 * constants::FACTOR_SCORE_HALF_RANGE),
                       0.0, 1.0);
}

double ml_norm(double ml_probability) noexcept {
    return stats::clip(ml_probability, 0.0, 1.0);
}

// ─── weighted_average ─────────────────────────────────────────────────────────

FusionOutcome weighted_average(const FusionInput&  input,
                               const FusionParams& params) {
    FusionResult r = make_result(input, params, FusionMethod::WeightedAverage);

    const double fn = factor_norm(input.total_score);
    r.final_score = params.factor_weight * fn;
    if (input.ml_probability) {
        const double mn = ml_norm(*input.ml_probability);
        r.final_score += params.ml_weight * mn;
        r.score_detail["ml_normalized"] = mn;
    }

    r.score_detail["factor_normalized"] = fn;
    r.score_detail["ml_weight"]         = params.ml_weight;
    r.score_detail["factor_weight"]     = params.factor_weight;

    attach_risk(r, input, params);
    return fused(std::move(r));
}

// ─── filter_first ─────────────────────────────────────────────────────────────

FusionOutcome filter_first(const FusionInput&  input,
                           const FusionParams& params) {
    if (!input.ml_probability) {
        return excluded("no ML probability");
    }
    const double ml = *input.ml_probability;
    if (ml < params.ml_threshold) {
        return excluded(fmt::format("ML probability {:.3f} below threshold {:.3f}",
                                    ml, params.ml_threshold));
    }
    if (input.total_score < params.factor_threshold) {
        return excluded(fmt::format("total_score {:.3f} below threshold {:.3f}",
                                    input.total_score, params.factor_threshold));
    }

    FusionResult r = make_result(input, params, FusionMethod::FilterFirst);
    r.final_score            = input.total_score + params.factor_boost * ml;
    r.rationale.ml_threshold = params.ml_threshold;

    r.score_detail["ml_threshold"]     = params.ml_threshold;
    r.score_detail["factor_threshold"] = params.factor_threshold;
    r.score_detail["factor_boost"]     = params.factor_boost;
    r.score_detail["ml_boost"]         = params.factor_boost * ml;

    attach_risk(r, input, params);
    return fused(std::move(r));
}

// ─── rank_adjustment ──────────────────────────────────────────────────────────

FusionOutcome rank_adjustment(const FusionInput&  input,
                              const FusionParams& params) {
    FusionResult r = make_result(input, params, FusionMethod::RankAdjustment);

    const double adjustment = input.ml_probability
        ? (*input.ml_probability - constants::ML_NEUTRAL_PROBABILITY) * 2.0
        : 0.0;
    r.final_score          = input.total_score + adjustment;
    r.rationale.adjustment = adjustment;

    r.score_detail["base_score"] = input.total_score;
    r.score_detail["adjustment"] = adjustment;
    return fused(std::move(r));
}

// ─── consensus_boost ──────────────────────────────────────────────────────────

FusionOutcome consensus_boost(const FusionInput&  input,
                              const FusionParams& params) {
    FusionResult r = make_result(input, params, FusionMethod::ConsensusBoost);

    const double fn = factor_norm(input.total_score);
    double base = params.base_weight * fn;
    double bonus = 0.0;
    if (input.ml_probability) {
        const double ml = *input.ml_probability;
        const double mn = ml_norm(ml);
        base += params.base_weight * mn;
        r.score_detail["ml_normalized"] = mn;

        if (r.consensus_flag
            && ml >= params.ml_threshold
            && input.total_score >= params.factor_threshold) {
            bonus = params.consensus_bonus;
        }
    }
    r.final_score = base + bonus;

    if (bonus > constants::HIGH_CONSENSUS_BONUS) {
        r.rationale.consensus = ConsensusLabel::HighConsensus;
    } else if (bonus > 0.0) {
        r.rationale.consensus = ConsensusLabel::Consensus;
    } else {
        r.rationale.consensus = ConsensusLabel::Divergent;
    }
    r.rationale.applied_bonus = bonus;

    r.score_detail["factor_normalized"] = fn;
    r.score_detail["base_score"]        = base;
    r.score_detail["consensus_bonus"]   = bonus;

    attach_risk(r, input, params);
    return fused(std::move(r));
}

}  // namespace qrank::detail
