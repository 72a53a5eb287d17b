/// @file src/scoring/weighted_scorer.cpp
/// @brief WeightedScorer: residual factors and the additive total score.

#include "qrank/scoring.hpp"

namespace qrank {

WeightedScorer::WeightedScorer(CategoryWeightTable weights, RationaleRuleTable rules)
    : categories_(std::move(weights), std::move(rules))
{
    residual_factors_ = categories_.weights().residual_factors();
}

// ─── residual_contributions ───────────────────────────────────────────────────

std::vector<FactorContribution>
WeightedScorer::residual_contributions(const NormalizedFactorSet& normalized,
                                       const FactorSet&           raw) const {
    const auto& weights = categories_.weights().factor_weights;

    std::vector<FactorContribution> out;
    for (const auto& factor : residual_factors_) {
        const auto n = normalized.find(factor);
        if (n == normalized.end()) {
            continue;
        }
        const double w = weights.at(factor);
        const auto r = raw.find(factor);
        out.push_back(FactorContribution{
            .factor       = factor,
            .raw          = (r != raw.end()) ? r->second : FactorValue{},
            .normalized   = n->second,
            .weight       = w,
            .contribution = w * n->second,
        });
    }
    return out;
}

// ─── total_score ──────────────────────────────────────────────────────────────

double WeightedScorer::total_score(const ScoreBreakdown& breakdown) noexcept {
    double total = 0.0;
    for (const auto& c : breakdown.categories) {
        total += c.sub_score;
    }
    return total + breakdown.residual_score;
}

// ─── score ────────────────────────────────────────────────────────────────────

StockScore WeightedScorer::score(const std::string&         stock_id,
                                 const NormalizedFactorSet& normalized,
                                 const FactorSet&           raw) const {
    StockScore out;
    out.stock_id             = stock_id;
    out.breakdown.categories = categories_.score_categories(normalized, raw);
    out.breakdown.residual   = residual_contributions(normalized, raw);

    for (const auto& fc : out.breakdown.residual) {
        out.breakdown.residual_score += fc.contribution;
    }
    out.total_score = total_score(out.breakdown);
    return out;
}

}  // namespace qrank
