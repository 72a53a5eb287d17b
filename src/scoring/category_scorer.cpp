/// @file src/scoring/category_scorer.cpp
/// @brief CategoryScorer and CategoryWeightTable lookups.

#include "qrank/scoring.hpp"
#include "qrank/statistics.hpp"

#include <set>

namespace qrank {

// ─── CategoryWeightTable ──────────────────────────────────────────────────────

std::vector<std::string> CategoryWeightTable::residual_factors() const {
    std::set<std::string> grouped;
    for (const auto& c : categories) {
        grouped.insert(c.factors.begin(), c.factors.end());
    }

    std::vector<std::string> out;
    for (const auto& [factor, weight] : factor_weights) {
        if (grouped.count(factor) == 0) {
            out.push_back(factor);
        }
    }
    return out;
}

std::optional<std::string>
CategoryWeightTable::category_of(const std::string& factor) const {
    for (const auto& c : categories) {
        for (const auto& f : c.factors) {
            if (f == factor) {
                return c.name;
            }
        }
    }
    return std::nullopt;
}

// ─── ScoreBreakdown ───────────────────────────────────────────────────────────

std::optional<double>
ScoreBreakdown::sub_score(const std::string& category) const noexcept {
    for (const auto& c : categories) {
        if (c.category == category) {
            return c.sub_score;
        }
    }
    return std::nullopt;
}

// ─── CategoryScorer ───────────────────────────────────────────────────────────

CategoryScorer::CategoryScorer(CategoryWeightTable weights, RationaleRuleTable rules)
    : weights_(std::move(weights))
    , rules_(std::move(rules))
{}

std::vector<CategoryScore>
CategoryScorer::score_categories(const NormalizedFactorSet& normalized,
                                 const FactorSet&           raw) const {
    std::vector<CategoryScore> out;
    out.reserve(weights_.categories.size());

    for (const auto& category : weights_.categories) {
        CategoryScore cs;
        cs.category           = category.name;
        cs.rationale.category = category.name;

        for (const auto& factor : category.factors) {
            const auto w = weights_.factor_weights.find(factor);
            const auto n = normalized.find(factor);
            if (w == weights_.factor_weights.end() || n == normalized.end()) {
                continue;
            }

            const auto r = raw.find(factor);
            const FactorValue raw_value = (r != raw.end()) ? r->second : FactorValue{};

            FactorContribution fc{
                .factor       = factor,
                .raw          = raw_value,
                .normalized   = n->second,
                .weight       = w->second,
                .contribution = w->second * n->second,
            };
            cs.sub_score += fc.contribution;
            cs.contributions.push_back(fc);

            // Presentation only: thresholds apply to the raw value.
            cs.rationale.contributing_factors.push_back(factor);
            if (stats::is_valid(raw_value)) {
                auto fired = evaluate_rules(rules_, factor, *raw_value);
                cs.rationale.triggered.insert(cs.rationale.triggered.end(),
                                              fired.begin(), fired.end());
            }
        }

        cs.rationale.positive = cs.sub_score > 0.0;
        out.push_back(std::move(cs));
    }
    return out;
}

}  // namespace qrank
