#pragma once

/// @file include/qrank/scoring.hpp
/// @brief CategoryScorer and WeightedScorer: the rule-based factor score.
///
/// # Module: Scoring
///
/// ## Responsibility
/// Turn one stock's NormalizedFactorSet into a ScoreBreakdown (one weighted
/// sub-score per category, plus residual factors that carry a weight but no
/// category) and the additive `total_score`.
///
/// ## Formula
///   sub_score[c]   = Σ_{f ∈ c} weight[f] · normalized[f]
///   residual_score = Σ_{f ∉ any c} weight[f] · normalized[f]
///   total_score    = Σ_c sub_score[c] + residual_score
///
/// Factors absent from the NormalizedFactorSet contribute nothing. Risk
/// weights are conventionally negative so that high volatility lowers the
/// score. `total_score` is unbounded; its sign is the net rule signal.
///
/// ## Guarantees
/// - Pure and deterministic: identical inputs give bit-identical scores
/// - Summation follows configured order, so reconstructing total_score from
///   the breakdown reproduces it exactly
/// - Rationale is computed from raw values and never feeds back into scores

#include "qrank/rationale.hpp"
#include "qrank/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace qrank {

// ─── Weight table ─────────────────────────────────────────────────────────────

/// A named group of factor keys.
struct CategoryDefinition {
    std::string              name;
    std::vector<std::string> factors;
};

/// Factor weights and their grouping into categories.
struct CategoryWeightTable {
    std::map<std::string, double>   factor_weights;  ///< factor → weight
    std::vector<CategoryDefinition> categories;      ///< Evaluation order

    /// Weighted factors that belong to no category, in key order.
    [[nodiscard]] std::vector<std::string> residual_factors() const;

    /// Name of the category `factor` belongs to, if any.
    [[nodiscard]] std::optional<std::string> category_of(const std::string& factor) const;
};

// ─── Score records ────────────────────────────────────────────────────────────

/// One factor's share of a score.
struct FactorContribution {
    std::string factor;
    FactorValue raw;           ///< Pre-normalization value (may be missing)
    double      normalized   = 0.0;
    double      weight       = 0.0;
    double      contribution = 0.0;  ///< weight · normalized
};

/// Weighted sub-score of one category.
struct CategoryScore {
    std::string                     category;
    double                          sub_score = 0.0;
    std::vector<FactorContribution> contributions;
    CategoryRationale               rationale;
};

/// Full per-stock audit trail of the factor score.
struct ScoreBreakdown {
    std::vector<CategoryScore>      categories;
    std::vector<FactorContribution> residual;
    double                          residual_score = 0.0;

    /// Sub-score of `category`, or `nullopt` if it is not configured.
    [[nodiscard]] std::optional<double> sub_score(const std::string& category) const noexcept;
};

/// Factor score of one stock.
struct StockScore {
    std::string    stock_id;
    ScoreBreakdown breakdown;
    double         total_score = 0.0;
};

// ─── CategoryScorer ───────────────────────────────────────────────────────────

/// Computes per-category sub-scores and their structured rationale.
class CategoryScorer {
public:
    CategoryScorer(CategoryWeightTable weights, RationaleRuleTable rules);

    /// Score every configured category for one stock.
    ///
    /// # Arguments
    /// * `normalized` - The stock's NormalizedFactorSet (0–100 scale).
    /// * `raw`        - The stock's raw FactorSet; used only for rationale.
    ///
    /// # Returns
    /// One CategoryScore per configured category, in configured order. A
    /// category whose members are all absent has sub_score 0 and an empty
    /// rationale.
    [[nodiscard]] std::vector<CategoryScore>
    score_categories(const NormalizedFactorSet& normalized,
                     const FactorSet&           raw) const;

    [[nodiscard]] const CategoryWeightTable& weights() const noexcept { return weights_; }

private:
    CategoryWeightTable weights_;
    RationaleRuleTable  rules_;
};

// ─── WeightedScorer ───────────────────────────────────────────────────────────

/// Adds residual factors to the category scores and produces total_score.
class WeightedScorer {
public:
    WeightedScorer(CategoryWeightTable weights, RationaleRuleTable rules);

    /// Full factor score of one stock.
    [[nodiscard]] StockScore score(const std::string&         stock_id,
                                   const NormalizedFactorSet& normalized,
                                   const FactorSet&           raw) const;

    /// Contributions of weighted factors outside every category.
    [[nodiscard]] std::vector<FactorContribution>
    residual_contributions(const NormalizedFactorSet& normalized,
                           const FactorSet&           raw) const;

    /// Σ sub_score + residual_score, summed in breakdown order.
    [[nodiscard]] static double total_score(const ScoreBreakdown& breakdown) noexcept;

private:
    CategoryScorer           categories_;
    std::vector<std::string> residual_factors_;
};

}  // namespace qrank
