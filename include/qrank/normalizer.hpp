#pragma once

/// @file include/qrank/normalizer.hpp
/// @brief FactorNormalizer: cross-sectional z-score normalization of a Universe.
///
/// # Module: Factor Normalizer
///
/// ## Responsibility
/// Map every raw factor of every stock in a Universe onto a common [0, 100]
/// scale so that factors with very different units can be weighted together.
///
/// ## Why This Matters
/// Raw factor magnitudes differ by orders of magnitude:
///   - momentum_5d        ~5      (percent)
///   - volume_ratio       ~1
///   - main_inflow_score  ~60
///   - turnover_rate      ~0.03
///
/// A linear weighting of raw values would be dominated by whichever factor
/// happens to have the largest units. After normalization each factor
/// contributes on the same scale.
///
/// ## Formula
/// For each factor key k, over the finite values of k across the Universe:
///   μ_k, σ_k = population mean and standard deviation
///   z        = clip((v − μ_k) / σ_k, −3, 3)      (z = 0 when σ_k is flat)
///   n        = (z + 3) · 100 / 6
///
/// ## Edge Cases
/// - Missing / NaN / ±inf value for one stock: that stock gets 50
/// - Key with no finite value anywhere: every stock gets 50
/// - Universe of one stock: σ = 0 for every key, every value is exactly 50
///
/// ## Guarantees
/// - Stateless: statistics are recomputed on every call, never cached
/// - Monotonic within a key: a < b ⇒ n(a) ≤ n(b)
/// - Bounded: 0 ≤ n ≤ 100
/// - Thread-safe: `normalize` is const and touches no shared state

#include "qrank/statistics.hpp"
#include "qrank/types.hpp"

#include <map>
#include <string>

namespace qrank {

/// Normalized Universe plus the statistics that produced it.
struct NormalizedUniverse {
    std::map<std::string, NormalizedFactorSet> by_stock;  ///< stock_id → factors
    std::map<std::string, stats::FactorStats>  stats;     ///< factor key → μ, σ
};

/// Cross-sectional normalizer.
class FactorNormalizer {
public:
    /// Normalize a whole Universe.
    ///
    /// Every stock in the result carries every factor key that appears in
    /// any stock of the Universe. When a stock id occurs more than once, all
    /// occurrences feed the statistics and the first one is kept in
    /// `by_stock`.
    [[nodiscard]] NormalizedUniverse normalize(const Universe& universe) const;

    /// Per-key statistics over the Universe (the reduction step alone).
    /// Keys with no finite value are present with `count == 0`.
    [[nodiscard]] static std::map<std::string, stats::FactorStats>
    compute_stats(const Universe& universe);
};

}  // namespace qrank
