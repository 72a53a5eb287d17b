#pragma once

/// @file include/qrank/statistics.hpp
/// @brief Cross-sectional statistics and z-score rescaling utilities.
///
/// # Module: Statistics
///
/// ## Responsibility
/// The numeric primitives shared by FactorNormalizer and by external
/// consumers of the same scale (the exit-signal rule engine): finite-value
/// checks, population mean / standard deviation over a cross-section,
/// clipped z-scores and the z → [0, 100] mapping.
///
/// ## Formula
///   μ = Σ v / n
///   σ = √(Σ (v − μ)² / n)            (population, not Bessel-corrected)
///   z = (v − μ) / σ,  clipped to [−3, 3]
///   normalized = (z + 3) · 100 / 6
///
/// ## Guarantees
/// - All functions are pure and `noexcept`
/// - Never divides by zero: flat cross-sections map to z = 0 (normalized 50)
/// - Monotonic: for σ non-flat, a < b ⇒ normalized(a) ≤ normalized(b)

#include "qrank/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <span>

namespace qrank::stats {

/// Column of finite values for one factor key across the Universe.
using FactorColumn = Eigen::ArrayXd;

/// Statistics of one factor key over the current Universe.
struct FactorStats {
    double      mean   = 0.0;
    double      stddev = 0.0;   ///< Population standard deviation
    std::size_t count  = 0;     ///< Number of finite observations
    bool        flat   = true;  ///< True when σ carries no comparative signal
};

/// True when `value` holds a finite double.
[[nodiscard]] bool is_valid(const FactorValue& value) noexcept;

/// Population statistics of `values`.
///
/// # Returns
/// `nullopt` when `values` is empty. Callers must pass finite values only;
/// use `collect_finite` to build the column.
[[nodiscard]] std::optional<FactorStats>
cross_sectional_stats(std::span<const double> values) noexcept;

/// Clipped z-score of `value` against `stats`. Returns 0 when flat.
[[nodiscard]] double clipped_zscore(double value, const FactorStats& stats) noexcept;

/// Map a z-score in [−Z_CLIP, Z_CLIP] onto [0, 100]. Out-of-range input is
/// clipped first.
[[nodiscard]] double rescale_zscore(double z) noexcept;

/// Full normalization of one raw value. Missing / non-finite → 50.
[[nodiscard]] double normalize_value(const FactorValue& value,
                                     const FactorStats& stats) noexcept;

/// Clip `value` to [lo, hi].
[[nodiscard]] double clip(double value, double lo, double hi) noexcept;

}  // namespace qrank::stats
