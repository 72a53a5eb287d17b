/// @file src/core/statistics.cpp
/// @brief Cross-sectional statistics on Eigen arrays.

#include "qrank/statistics.hpp"
#include "qrank/constants.hpp"

#include <algorithm>
#include <cmath>

namespace qrank::stats {

// ─── is_valid ─────────────────────────────────────────────────────────────────

bool is_valid(const FactorValue& value) noexcept {
    return value.has_value() && std::isfinite(*value);
}

// ─── clip ─────────────────────────────────────────────────────────────────────

double clip(double value, double lo, double hi) noexcept {
    return std::min(std::max(value, lo), hi);
}

// ─── cross_sectional_stats ────────────────────────────────────────────────────

std::optional<FactorStats>
cross_sectional_stats(std::span<const double> values) noexcept {
    if (values.empty()) {
        return std::nullopt;
    }

    const Eigen::Map<const FactorColumn> column(
        values.data(), static_cast<Eigen::Index>(values.size()));

    FactorStats out;
    out.count = values.size();
    out.mean  = column.mean();

    // Population variance: n denominator, so a single observation gives σ = 0.
    const double variance = (column - out.mean).square().mean();
    out.stddev = std::sqrt(std::max(variance, 0.0));

    // Summing identical values can leave rounding residue in μ; scale the
    // flatness test by |μ| so that such a column still reads as flat.
    const double tolerance =
        constants::FLAT_STDDEV_THRESHOLD * std::max(1.0, std::abs(out.mean));
    out.flat = !(out.stddev > tolerance)
            || !std::isfinite(out.mean) || !std::isfinite(out.stddev);
    return out;
}

// ─── clipped_zscore ───────────────────────────────────────────────────────────

double clipped_zscore(double value, const FactorStats& stats) noexcept {
    if (stats.flat || !std::isfinite(value)) {
        return 0.0;
    }
    const double z = (value - stats.mean) / stats.stddev;
    if (std::isnan(z)) {
        return 0.0;
    }
    return clip(z, -constants::Z_CLIP, constants::Z_CLIP);
}

// ─── rescale_zscore ───────────────────────────────────────────────────────────

double rescale_zscore(double z) noexcept {
    const double zc = clip(z, -constants::Z_CLIP, constants::Z_CLIP);
    // (z + 3) · 100 / 6, so z = 0 maps to exactly 50.
    return (zc + constants::Z_CLIP) * constants::NORMALIZED_MAX
         / (2.0 * constants::Z_CLIP);
}

// ─── normalize_value ──────────────────────────────────────────────────────────

double normalize_value(const FactorValue& value,
                       const FactorStats& stats) noexcept {
    if (!is_valid(value) || stats.count == 0) {
        return constants::NEUTRAL_SCORE;
    }
    return rescale_zscore(clipped_zscore(*value, stats));
}

}  // namespace qrank::stats
