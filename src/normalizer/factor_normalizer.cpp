/// @file src/normalizer/factor_normalizer.cpp
/// @brief FactorNormalizer: per-key reduction, then per-stock rescaling.
///
/// normalize() runs in two passes:
///   1. Collect the finite values of each factor key across the Universe and
///      reduce them to (μ, σ). This is the only cross-stock dependency.
///   2. Map each stock's raw value through the clipped z-score of its key.

#include "qrank/normalizer.hpp"
#include "qrank/constants.hpp"
#include "qrank/log.hpp"

#include <set>
#include <vector>

namespace qrank {

// ─── compute_stats ────────────────────────────────────────────────────────────

std::map<std::string, stats::FactorStats>
FactorNormalizer::compute_stats(const Universe& universe) {
    std::map<std::string, std::vector<double>> columns;
    for (const auto& stock : universe) {
        for (const auto& [key, value] : stock.factors) {
            auto& column = columns[key];
            if (stats::is_valid(value)) {
                column.push_back(*value);
            }
        }
    }

    std::map<std::string, stats::FactorStats> out;
    for (const auto& [key, column] : columns) {
        auto s = stats::cross_sectional_stats(column);
        if (!s) {
            // No finite value anywhere: neutral for every stock.
            log::logger()->debug("factor '{}' has no finite value in a universe of {}",
                                 key, universe.size());
            out.emplace(key, stats::FactorStats{});
            continue;
        }
        if (s->flat) {
            log::logger()->debug("factor '{}' is degenerate (n={}, sigma={:.3g}); using neutral {}",
                                 key, s->count, s->stddev, constants::NEUTRAL_SCORE);
        }
        out.emplace(key, *s);
    }
    return out;
}

// ─── normalize ────────────────────────────────────────────────────────────────

NormalizedUniverse FactorNormalizer::normalize(const Universe& universe) const {
    NormalizedUniverse result;
    result.stats = compute_stats(universe);

    std::set<std::string> seen;
    for (const auto& stock : universe) {
        if (!seen.insert(stock.stock_id).second) {
            log::logger()->warn("duplicate stock id '{}' in universe; keeping first occurrence",
                                stock.stock_id);
            continue;
        }

        NormalizedFactorSet normalized;
        for (const auto& [key, s] : result.stats) {
            const auto it = stock.factors.find(key);
            const FactorValue raw = (it != stock.factors.end()) ? it->second : FactorValue{};
            normalized.emplace(key, stats::normalize_value(raw, s));
        }
        result.by_stock.emplace(stock.stock_id, std::move(normalized));
    }
    return result;
}

}  // namespace qrank
