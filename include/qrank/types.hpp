#pragma once

/// @file include/qrank/types.hpp
/// @brief Shared value types for the QRank scoring and fusion engine.
///
/// Every stage of the pipeline consumes and returns these plain value types.
/// Nothing here owns resources or carries behaviour beyond small enum
/// conversions; stages never mutate an input in place.

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qrank {

// ─── Factor Data ──────────────────────────────────────────────────────────────

/// One raw measurement. `nullopt` means missing; NaN and ±inf are
/// representable and are treated as invalid, never as zero.
using FactorValue = std::optional<double>;

/// Raw factor key → value for one stock in one run.
using FactorSet = std::map<std::string, FactorValue>;

/// Normalized factor key → value in [0, 100]; 50 is neutral.
using NormalizedFactorSet = std::map<std::string, double>;

/// A stock and its raw factors.
struct StockFactors {
    std::string stock_id;
    FactorSet   factors;
};

/// All stocks scored together in one run. Order is preserved in outputs
/// that do not re-sort.
using Universe = std::vector<StockFactors>;

/// External ML up-probability per stock. Absence is a handled case.
using MlPredictions = std::map<std::string, double>;

/// Optional externally supplied volatility per stock, used by risk labels.
using VolatilityMap = std::map<std::string, double>;

/// Display metadata passed through to recommendations, never computed here.
struct StockMeta {
    std::string name;
    double      last_price = 0.0;
    double      change_pct = 0.0;  ///< Day change in percent (e.g. 2.3)
};

using MetadataMap = std::map<std::string, StockMeta>;

// ─── Labels ───────────────────────────────────────────────────────────────────

/// How strongly the ML and factor signals reinforce each other.
enum class ConfidenceLevel { High, Medium, Low };

/// Signal uncertainty / volatility exposure. Distinct from confidence.
enum class RiskLevel { Low, Medium, High };

/// Closed set of fusion strategies. Dispatch is an exhaustive switch.
enum class FusionMethod {
    WeightedAverage,
    FilterFirst,
    RankAdjustment,
    ConsensusBoost,
};

[[nodiscard]] std::string_view to_string(ConfidenceLevel level) noexcept;
[[nodiscard]] std::string_view to_string(RiskLevel level) noexcept;

/// Canonical configuration name, e.g. "weighted_average".
[[nodiscard]] std::string_view to_string(FusionMethod method) noexcept;

/// Parse a canonical method name. Returns `nullopt` for anything else; the
/// caller decides how to fail (see ConfigLoader).
[[nodiscard]] std::optional<FusionMethod>
parse_fusion_method(std::string_view name) noexcept;

/// All methods in declaration order, for diagnostics and tests.
[[nodiscard]] std::span<const FusionMethod> all_fusion_methods() noexcept;

}  // namespace qrank
