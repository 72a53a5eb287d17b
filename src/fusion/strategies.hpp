#pragma once

/// @file src/fusion/strategies.hpp
/// @brief One pure function per FusionMethod. Internal to the fusion module.
///
/// Callers guarantee a sanitized input: non-empty stock id, finite
/// total_score, and ml_probability / volatility either absent or finite.

#include "qrank/fusion.hpp"

namespace qrank::detail {

/// clip((total + 2) / 4, 0, 1)
[[nodiscard]] double factor_norm(double total_score) noexcept;

/// clip(ml, 0, 1)
[[nodiscard]] double ml_norm(double ml_probability) noexcept;

[[nodiscard]] FusionOutcome weighted_average(const FusionInput&  input,
                                             const FusionParams& params);

[[nodiscard]] FusionOutcome filter_first(const FusionInput&  input,
                                         const FusionParams& params);

[[nodiscard]] FusionOutcome rank_adjustment(const FusionInput&  input,
                                            const FusionParams& params);

[[nodiscard]] FusionOutcome consensus_boost(const FusionInput&  input,
                                            const FusionParams& params);

}  // namespace qrank::detail
