/// @file src/core/types.cpp
/// @brief Label and fusion-method name conversions.

#include "qrank/types.hpp"

#include <array>

namespace qrank {

namespace {

constexpr std::array<FusionMethod, 4> ALL_METHODS{
    FusionMethod::WeightedAverage,
    FusionMethod::FilterFirst,
    FusionMethod::RankAdjustment,
    FusionMethod::ConsensusBoost,
};

}  // namespace

std::string_view to_string(ConfidenceLevel level) noexcept {
    switch (level) {
        case ConfidenceLevel::High:   return "high";
        case ConfidenceLevel::Medium: return "medium";
        case ConfidenceLevel::Low:    return "low";
    }
    return "low";
}

std::string_view to_string(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::Low:    return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High:   return "high";
    }
    return "high";
}

std::string_view to_string(FusionMethod method) noexcept {
    switch (method) {
        case FusionMethod::WeightedAverage: return "weighted_average";
        case FusionMethod::FilterFirst:     return "filter_first";
        case FusionMethod::RankAdjustment:  return "rank_adjustment";
        case FusionMethod::ConsensusBoost:  return "consensus_boost";
    }
    return "weighted_average";
}

std::optional<FusionMethod> parse_fusion_method(std::string_view name) noexcept {
    for (FusionMethod m : ALL_METHODS) {
        if (to_string(m) == name) {
            return m;
        }
    }
    return std::nullopt;
}

std::span<const FusionMethod> all_fusion_methods() noexcept {
    return ALL_METHODS;
}

}  // namespace qrank
