/// @file src/fusion/fusion_engine.cpp
/// @brief FusionEngine: input sanitizing, strategy dispatch, batch fusion.

#include "qrank/fusion.hpp"
#include "qrank/log.hpp"
#include "strategies.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>

namespace qrank {

// ─── ConsensusLabel ───────────────────────────────────────────────────────────

std::string_view to_string(ConsensusLabel label) noexcept {
    switch (label) {
        case ConsensusLabel::HighConsensus: return "high consensus";
        case ConsensusLabel::Consensus:     return "consensus";
        case ConsensusLabel::Divergent:     return "divergent";
    }
    return "divergent";
}

// ─── render(FusionRationale) ──────────────────────────────────────────────────

std::string render(const FusionRationale& rationale) {
    std::vector<std::string> parts;

    if (rationale.ml_available && rationale.ml_probability) {
        if (rationale.ml_threshold) {
            parts.push_back(fmt::format("ML up-probability {:.1f}% (>= {:.1f}%)",
                                        *rationale.ml_probability * 100.0,
                                        *rationale.ml_threshold * 100.0));
        } else {
            parts.push_back(fmt::format("ML up-probability {:.1f}%",
                                        *rationale.ml_probability * 100.0));
        }
    } else {
        parts.emplace_back("ML unavailable");
    }

    parts.push_back(fmt::format("factor score {:.2f}", rationale.total_score));

    if (rationale.adjustment) {
        parts.push_back(fmt::format("ML adjustment {:+.2f}", *rationale.adjustment));
    }
    if (rationale.consensus) {
        parts.push_back(fmt::format("{} (+{:.2f})", to_string(*rationale.consensus),
                                    rationale.applied_bonus.value_or(0.0)));
    }

    if (rationale.risk) {
        parts.push_back(fmt::format("confidence {}, risk {}",
                                    to_string(rationale.confidence),
                                    to_string(*rationale.risk)));
    } else {
        parts.push_back(fmt::format("confidence {}", to_string(rationale.confidence)));
    }

    return fmt::format("{}", fmt::join(parts, "; "));
}

// ─── FusionEngine ─────────────────────────────────────────────────────────────

FusionEngine::FusionEngine(FusionConfig config) noexcept
    : config_(config)
{}

FusionOutcome FusionEngine::fuse(const FusionInput& input) const {
    if (input.stock_id.empty()) {
        log::logger()->warn("fusion skipped: empty stock id");
        return FusionOutcome{
            .disposition = FusionDisposition::Failed,
            .result      = std::nullopt,
            .reason      = "empty stock id",
        };
    }
    if (!std::isfinite(input.total_score)) {
        log::logger()->warn("fusion skipped for {}: non-finite total_score", input.stock_id);
        return FusionOutcome{
            .disposition = FusionDisposition::Failed,
            .result      = std::nullopt,
            .reason      = "non-finite total_score",
        };
    }

    FusionInput sanitized = input;
    if (sanitized.ml_probability && !std::isfinite(*sanitized.ml_probability)) {
        log::logger()->warn("non-finite ML probability for {}; treated as unavailable",
                            input.stock_id);
        sanitized.ml_probability.reset();
    }
    if (sanitized.volatility && !std::isfinite(*sanitized.volatility)) {
        log::logger()->debug("non-finite volatility for {}; ignored", input.stock_id);
        sanitized.volatility.reset();
    }

    switch (config_.method) {
        case FusionMethod::WeightedAverage:
            return detail::weighted_average(sanitized, config_.params);
        case FusionMethod::FilterFirst:
            return detail::filter_first(sanitized, config_.params);
        case FusionMethod::RankAdjustment:
            return detail::rank_adjustment(sanitized, config_.params);
        case FusionMethod::ConsensusBoost:
            return detail::consensus_boost(sanitized, config_.params);
    }
    return FusionOutcome{
        .disposition = FusionDisposition::Failed,
        .result      = std::nullopt,
        .reason      = "unknown fusion method",
    };
}

FusionBatch FusionEngine::fuse_all(std::span<const FusionInput> inputs) const {
    FusionBatch batch;
    batch.results.reserve(inputs.size());

    for (const auto& in : inputs) {
        auto outcome = fuse(in);
        switch (outcome.disposition) {
            case FusionDisposition::Fused:
                batch.results.push_back(std::move(*outcome.result));
                break;
            case FusionDisposition::Excluded:
                log::logger()->debug("{} excluded by {}: {}", in.stock_id,
                                     to_string(config_.method), outcome.reason);
                ++batch.excluded;
                break;
            case FusionDisposition::Failed:
                ++batch.failed;
                break;
        }
    }

    if (config_.method == FusionMethod::RankAdjustment) {
        std::stable_sort(batch.results.begin(), batch.results.end(),
                         [](const FusionResult& a, const FusionResult& b) {
                             if (a.total_score != b.total_score) {
                                 return a.total_score > b.total_score;
                             }
                             return a.stock_id < b.stock_id;
                         });
    }

    log::logger()->info("{} fusion: {} fused, {} excluded, {} failed",
                        to_string(config_.method), batch.results.size(),
                        batch.excluded, batch.failed);
    return batch;
}

}  // namespace qrank
