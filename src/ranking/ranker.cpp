/// @file src/ranking/ranker.cpp
/// @brief RecommendationRanker: validity filter, ordering, dedupe, top-n.

#include "qrank/ranking.hpp"
#include "qrank/log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace qrank {

// ─── ScoreField ───────────────────────────────────────────────────────────────

std::string_view to_string(ScoreField field) noexcept {
    switch (field) {
        case ScoreField::TotalScore: return "total_score";
        case ScoreField::FinalScore: return "final_score";
    }
    return "total_score";
}

std::optional<ScoreField> parse_score_field(std::string_view name) noexcept {
    if (name == "total_score") return ScoreField::TotalScore;
    if (name == "final_score") return ScoreField::FinalScore;
    return std::nullopt;
}

// ─── Rationale / rendering ────────────────────────────────────────────────────

std::string compose_rationale(const FusionResult& fusion, const ScoreBreakdown& breakdown) {
    std::vector<std::string> parts;
    parts.push_back(render(fusion.rationale));
    for (const auto& c : breakdown.categories) {
        auto note = render(c.rationale);
        if (!note.empty()) {
            parts.push_back(std::move(note));
        }
    }
    return fmt::format("{}", fmt::join(parts, "; "));
}

std::string Recommendation::to_string() const {
    const std::string ml = fusion.ml_probability
        ? fmt::format("{:.1f}%", *fusion.ml_probability * 100.0)
        : std::string("n/a");
    const std::string_view risk = fusion.risk_level
        ? qrank::to_string(*fusion.risk_level)
        : std::string_view("n/a");

    return fmt::format("#{} {} {} final={:.4f} total={:.4f} ml={} conf={} risk={}{} | {}",
                       rank, fusion.stock_id, meta.name, fusion.final_score,
                       fusion.total_score, ml, qrank::to_string(fusion.confidence_level),
                       risk, fusion.consensus_flag ? " consensus" : "", rationale);
}

// ─── RecommendationRanker ─────────────────────────────────────────────────────

RecommendationRanker::RecommendationRanker(RankerConfig config) noexcept
    : config_(config)
{}

bool RecommendationRanker::is_valid(const RankCandidate& candidate) const noexcept {
    const auto& rules = config_.rules;
    const auto& f     = candidate.fusion;

    const double score = (rules.score_field == ScoreField::TotalScore)
        ? f.total_score
        : f.final_score;
    if (!std::isfinite(score) || !std::isfinite(f.final_score)) {
        return false;
    }
    if (rules.require_positive_score && !(score > 0.0)) {
        return false;
    }

    const auto& meta = candidate.meta;
    if (!std::isfinite(meta.last_price) || !(meta.last_price > 0.0)) {
        return false;
    }
    if (!std::isfinite(meta.change_pct)
        || !(std::abs(meta.change_pct) < rules.max_abs_change_pct)) {
        return false;
    }
    return true;
}

bool RecommendationRanker::ranks_before(const FusionResult& a,
                                        const FusionResult& b) noexcept {
    if (a.final_score != b.final_score) {
        return a.final_score > b.final_score;
    }
    if (a.ml_probability.has_value() != b.ml_probability.has_value()) {
        return a.ml_probability.has_value();
    }
    if (a.ml_probability && *a.ml_probability != *b.ml_probability) {
        return *a.ml_probability > *b.ml_probability;
    }
    return a.stock_id < b.stock_id;
}

RankedList RecommendationRanker::rank(std::span<const RankCandidate> candidates,
                                      Timestamp                      generated_at) const {
    RankedList out;

    std::vector<const RankCandidate*> valid;
    valid.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (is_valid(c)) {
            valid.push_back(&c);
        } else {
            log::logger()->debug("{} dropped by validity rules", c.fusion.stock_id);
            ++out.invalid;
        }
    }

    std::stable_sort(valid.begin(), valid.end(),
                     [](const RankCandidate* a, const RankCandidate* b) {
                         return ranks_before(a->fusion, b->fusion);
                     });

    std::set<std::string> seen;
    for (const auto* c : valid) {
        if (!seen.insert(c->fusion.stock_id).second) {
            log::logger()->warn("duplicate candidate {} dropped", c->fusion.stock_id);
            ++out.duplicates;
            continue;
        }
        if (out.recommendations.size() >= config_.top_n) {
            continue;
        }

        Recommendation rec;
        rec.rank         = out.recommendations.size() + 1;
        rec.fusion       = c->fusion;
        rec.breakdown    = c->breakdown;
        rec.meta         = c->meta;
        rec.rationale    = compose_rationale(c->fusion, c->breakdown);
        rec.generated_at = generated_at;
        out.recommendations.push_back(std::move(rec));
    }
    return out;
}

}  // namespace qrank
