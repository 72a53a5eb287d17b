/// @file src/ranking/run_summary.cpp
/// @brief RunSummary aggregation and rendering.

#include "qrank/ranking.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace qrank {

RunSummary summarize(const RankedList& ranked,
                     FusionMethod      method,
                     std::size_t       skipped,
                     std::size_t       excluded) {
    RunSummary s;
    s.method   = method;
    s.count    = ranked.recommendations.size();
    s.skipped  = skipped;
    s.excluded = excluded;
    s.invalid  = ranked.invalid;

    if (s.count == 0) {
        return s;
    }

    double sum_final = 0.0;
    double sum_total = 0.0;
    double sum_ml    = 0.0;
    std::size_t n_ml = 0;
    s.min_final = ranked.recommendations.front().fusion.final_score;
    s.max_final = s.min_final;

    for (const auto& rec : ranked.recommendations) {
        const auto& f = rec.fusion;
        sum_final += f.final_score;
        sum_total += f.total_score;
        if (f.ml_probability) {
            sum_ml += *f.ml_probability;
            ++n_ml;
        }
        s.min_final = std::min(s.min_final, f.final_score);
        s.max_final = std::max(s.max_final, f.final_score);

        ++s.confidence_counts[f.confidence_level];
        if (f.confidence_level == ConfidenceLevel::High) {
            ++s.high_confidence;
        }
        if (f.risk_level) {
            ++s.risk_counts[*f.risk_level];
            if (*f.risk_level == RiskLevel::Low) {
                ++s.low_risk;
            }
        }
    }

    const auto n = static_cast<double>(s.count);
    s.avg_final = sum_final / n;
    s.avg_total = sum_total / n;
    if (n_ml > 0) {
        s.avg_ml = sum_ml / static_cast<double>(n_ml);
    }
    return s;
}

std::string RunSummary::to_string() const {
    std::string out = fmt::format(
        "RunSummary{{method={}, count={}, avg_final={:.4f}, avg_total={:.4f}, ",
        qrank::to_string(method), count, avg_final, avg_total);

    if (avg_ml) {
        out += fmt::format("avg_ml={:.1f}%, ", *avg_ml * 100.0);
    } else {
        out += "avg_ml=n/a, ";
    }

    out += fmt::format(
        "final_range=[{:.4f}, {:.4f}], high_confidence={}, low_risk={}, "
        "skipped={}, excluded={}, invalid={}}}",
        min_final, max_final, high_confidence, low_risk, skipped, excluded, invalid);
    return out;
}

}  // namespace qrank
