/// @file src/fusion/classification.cpp
/// @brief Signal strengths, confidence and risk labels.

#include "qrank/fusion.hpp"
#include "qrank/statistics.hpp"

#include <algorithm>
#include <cmath>

namespace qrank {

namespace {

double ml_strength(double ml_probability) noexcept {
    const double p = stats::clip(ml_probability, 0.0, 1.0);
    return std::abs(p - constants::ML_NEUTRAL_PROBABILITY) * 2.0;
}

double factor_strength(double total_score) noexcept {
    return std::min(std::abs(total_score), constants::FACTOR_SCORE_HALF_RANGE)
         / constants::FACTOR_SCORE_HALF_RANGE;
}

}  // namespace

// ─── signs_agree ──────────────────────────────────────────────────────────────

bool signs_agree(double ml_probability, double total_score) noexcept {
    const bool ml_up     = ml_probability > constants::ML_NEUTRAL_PROBABILITY;
    const bool factor_up = total_score > 0.0;
    return ml_up == factor_up;
}

// ─── confidence_score ─────────────────────────────────────────────────────────

double confidence_score(std::optional<double> ml_probability,
                        double total_score) noexcept {
    const double fs = factor_strength(total_score);
    if (!ml_probability) {
        return fs / 2.0;
    }

    const double ms = ml_strength(*ml_probability);
    if (signs_agree(*ml_probability, total_score)) {
        return (ms + fs) / 2.0;
    }
    return std::abs(ms - fs);
}

// ─── risk_score ───────────────────────────────────────────────────────────────

double risk_score(std::optional<double> ml_probability,
                  double                total_score,
                  std::optional<double> volatility) noexcept {
    const double ms = ml_probability ? ml_strength(*ml_probability) : 0.0;
    const double fs = factor_strength(total_score);

    double risk = ((1.0 - ms) + (1.0 - fs)) / 2.0;
    if (volatility && std::isfinite(*volatility)) {
        risk = (risk + stats::clip(*volatility, 0.0, 1.0)) / 2.0;
    }
    return risk;
}

// ─── Labels ───────────────────────────────────────────────────────────────────

ConfidenceLevel classify_confidence(double confidence_raw,
                                    double confidence_threshold) noexcept {
    if (confidence_raw >= confidence_threshold) {
        return ConfidenceLevel::High;
    }
    if (confidence_raw >= constants::MEDIUM_CONFIDENCE_FLOOR) {
        return ConfidenceLevel::Medium;
    }
    return ConfidenceLevel::Low;
}

RiskLevel classify_risk(double risk_raw, double risk_threshold) noexcept {
    if (risk_raw <= risk_threshold) {
        return RiskLevel::Low;
    }
    if (risk_raw <= constants::MEDIUM_RISK_CEILING) {
        return RiskLevel::Medium;
    }
    return RiskLevel::High;
}

}  // namespace qrank
