/// @file src/config/engine_config.cpp
/// @brief Default configuration and EngineConfig::validate.

#include "qrank/config.hpp"
#include "qrank/log.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <set>

namespace qrank {

// ─── Defaults ─────────────────────────────────────────────────────────────────

CategoryWeightTable default_weight_table() {
    // Σ|w| · 100 = 2.16 keeps total_score inside ±FACTOR_SCORE_HALF_RANGE.
    // A stock neutral on every factor scores Σw · 50 = 0.98.
    CategoryWeightTable t;
    t.factor_weights = {
        // momentum
        {"momentum_5d",            0.002},
        {"momentum_10d",           0.002},
        {"momentum_20d",           0.002},
        {"rsi",                    0.001},
        // volume
        {"volume_ratio",           0.0016},
        {"volume_spike",           0.0014},
        {"turnover_rate",          0.001},
        // capital flow
        {"main_inflow_score",      0.002},
        {"large_inflow_score",     0.001},
        {"capital_strength",       0.001},
        // sentiment
        {"news_sentiment_score",   0.0016},
        {"market_sentiment_score", 0.0008},
        {"overall_sentiment",      0.001},
        // risk (volatility lowers the score)
        {"volatility_20d",        -0.001},
        {"price_stability",        0.0006},
        // technical
        {"macd",                   0.001},
        {"bollinger_position",     0.0006},
        // residual
        {"change_pct",             0.0004},
    };
    t.categories = {
        {"momentum",     {"momentum_5d", "momentum_10d", "momentum_20d", "rsi"}},
        {"volume",       {"volume_ratio", "volume_spike", "turnover_rate"}},
        {"capital_flow", {"main_inflow_score", "large_inflow_score", "capital_strength"}},
        {"sentiment",    {"news_sentiment_score", "market_sentiment_score", "overall_sentiment"}},
        {"risk",         {"volatility_20d", "price_stability"}},
        {"technical",    {"macd", "bollinger_position"}},
    };
    return t;
}

EngineConfig default_engine_config() {
    EngineConfig cfg;
    cfg.weights = default_weight_table();
    cfg.rules   = default_rationale_rules();
    return cfg;
}

// ─── validate ─────────────────────────────────────────────────────────────────

namespace {

[[noreturn]] void fail(const std::string& message) {
    log::logger()->error("invalid configuration: {}", message);
    throw ConfigError(message);
}

void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        fail(fmt::format("{} must be finite", name));
    }
}

void require_non_negative(double value, const char* name) {
    require_finite(value, name);
    if (value < 0.0) {
        fail(fmt::format("{} must be >= 0, got {}", name, value));
    }
}

void require_probability(double value, const char* name) {
    require_finite(value, name);
    if (value < 0.0 || value > 1.0) {
        fail(fmt::format("{} must be in [0, 1], got {}", name, value));
    }
}

void validate_weights(const CategoryWeightTable& weights) {
    for (const auto& [factor, w] : weights.factor_weights) {
        if (factor.empty()) {
            fail("factor weight with empty factor name");
        }
        if (!std::isfinite(w)) {
            fail(fmt::format("weight of '{}' must be finite", factor));
        }
    }

    std::set<std::string> names;
    std::set<std::string> grouped;
    for (const auto& c : weights.categories) {
        if (c.name.empty()) {
            fail("category with empty name");
        }
        if (!names.insert(c.name).second) {
            fail(fmt::format("duplicate category '{}'", c.name));
        }
        for (const auto& f : c.factors) {
            if (!grouped.insert(f).second) {
                fail(fmt::format("factor '{}' belongs to more than one category", f));
            }
            if (weights.factor_weights.count(f) == 0) {
                log::logger()->warn("category '{}' member '{}' has no weight; it is ignored",
                                    c.name, f);
            }
        }
    }
}

void validate_rules(const RationaleRuleTable& rules) {
    for (const auto& rule : rules) {
        if (rule.factor.empty()) {
            fail("rationale rule with empty factor");
        }
        if (!std::isfinite(rule.threshold)) {
            fail(fmt::format("rationale rule threshold for '{}' must be finite", rule.factor));
        }
        try {
            (void)render(TriggeredRule{.rule = rule, .raw_value = rule.threshold});
        } catch (const fmt::format_error& e) {
            fail(fmt::format("rationale message '{}' is not a valid template: {}",
                             rule.message, e.what()));
        }
    }
}

void validate_fusion(const FusionParams& p) {
    require_non_negative(p.ml_weight, "fusion.ml_weight");
    require_non_negative(p.factor_weight, "fusion.factor_weight");
    require_probability(p.ml_threshold, "fusion.ml_threshold");
    require_finite(p.factor_threshold, "fusion.factor_threshold");
    require_probability(p.confidence_threshold, "fusion.confidence_threshold");
    require_probability(p.risk_threshold, "fusion.risk_threshold");
    require_non_negative(p.consensus_bonus, "fusion.consensus_bonus");
    require_non_negative(p.base_weight, "fusion.base_weight");
    require_non_negative(p.factor_boost, "fusion.factor_boost");
}

void validate_ranker(const RankerConfig& r) {
    if (r.top_n == 0) {
        fail("ranking.top_n must be > 0");
    }
    require_finite(r.rules.max_abs_change_pct, "ranking.max_abs_change_pct");
    if (r.rules.max_abs_change_pct <= 0.0) {
        fail("ranking.max_abs_change_pct must be > 0");
    }
}

void validate_log_level(const std::string& level) {
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
        fail(fmt::format("unknown log level '{}'", level));
    }
}

}  // namespace

void EngineConfig::validate() const {
    validate_weights(weights);
    validate_rules(rules);
    validate_fusion(fusion.params);
    validate_ranker(ranker);
    validate_log_level(log_level);
}

}  // namespace qrank
