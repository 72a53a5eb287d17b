/// @file src/scoring/rationale.cpp
/// @brief Rule-table evaluation and rationale rendering.

#include "qrank/rationale.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cmath>

namespace qrank {

// ─── Comparison ───────────────────────────────────────────────────────────────

std::string_view to_string(Comparison op) noexcept {
    switch (op) {
        case Comparison::Greater:      return ">";
        case Comparison::GreaterEqual: return ">=";
        case Comparison::Less:         return "<";
        case Comparison::LessEqual:    return "<=";
    }
    return ">";
}

std::optional<Comparison> parse_comparison(std::string_view symbol) noexcept {
    if (symbol == ">")  return Comparison::Greater;
    if (symbol == ">=") return Comparison::GreaterEqual;
    if (symbol == "<")  return Comparison::Less;
    if (symbol == "<=") return Comparison::LessEqual;
    return std::nullopt;
}

bool matches(Comparison op, double value, double threshold) noexcept {
    if (!std::isfinite(value)) {
        return false;
    }
    switch (op) {
        case Comparison::Greater:      return value >  threshold;
        case Comparison::GreaterEqual: return value >= threshold;
        case Comparison::Less:         return value <  threshold;
        case Comparison::LessEqual:    return value <= threshold;
    }
    return false;
}

// ─── evaluate_rules ───────────────────────────────────────────────────────────

std::vector<TriggeredRule>
evaluate_rules(const RationaleRuleTable& rules,
               const std::string&        factor,
               double                    raw_value) {
    std::vector<TriggeredRule> out;
    for (const auto& rule : rules) {
        if (rule.factor == factor && matches(rule.op, raw_value, rule.threshold)) {
            out.push_back(TriggeredRule{.rule = rule, .raw_value = raw_value});
        }
    }
    return out;
}

// ─── render ───────────────────────────────────────────────────────────────────

std::string render(const TriggeredRule& triggered) {
    return fmt::format(fmt::runtime(triggered.rule.message),
                       fmt::arg("factor", triggered.rule.factor),
                       fmt::arg("value", triggered.raw_value),
                       fmt::arg("threshold", triggered.rule.threshold));
}

std::string render(const CategoryRationale& rationale) {
    if (rationale.empty()) {
        return {};
    }

    std::string out = fmt::format("{} {}", rationale.category,
                                  rationale.positive ? "positive" : "weak");
    if (!rationale.triggered.empty()) {
        std::vector<std::string> notes;
        notes.reserve(rationale.triggered.size());
        for (const auto& t : rationale.triggered) {
            notes.push_back(render(t));
        }
        out += fmt::format(" ({})", fmt::join(notes, ", "));
    }
    return out;
}

// ─── default_rationale_rules ──────────────────────────────────────────────────

RationaleRuleTable default_rationale_rules() {
    using C = Comparison;
    return {
        // momentum
        {"rsi",                    C::Greater, 70.0, "RSI overbought"},
        {"rsi",                    C::Less,    30.0, "RSI oversold"},
        {"momentum_5d",            C::Greater,  5.0, "{factor} strong uptrend"},
        {"momentum_5d",            C::Less,    -5.0, "{factor} weak downtrend"},
        {"momentum_10d",           C::Greater,  5.0, "{factor} strong uptrend"},
        {"momentum_10d",           C::Less,    -5.0, "{factor} weak downtrend"},
        {"momentum_20d",           C::Greater,  5.0, "{factor} strong uptrend"},
        {"momentum_20d",           C::Less,    -5.0, "{factor} weak downtrend"},
        // volume
        {"volume_spike",           C::Greater,  0.0, "volume spike"},
        {"volume_ratio",           C::Greater,  2.0, "volume expanding"},
        {"turnover_rate",          C::Greater,  5.0, "high turnover"},
        // capital flow
        {"main_inflow_score",      C::Greater, 60.0, "main capital net inflow"},
        {"large_inflow_score",     C::Greater, 60.0, "large-order net inflow"},
        // sentiment
        {"news_sentiment_score",   C::Greater, 70.0, "positive news sentiment"},
        {"market_sentiment_score", C::Greater, 60.0, "optimistic market sentiment"},
        // risk
        {"volatility_20d",         C::Greater, 30.0, "elevated volatility"},
        {"price_stability",        C::Greater, 70.0, "price relatively stable"},
        // technical
        {"macd",                   C::Greater,  0.0, "MACD above signal"},
        {"bollinger_position",     C::Greater,  0.8, "near upper Bollinger band"},
        {"bollinger_position",     C::Less,     0.2, "near lower Bollinger band"},
    };
}

}  // namespace qrank
