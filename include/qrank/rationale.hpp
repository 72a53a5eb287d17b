#pragma once

/// @file include/qrank/rationale.hpp
/// @brief Declarative rationale rules and structured rationale records.
///
/// # Module: Rationale
///
/// ## Responsibility
/// Explain a category score in words without touching the number. A rule is
/// a row of data, `(factor, comparison, threshold, message)`, evaluated
/// uniformly against the stock's *raw* (pre-normalization) value. Triggered
/// rules are kept as structured records; turning them into text is a
/// separate presentation step (`render`).
///
/// Message templates may reference `{factor}`, `{value}` and `{threshold}`
/// (fmt named-argument syntax), e.g. "{factor} strong uptrend".

#include "qrank/types.hpp"

#include <string>
#include <vector>

namespace qrank {

/// Comparison applied as `raw_value <op> threshold`.
enum class Comparison { Greater, GreaterEqual, Less, LessEqual };

[[nodiscard]] std::string_view to_string(Comparison op) noexcept;

/// Parse ">", ">=", "<", "<=". Returns `nullopt` otherwise.
[[nodiscard]] std::optional<Comparison> parse_comparison(std::string_view symbol) noexcept;

/// One row of the rule table.
struct RationaleRule {
    std::string factor;
    Comparison  op        = Comparison::Greater;
    double      threshold = 0.0;
    std::string message;   ///< fmt template, see file comment
};

using RationaleRuleTable = std::vector<RationaleRule>;

/// A rule that fired for a specific raw value.
struct TriggeredRule {
    RationaleRule rule;
    double        raw_value = 0.0;
};

/// Structured explanation of one category score.
struct CategoryRationale {
    std::string                category;
    std::vector<std::string>   contributing_factors;  ///< In evaluation order
    std::vector<TriggeredRule> triggered;
    bool                       positive = false;      ///< sub_score > 0

    /// True when no factor contributed; renders as an empty string.
    [[nodiscard]] bool empty() const noexcept { return contributing_factors.empty(); }
};

/// True when `value <op> threshold` holds. Non-finite values never match.
[[nodiscard]] bool matches(Comparison op, double value, double threshold) noexcept;

/// Every rule in `rules` about `factor` that fires for `raw_value`, in
/// table order.
[[nodiscard]] std::vector<TriggeredRule>
evaluate_rules(const RationaleRuleTable& rules,
               const std::string&        factor,
               double                    raw_value);

/// Text of one triggered rule, e.g. "RSI overbought".
/// Throws fmt::format_error for a malformed template; ConfigLoader checks
/// templates up front so configured tables never do.
[[nodiscard]] std::string render(const TriggeredRule& triggered);

/// "momentum positive (momentum_5d strong uptrend, RSI overbought)".
/// Empty string for a category without contributing factors.
[[nodiscard]] std::string render(const CategoryRationale& rationale);

/// The rule table the engine ships with.
[[nodiscard]] RationaleRuleTable default_rationale_rules();

}  // namespace qrank
