#pragma once

/// @file include/qrank/config.hpp
/// @brief EngineConfig and the YAML ConfigLoader.
///
/// # Module: Configuration
///
/// ## Responsibility
/// Hold every tunable of a run (factor weights, categories, rationale rules,
/// fusion strategy and parameters, ranking rules, log level) as one
/// immutable value, and load it from YAML.
///
/// ## File Format
/// ```yaml
/// logging: {level: info}
/// profile: default
/// factor_weights:
///   default:    {momentum_5d: 0.10, rsi: 0.05, ...}
///   aggressive: {momentum_5d: 0.15, ...}
/// categories:
///   - {name: momentum, factors: [momentum_5d, momentum_10d, momentum_20d, rsi]}
/// rationale_rules:
///   - {factor: rsi, op: ">", threshold: 70, message: "RSI overbought"}
/// fusion:  {method: weighted_average, ml_weight: 0.4, ...}
/// ranking: {top_n: 10, score_field: total_score, require_positive_score: true,
///           max_abs_change_pct: 10}
/// ```
/// Sections that are absent keep their defaults. `factor_weights` may also be
/// a flat factor → weight map, in which case `profile` is ignored.
///
/// ## Guarantees
/// - Unknown fusion method, comparison operator, score field or profile is
///   rejected with ConfigError; nothing falls back silently
/// - `EngineConfig::validate` is the single gate for numeric sanity

#include "qrank/fusion.hpp"
#include "qrank/ranking.hpp"
#include "qrank/rationale.hpp"
#include "qrank/scoring.hpp"

#include <stdexcept>
#include <string>

namespace qrank {

/// Invalid or unreadable configuration.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Everything a RecommendationEngine needs. Immutable for a run.
struct EngineConfig {
    CategoryWeightTable weights;
    RationaleRuleTable  rules;
    FusionConfig        fusion{};
    RankerConfig        ranker{};
    std::string         log_level = "info";  ///< For the host to pass to log::set_level

    /// Throw ConfigError on the first invalid setting.
    ///
    /// Checks: finite weights, non-empty unique category names, each factor
    /// in at most one category, finite fusion parameters with probability
    /// thresholds in [0, 1] and non-negative weights, top_n > 0, positive
    /// change bound, well-formed rationale templates, known log level.
    /// Category members without a weight are allowed and logged.
    void validate() const;
};

/// Default factor weights and categories.
[[nodiscard]] CategoryWeightTable default_weight_table();

/// Default weights, categories, rules, weighted_average fusion, top 10.
[[nodiscard]] EngineConfig default_engine_config();

/// Reads EngineConfig from YAML.
class ConfigLoader {
public:
    /// Load and validate a YAML configuration file.
    ///
    /// # Errors
    /// ConfigError when the file cannot be read, is not valid YAML, or holds
    /// an invalid setting.
    [[nodiscard]] static EngineConfig load_file(const std::string& path);

    /// Parse and validate YAML text, starting from `default_engine_config()`.
    [[nodiscard]] static EngineConfig parse_string(const std::string& yaml_content);
};

}  // namespace qrank
