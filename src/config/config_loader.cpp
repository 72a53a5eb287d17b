/// @file src/config/config_loader.cpp
/// @brief ConfigLoader: YAML → EngineConfig via yaml-cpp.

#include "qrank/config.hpp"
#include "qrank/log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <vector>

namespace qrank {

namespace {

[[noreturn]] void fail(const std::string& message) {
    log::logger()->error("configuration error: {}", message);
    throw ConfigError(message);
}

template <typename T>
void read_scalar(const YAML::Node& section, const char* key, T& out) {
    if (const auto node = section[key]) {
        try {
            out = node.as<T>();
        } catch (const YAML::Exception& e) {
            fail(fmt::format("'{}' has an invalid value: {}", key, e.what()));
        }
    }
}

std::string accepted_methods() {
    std::vector<std::string_view> names;
    for (const auto m : all_fusion_methods()) {
        names.push_back(to_string(m));
    }
    return fmt::format("{}", fmt::join(names, ", "));
}

// ─── Sections ─────────────────────────────────────────────────────────────────

std::map<std::string, double> read_weight_map(const YAML::Node& node) {
    std::map<std::string, double> weights;
    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        const auto factor = it->first.as<std::string>();
        try {
            weights[factor] = it->second.as<double>();
        } catch (const YAML::Exception& e) {
            fail(fmt::format("weight of '{}' is not a number: {}", factor, e.what()));
        }
    }
    return weights;
}

void read_factor_weights(const YAML::Node& root, CategoryWeightTable& table) {
    const auto node = root["factor_weights"];
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        fail("'factor_weights' must be a map");
    }

    // Flat form: every value is a scalar weight.
    bool flat = true;
    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        if (!it->second.IsScalar()) {
            flat = false;
            break;
        }
    }
    if (flat) {
        table.factor_weights = read_weight_map(node);
        return;
    }

    const auto profile = root["profile"] ? root["profile"].as<std::string>()
                                         : std::string("default");
    const auto selected = node[profile];
    if (!selected || !selected.IsMap()) {
        fail(fmt::format("weight profile '{}' not found in 'factor_weights'", profile));
    }
    log::logger()->info("using weight profile '{}'", profile);
    table.factor_weights = read_weight_map(selected);
}

void read_categories(const YAML::Node& root, CategoryWeightTable& table) {
    const auto node = root["categories"];
    if (!node) {
        return;
    }
    if (!node.IsSequence()) {
        fail("'categories' must be a list");
    }

    std::vector<CategoryDefinition> categories;
    for (const auto& entry : node) {
        CategoryDefinition def;
        read_scalar(entry, "name", def.name);
        if (const auto factors = entry["factors"]) {
            if (!factors.IsSequence()) {
                fail(fmt::format("factors of category '{}' must be a list", def.name));
            }
            for (const auto& f : factors) {
                def.factors.push_back(f.as<std::string>());
            }
        }
        categories.push_back(std::move(def));
    }
    table.categories = std::move(categories);
}

void read_rationale_rules(const YAML::Node& root, RationaleRuleTable& rules) {
    const auto node = root["rationale_rules"];
    if (!node) {
        return;
    }
    if (!node.IsSequence()) {
        fail("'rationale_rules' must be a list");
    }

    RationaleRuleTable out;
    for (const auto& entry : node) {
        RationaleRule rule;
        std::string   op = ">";
        read_scalar(entry, "factor", rule.factor);
        read_scalar(entry, "op", op);
        read_scalar(entry, "threshold", rule.threshold);
        read_scalar(entry, "message", rule.message);

        const auto parsed = parse_comparison(op);
        if (!parsed) {
            fail(fmt::format("unknown comparison '{}' for rule on '{}' (accepted: >, >=, <, <=)",
                             op, rule.factor));
        }
        rule.op = *parsed;
        out.push_back(std::move(rule));
    }
    rules = std::move(out);
}

void read_fusion(const YAML::Node& root, FusionConfig& fusion) {
    const auto node = root["fusion"];
    if (!node) {
        return;
    }

    if (node["method"]) {
        const auto name   = node["method"].as<std::string>();
        const auto method = parse_fusion_method(name);
        if (!method) {
            fail(fmt::format("unknown fusion method '{}' (accepted: {})",
                             name, accepted_methods()));
        }
        fusion.method = *method;
    }

    auto& p = fusion.params;
    read_scalar(node, "ml_weight", p.ml_weight);
    read_scalar(node, "factor_weight", p.factor_weight);
    read_scalar(node, "ml_threshold", p.ml_threshold);
    read_scalar(node, "factor_threshold", p.factor_threshold);
    read_scalar(node, "confidence_threshold", p.confidence_threshold);
    read_scalar(node, "risk_threshold", p.risk_threshold);
    read_scalar(node, "consensus_bonus", p.consensus_bonus);
    read_scalar(node, "base_weight", p.base_weight);
    read_scalar(node, "factor_boost", p.factor_boost);
}

void read_ranking(const YAML::Node& root, RankerConfig& ranker) {
    const auto node = root["ranking"];
    if (!node) {
        return;
    }

    if (node["top_n"]) {
        long long top_n = 0;
        read_scalar(node, "top_n", top_n);
        if (top_n <= 0) {
            fail(fmt::format("ranking.top_n must be > 0, got {}", top_n));
        }
        ranker.top_n = static_cast<std::size_t>(top_n);
    }

    if (node["score_field"]) {
        const auto name  = node["score_field"].as<std::string>();
        const auto field = parse_score_field(name);
        if (!field) {
            fail(fmt::format("unknown score_field '{}' (accepted: total_score, final_score)",
                             name));
        }
        ranker.rules.score_field = *field;
    }

    read_scalar(node, "require_positive_score", ranker.rules.require_positive_score);
    read_scalar(node, "max_abs_change_pct", ranker.rules.max_abs_change_pct);
}

}  // namespace

// ─── ConfigLoader ─────────────────────────────────────────────────────────────

EngineConfig ConfigLoader::parse_string(const std::string& yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        fail(fmt::format("malformed YAML: {}", e.what()));
    }

    EngineConfig cfg = default_engine_config();
    if (root.IsNull()) {
        cfg.validate();
        return cfg;
    }
    if (!root.IsMap()) {
        fail("top-level configuration must be a map");
    }

    try {
        if (const auto logging = root["logging"]) {
            read_scalar(logging, "level", cfg.log_level);
        }
        read_factor_weights(root, cfg.weights);
        read_categories(root, cfg.weights);
        read_rationale_rules(root, cfg.rules);
        read_fusion(root, cfg.fusion);
        read_ranking(root, cfg.ranker);
    } catch (const YAML::Exception& e) {
        fail(fmt::format("invalid configuration value: {}", e.what()));
    }

    cfg.validate();
    return cfg;
}

EngineConfig ConfigLoader::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        fail(fmt::format("cannot open configuration file '{}'", path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    log::logger()->info("loading configuration from {}", path);
    return parse_string(buffer.str());
}

}  // namespace qrank
