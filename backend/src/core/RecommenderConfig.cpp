#include "RecommenderConfig.hpp"
#include <fstream>
#include <iterator>
#include <set>
#include <spdlog/spdlog.h>

std::string scopeName(LanguageScope scope) {
    switch (scope) {
    case LanguageScope::Discrete: return "discrete";
    case LanguageScope::Continuous: return "continuous";
    default: return "any";
    }
}

bool parseScope(const std::string& text, LanguageScope& out) {
    if (text == "any") out = LanguageScope::Any;
    else if (text == "discrete") out = LanguageScope::Discrete;
    else if (text == "continuous") out = LanguageScope::Continuous;
    else return false;
    return true;
}

static void requireUnit(double value, const char* name) {
    if (value < 0.0 || value > 1.0) {
        throw ConfigError(std::string(name) + " must be within [0, 1], got " + std::to_string(value));
    }
}

void RecommenderConfig::validate() const {
    requireUnit(mastery_threshold, "mastery_threshold");
    requireUnit(prereq_threshold, "prereq_threshold");
    requireUnit(remedial_threshold, "remedial_threshold");
    requireUnit(slider, "slider");
    requireUnit(frontier_mastered_fraction, "frontier_mastered_fraction");

    if (max_interval_for_norm <= 0.0)
        throw ConfigError("max_interval_for_norm must be positive");
    if (ease_scale <= 0.0)
        throw ConfigError("ease_scale must be positive");
    if (lapse_penalty_coefficient < 0.0)
        throw ConfigError("lapse_penalty_coefficient must not be negative");
    if (top_n <= 0)
        throw ConfigError("top_n must be positive");
    if (aoa_buffer < 0.0)
        throw ConfigError("aoa_buffer must not be negative");
    if (continuous_tier_order.empty())
        throw ConfigError("continuous_tier_order must list at least one tier");
    if (node_kinds.empty())
        throw ConfigError("node_kinds must list at least one kind");

    std::set<std::string> seen;
    for (const auto& tier : continuous_tier_order) {
        if (!seen.insert(tier).second)
            throw ConfigError("continuous_tier_order lists '" + tier + "' twice");
    }
}

/* -------------------------
   JSON loading
   -------------------------
   Every key is optional; absent keys keep their defaults. A key with the
   wrong JSON type is a ConfigError, an unknown key only earns a warning.
*/
template <typename T>
static void readField(const nlohmann::json& value, const std::string& key, T& out) {
    try {
        out = value.get<T>();
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError("config key '" + key + "' has the wrong type: " + e.what());
    }
}

template <typename T>
static void readOptional(const nlohmann::json& value, const std::string& key, std::optional<T>& out) {
    if (value.is_null()) {
        out.reset();
        return;
    }
    T tmp{};
    readField(value, key, tmp);
    out = tmp;
}

RecommenderConfig RecommenderConfig::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("recommender config must be a JSON object");
    }

    RecommenderConfig cfg;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& v = it.value();

        if (key == "mastery_threshold") readField(v, key, cfg.mastery_threshold);
        else if (key == "prereq_threshold") readField(v, key, cfg.prereq_threshold);
        else if (key == "remedial_threshold") readField(v, key, cfg.remedial_threshold);
        else if (key == "challenge_weight") readField(v, key, cfg.challenge_weight);
        else if (key == "prereq_weight") readField(v, key, cfg.prereq_weight);
        else if (key == "target_discrete_level") readOptional(v, key, cfg.target_discrete_level);
        else if (key == "match_bonus") readField(v, key, cfg.match_bonus);
        else if (key == "tier_penalty") readField(v, key, cfg.tier_penalty);
        else if (key == "lapse_penalty_coefficient") readField(v, key, cfg.lapse_penalty_coefficient);
        else if (key == "max_interval_for_norm") readField(v, key, cfg.max_interval_for_norm);
        else if (key == "ease_scale") readField(v, key, cfg.ease_scale);
        else if (key == "top_n") readField(v, key, cfg.top_n);
        else if (key == "slider" || key == "concreteness_weight") readField(v, key, cfg.slider);
        else if (key == "semantic_similarity_weight") readField(v, key, cfg.semantic_similarity_weight);
        else if (key == "continuous_tier_order") readField(v, key, cfg.continuous_tier_order);
        else if (key == "auto_detect_language") readField(v, key, cfg.auto_detect_language);
        else if (key == "mental_age") readOptional(v, key, cfg.mental_age);
        else if (key == "aoa_buffer") readField(v, key, cfg.aoa_buffer);
        else if (key == "frontier_mastered_fraction") readField(v, key, cfg.frontier_mastered_fraction);
        else if (key == "node_kinds") readField(v, key, cfg.node_kinds);
        else if (key == "placeholder_label_prefixes") readField(v, key, cfg.placeholder_label_prefixes);
        else if (key == "language_scope") {
            std::string text;
            readField(v, key, text);
            if (!parseScope(text, cfg.language_scope))
                throw ConfigError("language_scope must be any, discrete or continuous, got '" + text + "'");
        }
        else {
            spdlog::warn("Ignoring unknown config key '{}'", key);
        }
    }

    cfg.validate();
    return cfg;
}

RecommenderConfig loadConfigFile(const std::string& path) {
    spdlog::info("Loading recommender config from '{}'", path);
    std::ifstream in(path);
    if (!in) {
        spdlog::error("Failed to open config file '{}'", path);
        throw ConfigError("cannot open config file: " + path);
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    nlohmann::json doc = nlohmann::json::parse(content, nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigError("config file is not valid JSON: " + path);
    }
    return RecommenderConfig::fromJson(doc);
}
