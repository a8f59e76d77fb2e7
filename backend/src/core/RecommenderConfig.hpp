#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Restricts the knowledge graph query to one tier system.
enum class LanguageScope {
    Any,
    Discrete,
    Continuous
};

std::string scopeName(LanguageScope scope);
bool parseScope(const std::string& text, LanguageScope& out);

struct RecommenderConfig {
    // Thresholds
    double mastery_threshold = 0.85;
    double prereq_threshold = 0.75;
    double remedial_threshold = 0.45;

    // Base score weights
    double challenge_weight = 0.7;
    double prereq_weight = 0.3;

    // Discrete-tier regime
    std::optional<int> target_discrete_level;   // used when no frontier is found
    double match_bonus = 0.1;
    double tier_penalty = 0.05;

    // Mastery model
    double lapse_penalty_coefficient = 0.12;
    double max_interval_for_norm = 120.0;       // days
    double ease_scale = 3500.0;

    int top_n = 20;

    // Continuous-tier regime. 0.0 = frequency (utility), 1.0 = concreteness (ease)
    double slider = 0.5;
    double semantic_similarity_weight = 1.5;
    std::vector<std::string> continuous_tier_order{"A1", "A2", "B1", "B2", "C1", "C2"};

    bool auto_detect_language = true;
    std::optional<double> mental_age;
    double aoa_buffer = 2.0;

    double frontier_mastered_fraction = 0.8;

    // Knowledge graph query
    std::vector<std::string> node_kinds{"srs-kg:Word"};
    std::vector<std::string> placeholder_label_prefixes{"synset:", "concept:"};
    LanguageScope language_scope = LanguageScope::Any;

    static constexpr int kFallbackDiscreteLevel = 3;

    int fallbackDiscreteLevel() const { return target_discrete_level.value_or(kFallbackDiscreteLevel); }

    // Throws ConfigError when a field is out of range.
    void validate() const;

    static RecommenderConfig fromJson(const nlohmann::json& doc);
};

RecommenderConfig loadConfigFile(const std::string& path);
