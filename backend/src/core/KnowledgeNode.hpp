#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>

class KnowledgeNode {
public:
    KnowledgeNode() = default;
    KnowledgeNode(const std::string& id, const std::string& label);

    std::string node_id;
    std::string display_label;

    // Tier data. HSK-style numbered tiers or CEFR-style labels.
    std::optional<int> discrete_level;
    std::optional<std::string> continuous_level;

    // Lexical attributes
    std::optional<double> concreteness;       // 1..5
    std::optional<double> frequency;          // raw count
    std::optional<int> frequency_rank;        // 1 == most frequent
    std::optional<double> age_of_acquisition; // years

    std::set<std::string> prerequisites;

    bool hasTierData() const { return discrete_level.has_value() || continuous_level.has_value(); }
};

using NodeMap = std::map<std::string, KnowledgeNode>;
