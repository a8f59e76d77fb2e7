#pragma once
#include <optional>
#include <string>
#include <vector>
#include "KnowledgeNode.hpp"
#include "Recommendation.hpp"
#include "RecommenderConfig.hpp"

class LearningFrontierDetector {
public:
    explicit LearningFrontierDetector(const RecommenderConfig& config);

    Regime detectRegime(const NodeMap& nodes) const;

    // Easiest tier with less than the configured share of mastered nodes.
    // Falls back to the hardest tier present; empty when no node has tier data.
    std::optional<Frontier> findFrontier(const NodeMap& nodes, const MasteryVector& mastery, Regime regime) const;

    // Position of the node on the regime's ladder (level for discrete, index for continuous).
    std::optional<int> tierRank(const KnowledgeNode& node, Regime regime) const;
    std::string tierLabel(int rank, Regime regime) const;

private:
    bool auto_detect;
    double mastery_threshold;
    double mastered_fraction;
    std::vector<std::string> tier_order;   // upper-cased

    static bool labelLooksLatin(const std::string& label);
};
