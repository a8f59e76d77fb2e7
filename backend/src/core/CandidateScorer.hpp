#pragma once
#include <string>
#include <vector>
#include "KnowledgeNode.hpp"
#include "LearningFrontier.hpp"
#include "Recommendation.hpp"
#include "RecommenderConfig.hpp"
#include "ScoringStrategy.hpp"

struct ExploratoryRanking {
    std::vector<Recommendation> ranked;      // descending score, capped at top_n
    std::vector<std::string> excluded;       // hard-filtered by the strategy
};

class CandidateScorer {
public:
    CandidateScorer(const RecommenderConfig& config, const ScoringStrategy& strategy,
        const LearningFrontierDetector& detector);

    // Unmastered nodes whose prerequisites are all at or above prereq_threshold.
    ExploratoryRanking exploratory(const NodeMap& nodes, const MasteryVector& mastery) const;

    // Previously-reviewed nodes below remedial_threshold, weakest first.
    std::vector<Recommendation> remedial(const NodeMap& nodes, const MasteryVector& mastery) const;

    // Minimum prerequisite mastery, 1.0 without prerequisites.
    static double prereqMastery(const KnowledgeNode& node, const MasteryVector& mastery);
    std::vector<std::string> missingPrereqs(const KnowledgeNode& node, const MasteryVector& mastery) const;

private:
    const RecommenderConfig& config;
    const ScoringStrategy& strategy;
    const LearningFrontierDetector& detector;

    Recommendation makeRecommendation(const KnowledgeNode& node, double mastery) const;
    std::string levelLabel(const KnowledgeNode& node) const;
};
