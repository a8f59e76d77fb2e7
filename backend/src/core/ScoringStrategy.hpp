#pragma once
#include <memory>
#include <optional>
#include "KnowledgeNode.hpp"
#include "LearningFrontier.hpp"
#include "Recommendation.hpp"
#include "RecommenderConfig.hpp"
#include "SimilarityIndex.hpp"

struct CandidateScore {
    double score = 0.0;
    bool excluded = false;   // a hard filter fired; score holds the sentinel
};

// Everything a strategy needs besides the config, fixed for one invocation.
struct ScoringContext {
    const LearningFrontierDetector* detector = nullptr;
    std::optional<Frontier> frontier;
    const MasteryVector* mastery = nullptr;
    const SimilarityIndex* similarity = nullptr;   // optional
};

class ScoringStrategy {
public:
    static constexpr double kExcludedScore = 0.01;

    virtual ~ScoringStrategy() = default;

    virtual Regime regime() const = 0;

    // Score an exploratory candidate that already passed the mastery and prerequisite gates.
    virtual CandidateScore score(const KnowledgeNode& node, double mastery, double prereq_mastery) const = 0;

    static std::unique_ptr<ScoringStrategy> create(Regime regime, const RecommenderConfig& config,
        const ScoringContext& context);

protected:
    ScoringStrategy(const RecommenderConfig& config, const ScoringContext& context);

    // readiness * challenge_weight + prereq_mastery * prereq_weight
    double baseScore(double mastery, double prereq_mastery) const;

    // True if a mental age is configured and the node is learned later than mental_age + buffer.
    bool exceedsAoaCeiling(const KnowledgeNode& node) const;

    static CandidateScore excluded() { return CandidateScore{kExcludedScore, true}; }

    const RecommenderConfig& config;
    ScoringContext context;
};
