#pragma once
#include <string>
#include "ScoringStrategy.hpp"

/*
  Labelled-tier corpora (CEFR-style): filter then rank.

  Hard filters (sentinel score):
    - tier more than one step above the frontier
    - age of acquisition above mental_age + aoa_buffer

  Ranking, each component in [0,1] and 0.5 when the attribute is missing:
    concreteness = (c - 1) / 4
    aoa          = max(0, 1 - aoa / 15)
    frequency    = 1 - ln(rank) / ln(20000), or log10(freq + 1) / log10(50000) without a rank
    ease         = 0.7 * concreteness + 0.3 * aoa
    weighted     = (1 - slider) * frequency + slider * ease
    score        = weighted * 10 + 0.1 * (1 - mastery) + semantic boost
*/
class ContinuousTierStrategy : public ScoringStrategy {
public:
    ContinuousTierStrategy(const RecommenderConfig& config, const ScoringContext& context);

    Regime regime() const override { return Regime::Continuous; }
    CandidateScore score(const KnowledgeNode& node, double mastery, double prereq_mastery) const override;

    static double concretenessScore(const KnowledgeNode& node);
    static double aoaScore(const KnowledgeNode& node);
    static double frequencyScore(const KnowledgeNode& node);

    double semanticBoost(const std::string& node_id) const;

private:
    static constexpr double kNeutral = 0.5;
    static constexpr double kMaxRank = 20000.0;
    static constexpr double kMaxFrequency = 50000.0;
    static constexpr double kAoaRangeYears = 15.0;
    static constexpr double kConcretenessShare = 0.7;
    static constexpr double kScale = 10.0;
    static constexpr double kReadinessBonus = 0.1;
};
