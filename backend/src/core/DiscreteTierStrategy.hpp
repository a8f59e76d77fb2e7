#pragma once
#include "ScoringStrategy.hpp"

/*
  Numbered-tier corpora (HSK-style). Keeps the shared base score and nudges
  it toward the frontier tier:
    same tier      +match_bonus
    one above      +match_bonus / 2
    further above  -tier_penalty * distance
  plus an age-of-acquisition bonus in [-0.2, +0.2].
*/
class DiscreteTierStrategy : public ScoringStrategy {
public:
    DiscreteTierStrategy(const RecommenderConfig& config, const ScoringContext& context);

    Regime regime() const override { return Regime::Discrete; }
    CandidateScore score(const KnowledgeNode& node, double mastery, double prereq_mastery) const override;

    int targetLevel() const { return target_level; }

private:
    int target_level;

    static constexpr double kAoaRangeYears = 15.0;
    static constexpr double kAoaSpan = 0.4;
};
