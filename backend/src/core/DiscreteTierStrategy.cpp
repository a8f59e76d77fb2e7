#include "DiscreteTierStrategy.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

DiscreteTierStrategy::DiscreteTierStrategy(const RecommenderConfig& cfg, const ScoringContext& ctx)
    : ScoringStrategy(cfg, ctx),
    target_level(ctx.frontier ? ctx.frontier->rank : cfg.fallbackDiscreteLevel())
{
    spdlog::debug("Discrete scoring targets level {}", target_level);
}

CandidateScore DiscreteTierStrategy::score(const KnowledgeNode& node, double mastery, double prereq_mastery) const {
    if (exceedsAoaCeiling(node)) {
        spdlog::debug("Excluded '{}': AoA {:.1f} above ceiling", node.node_id, *node.age_of_acquisition);
        return excluded();
    }

    double s = baseScore(mastery, prereq_mastery);

    if (node.discrete_level) {
        int diff = *node.discrete_level - target_level;
        if (diff == 0) s += config.match_bonus;
        else if (diff == 1) s += config.match_bonus * 0.5;
        else if (diff > 1) s -= config.tier_penalty * diff;
    }

    // Earlier-acquired words get up to +0.2, late ones down to -0.2
    if (node.age_of_acquisition) {
        double aoa = std::max(0.0, 1.0 - *node.age_of_acquisition / kAoaRangeYears);
        s += (aoa - 0.5) * kAoaSpan;
    }

    return CandidateScore{s, false};
}
