#include "ScoringStrategy.hpp"
#include "ContinuousTierStrategy.hpp"
#include "DiscreteTierStrategy.hpp"
#include <stdexcept>

ScoringStrategy::ScoringStrategy(const RecommenderConfig& cfg, const ScoringContext& ctx)
    : config(cfg), context(ctx)
{
    if (!context.detector || !context.mastery) {
        throw std::invalid_argument("ScoringStrategy needs a frontier detector and a mastery vector");
    }
}

std::unique_ptr<ScoringStrategy> ScoringStrategy::create(Regime regime, const RecommenderConfig& config,
    const ScoringContext& context)
{
    if (regime == Regime::Continuous) {
        return std::make_unique<ContinuousTierStrategy>(config, context);
    }
    return std::make_unique<DiscreteTierStrategy>(config, context);
}

double ScoringStrategy::baseScore(double mastery, double prereq_mastery) const {
    double readiness = 1.0 - mastery;
    return readiness * config.challenge_weight + prereq_mastery * config.prereq_weight;
}

bool ScoringStrategy::exceedsAoaCeiling(const KnowledgeNode& node) const {
    if (!config.mental_age || !node.age_of_acquisition) return false;
    return *node.age_of_acquisition > *config.mental_age + config.aoa_buffer;
}
