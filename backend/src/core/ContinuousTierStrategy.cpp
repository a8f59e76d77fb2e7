#include "ContinuousTierStrategy.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

ContinuousTierStrategy::ContinuousTierStrategy(const RecommenderConfig& cfg, const ScoringContext& ctx)
    : ScoringStrategy(cfg, ctx)
{
}

double ContinuousTierStrategy::concretenessScore(const KnowledgeNode& node) {
    if (!node.concreteness || *node.concreteness <= 0.0) return kNeutral;
    return std::clamp((*node.concreteness - 1.0) / 4.0, 0.0, 1.0);
}

double ContinuousTierStrategy::aoaScore(const KnowledgeNode& node) {
    if (!node.age_of_acquisition) return kNeutral;
    return std::clamp(1.0 - *node.age_of_acquisition / kAoaRangeYears, 0.0, 1.0);
}

// Rank wins over raw frequency when both are known. A rank of 0 counts as
// unknown; negative ranks clamp to 1.
double ContinuousTierStrategy::frequencyScore(const KnowledgeNode& node) {
    if (node.frequency_rank && *node.frequency_rank != 0) {
        double rank = std::clamp(static_cast<double>(*node.frequency_rank), 1.0, kMaxRank);
        return std::max(0.0, 1.0 - std::log(rank) / std::log(kMaxRank));
    }
    if (node.frequency && *node.frequency > 0.0) {
        return std::min(1.0, std::log10(*node.frequency + 1.0) / std::log10(kMaxFrequency));
    }
    return kNeutral;
}

double ContinuousTierStrategy::semanticBoost(const std::string& node_id) const {
    if (!context.similarity) return 0.0;
    auto it = context.similarity->find(node_id);
    if (it == context.similarity->end()) return 0.0;

    double sum = 0.0;
    for (const auto& n : it->second) {
        if (masteryOf(*context.mastery, n.neighbor_id) >= config.mastery_threshold) {
            sum += n.similarity;
        }
    }
    return sum * config.semantic_similarity_weight;
}

CandidateScore ContinuousTierStrategy::score(const KnowledgeNode& node, double mastery, double) const {
    if (context.frontier) {
        auto rank = context.detector->tierRank(node, Regime::Continuous);
        if (rank && *rank > context.frontier->rank + 1) {
            spdlog::debug("Excluded '{}': tier {} is beyond frontier {} + 1",
                node.node_id, *node.continuous_level, context.frontier->label);
            return excluded();
        }
    }

    if (exceedsAoaCeiling(node)) {
        spdlog::debug("Excluded '{}': AoA {:.1f} above ceiling", node.node_id, *node.age_of_acquisition);
        return excluded();
    }

    double conc = concretenessScore(node);
    double aoa = aoaScore(node);
    double freq = frequencyScore(node);

    double ease = kConcretenessShare * conc + (1.0 - kConcretenessShare) * aoa;
    double weighted = (1.0 - config.slider) * freq + config.slider * ease;

    double s = weighted * kScale + kReadinessBonus * (1.0 - mastery);
    s += semanticBoost(node.node_id);

    spdlog::trace("Score '{}': conc={:.3f} aoa={:.3f} freq={:.3f} ease={:.3f} weighted={:.3f} -> {:.3f}",
        node.node_id, conc, aoa, freq, ease, weighted, s);
    return CandidateScore{s, false};
}
