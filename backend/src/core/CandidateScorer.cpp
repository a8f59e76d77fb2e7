#include "CandidateScorer.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

CandidateScorer::CandidateScorer(const RecommenderConfig& cfg, const ScoringStrategy& strat,
    const LearningFrontierDetector& det)
    : config(cfg), strategy(strat), detector(det)
{
}

double CandidateScorer::prereqMastery(const KnowledgeNode& node, const MasteryVector& mastery) {
    if (node.prerequisites.empty()) return 1.0;

    double lowest = 1.0;
    for (const auto& p : node.prerequisites) {
        lowest = std::min(lowest, masteryOf(mastery, p));
    }
    return lowest;
}

std::vector<std::string> CandidateScorer::missingPrereqs(const KnowledgeNode& node, const MasteryVector& mastery) const {
    std::vector<std::string> missing;
    for (const auto& p : node.prerequisites) {
        if (masteryOf(mastery, p) < config.prereq_threshold) missing.push_back(p);
    }
    return missing;
}

std::string CandidateScorer::levelLabel(const KnowledgeNode& node) const {
    if (strategy.regime() == Regime::Continuous) {
        auto rank = detector.tierRank(node, Regime::Continuous);
        if (rank) return detector.tierLabel(*rank, Regime::Continuous);
        return node.continuous_level.value_or("");
    }
    return node.discrete_level ? std::to_string(*node.discrete_level) : "";
}

Recommendation CandidateScorer::makeRecommendation(const KnowledgeNode& node, double mastery) const {
    Recommendation rec;
    rec.node_id = node.node_id;
    rec.label = node.display_label;
    rec.level = levelLabel(node);
    rec.mastery = mastery;
    return rec;
}

ExploratoryRanking CandidateScorer::exploratory(const NodeMap& nodes, const MasteryVector& mastery) const {
    ExploratoryRanking out;
    int skipped_mastered = 0;
    int skipped_prereqs = 0;

    for (const auto& p : nodes) {
        const KnowledgeNode& node = p.second;
        double m = masteryOf(mastery, node.node_id);

        if (m >= config.mastery_threshold) {
            ++skipped_mastered;
            continue;
        }

        // Any weak prerequisite drops the node outright
        double prereq = prereqMastery(node, mastery);
        if (!node.prerequisites.empty() && prereq < config.prereq_threshold) {
            ++skipped_prereqs;
            continue;
        }

        CandidateScore cs = strategy.score(node, m, prereq);
        if (cs.excluded) {
            out.excluded.push_back(node.node_id);
            continue;
        }

        Recommendation rec = makeRecommendation(node, m);
        rec.prereq_mastery = prereq;
        rec.score = cs.score;
        out.ranked.push_back(std::move(rec));
    }

    std::sort(out.ranked.begin(), out.ranked.end(),
        [](const Recommendation& a, const Recommendation& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.node_id < b.node_id;
        });

    spdlog::info("Exploratory: {} candidates (skipped {} mastered, {} missing prerequisites, {} filtered)",
        out.ranked.size(), skipped_mastered, skipped_prereqs, out.excluded.size());

    if (out.ranked.size() > static_cast<std::size_t>(config.top_n))
        out.ranked.resize(static_cast<std::size_t>(config.top_n));
    return out;
}

std::vector<Recommendation> CandidateScorer::remedial(const NodeMap& nodes, const MasteryVector& mastery) const {
    std::vector<Recommendation> out;

    for (const auto& entry : mastery) {
        if (entry.second >= config.remedial_threshold) continue;

        auto it = nodes.find(entry.first);
        if (it == nodes.end()) continue;

        Recommendation rec = makeRecommendation(it->second, entry.second);
        rec.prereq_mastery = prereqMastery(it->second, mastery);
        rec.score = entry.second;
        rec.missing_prereqs = missingPrereqs(it->second, mastery);
        out.push_back(std::move(rec));
    }

    std::sort(out.begin(), out.end(),
        [](const Recommendation& a, const Recommendation& b) {
            if (a.mastery != b.mastery) return a.mastery < b.mastery;
            return a.node_id < b.node_id;
        });

    spdlog::info("Remedial: {} weak nodes below {:.2f}", out.size(), config.remedial_threshold);

    if (out.size() > static_cast<std::size_t>(config.top_n))
        out.resize(static_cast<std::size_t>(config.top_n));
    return out;
}
