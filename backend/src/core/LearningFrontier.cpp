#include "LearningFrontier.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <spdlog/spdlog.h>

std::string regimeName(Regime regime) {
    return regime == Regime::Continuous ? "continuous" : "discrete";
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

LearningFrontierDetector::LearningFrontierDetector(const RecommenderConfig& config)
    : auto_detect(config.auto_detect_language),
    mastery_threshold(config.mastery_threshold),
    mastered_fraction(config.frontier_mastered_fraction)
{
    tier_order.reserve(config.continuous_tier_order.size());
    for (const auto& t : config.continuous_tier_order) {
        tier_order.push_back(upper(t));
    }
}

/*
  Regime detection:
    1. tier counts decide (continuous-only vs discrete-only, else majority;
       equal counts stay discrete)
    2. without any tier data, the label script decides: mostly Latin
       labels mean a continuous (CEFR-style) corpus
  Auto-detection disabled means discrete.
*/
Regime LearningFrontierDetector::detectRegime(const NodeMap& nodes) const {
    if (!auto_detect) return Regime::Discrete;

    std::size_t discrete = 0;
    std::size_t continuous = 0;
    for (const auto& p : nodes) {
        if (p.second.discrete_level) ++discrete;
        if (p.second.continuous_level) ++continuous;
    }

    if (continuous > 0 || discrete > 0) {
        Regime r = continuous > discrete ? Regime::Continuous : Regime::Discrete;
        spdlog::debug("Regime by tier counts: discrete={} continuous={} -> {}", discrete, continuous, regimeName(r));
        return r;
    }

    std::size_t latin = 0;
    for (const auto& p : nodes) {
        if (labelLooksLatin(p.second.display_label)) ++latin;
    }
    Regime r = (latin * 2 > nodes.size()) ? Regime::Continuous : Regime::Discrete;
    spdlog::debug("Regime by label script: latin={} of {} -> {}", latin, nodes.size(), regimeName(r));
    return r;
}

// True if one of the first ten code points is ASCII.
bool LearningFrontierDetector::labelLooksLatin(const std::string& label) {
    int code_points = 0;
    for (unsigned char c : label) {
        if ((c & 0xC0) == 0x80) continue;   // UTF-8 continuation byte
        if (code_points++ >= 10) break;
        if (c < 0x80) return true;
    }
    return false;
}

std::optional<int> LearningFrontierDetector::tierRank(const KnowledgeNode& node, Regime regime) const {
    if (regime == Regime::Discrete) {
        return node.discrete_level;
    }
    if (!node.continuous_level) return std::nullopt;

    auto it = std::find(tier_order.begin(), tier_order.end(), upper(*node.continuous_level));
    if (it == tier_order.end()) return std::nullopt;
    return static_cast<int>(it - tier_order.begin());
}

std::string LearningFrontierDetector::tierLabel(int rank, Regime regime) const {
    if (regime == Regime::Discrete) return std::to_string(rank);
    if (rank < 0 || rank >= static_cast<int>(tier_order.size())) return "";
    return tier_order[static_cast<std::size_t>(rank)];
}

std::optional<Frontier> LearningFrontierDetector::findFrontier(const NodeMap& nodes,
    const MasteryVector& mastery, Regime regime) const
{
    struct Tally { int mastered = 0; int total = 0; };
    std::map<int, Tally> by_tier;   // ordered easiest first

    for (const auto& p : nodes) {
        auto rank = tierRank(p.second, regime);
        if (!rank) continue;
        Tally& t = by_tier[*rank];
        ++t.total;
        if (masteryOf(mastery, p.first) >= mastery_threshold) ++t.mastered;
    }

    if (by_tier.empty()) {
        spdlog::info("No tier data in {} nodes; learning frontier unknown", nodes.size());
        return std::nullopt;
    }

    for (const auto& p : by_tier) {
        double fraction = static_cast<double>(p.second.mastered) / p.second.total;
        spdlog::debug("Tier {}: {}/{} mastered ({:.2f})", tierLabel(p.first, regime),
            p.second.mastered, p.second.total, fraction);
        if (fraction < mastered_fraction) {
            Frontier f{p.first, tierLabel(p.first, regime)};
            spdlog::info("Learning frontier ({}): {}", regimeName(regime), f.label);
            return f;
        }
    }

    int hardest = by_tier.rbegin()->first;
    Frontier f{hardest, tierLabel(hardest, regime)};
    spdlog::info("Every tier mastered; learning frontier ({}) stays at hardest tier {}", regimeName(regime), f.label);
    return f;
}
