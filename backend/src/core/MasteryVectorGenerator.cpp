#include "MasteryVectorGenerator.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

MasteryVectorGenerator::MasteryVectorGenerator(const RecommenderConfig& config)
    : lapse_coefficient(config.lapse_penalty_coefficient),
    interval_ceiling(config.max_interval_for_norm),
    ease_scale(config.ease_scale)
{
}

MasteryVector MasteryVectorGenerator::generate(const ReviewStateMap& states) const {
    MasteryVector vector;
    for (const auto& entry : states) {
        if (entry.second.empty()) continue;
        vector[entry.first] = score(entry.second);
    }
    spdlog::info("Mastery vector built for {} nodes", vector.size());
    return vector;
}

/* -------------------------
   Mastery model
   -------------------------
     normalized = ln(min_interval + 1) / ln(ceiling + 1)
     ease_term  = (mean ease / ease_scale) * 0.2      (0 when no card has an ease factor)
     penalty    = total_lapses * lapse_coefficient
     score      = clamp(normalized + ease_term - penalty, 0, 1)

   Negative intervals and lapse counts from a broken source count as zero.
*/
double MasteryVectorGenerator::score(const std::vector<ReviewState>& states) const {
    if (states.empty()) return 0.0;

    double min_interval = std::max(0.0, states.front().interval_days);
    long total_lapses = 0;
    double ease_sum = 0.0;
    int ease_count = 0;

    for (const auto& s : states) {
        min_interval = std::min(min_interval, std::max(0.0, s.interval_days));
        total_lapses += std::max(0, s.lapses);
        if (s.ease_factor && *s.ease_factor > 0) {
            ease_sum += *s.ease_factor;
            ++ease_count;
        }
    }

    double normalized = std::log(min_interval + 1.0) / std::log(interval_ceiling + 1.0);
    double ease_term = 0.0;
    if (ease_count > 0) {
        ease_term = (ease_sum / ease_count / ease_scale) * kEaseWeight;
    }
    double penalty = static_cast<double>(total_lapses) * lapse_coefficient;

    double result = std::clamp(normalized + ease_term - penalty, 0.0, 1.0);

    spdlog::debug("Mastery: node='{}' cards={} min_interval={:.1f} lapses={} ease_term={:.3f} -> {:.3f}",
        states.front().node_id, states.size(), min_interval, total_lapses, ease_term, result);
    return result;
}

void MasteryVectorGenerator::applyOverrides(MasteryVector& vector, const std::set<std::string>& mastered) {
    for (const auto& id : mastered) {
        vector[id] = 1.0;
    }
    if (!mastered.empty())
        spdlog::info("Applied {} mastery overrides", mastered.size());
}
