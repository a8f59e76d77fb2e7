#pragma once
#include <set>
#include <string>
#include <vector>
#include "ReviewState.hpp"
#include "RecommenderConfig.hpp"

/*
  Converts per-node review telemetry into a mastery score in [0,1]:
   - log-normalized minimum interval (the weakest card decides)
   - a small bonus for the average ease factor
   - a linear penalty per lapse
*/
class MasteryVectorGenerator {
public:
    explicit MasteryVectorGenerator(const RecommenderConfig& config);

    MasteryVector generate(const ReviewStateMap& states) const;

    double score(const std::vector<ReviewState>& states) const;

    // Explicitly-mastered node ids are raised to full mastery.
    static void applyOverrides(MasteryVector& vector, const std::set<std::string>& mastered);

private:
    double lapse_coefficient;
    double interval_ceiling;
    double ease_scale;

    static constexpr double kEaseWeight = 0.2;
};
