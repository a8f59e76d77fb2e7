#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

// Spaced-repetition state of a single card, as read from the telemetry source.
struct ReviewState {
    std::string node_id;
    double interval_days = 0.0;
    int lapses = 0;
    int reps = 0;
    std::optional<int> ease_factor;   // permille, e.g. 2500 == 250%
};

using ReviewStateMap = std::map<std::string, std::vector<ReviewState>>;

// node_id -> mastery in [0,1]. A missing key means 0.0.
using MasteryVector = std::map<std::string, double>;

inline double masteryOf(const MasteryVector& vector, const std::string& node_id) {
    auto it = vector.find(node_id);
    return it == vector.end() ? 0.0 : it->second;
}
