#pragma once
#include <optional>
#include <string>
#include <vector>
#include "KnowledgeNode.hpp"
#include "ReviewState.hpp"

enum class Regime {
    Discrete,    // numbered tiers (HSK 1..6)
    Continuous   // ordered labels (CEFR A1..C2)
};

std::string regimeName(Regime regime);

struct Frontier {
    int rank = 0;         // discrete: the level itself, continuous: index into the tier order
    std::string label;
};

struct Recommendation {
    std::string node_id;
    std::string label;
    std::string level;            // tier label in the detected regime, empty when unknown
    double mastery = 0.0;
    double prereq_mastery = 1.0;
    double score = 0.0;
    std::vector<std::string> missing_prereqs;
};

struct RecommendationResult {
    std::vector<Recommendation> exploratory;
    std::vector<Recommendation> remedial;
    MasteryVector mastery;
    NodeMap nodes;
    Regime regime = Regime::Discrete;
    std::optional<Frontier> frontier;
    std::vector<std::string> excluded;   // candidates dropped by a hard filter
};
