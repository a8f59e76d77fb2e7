#pragma once
#include <set>
#include <string>
#include "NodeIdNormalizer.hpp"
#include "Recommendation.hpp"
#include "RecommenderConfig.hpp"
#include "SimilarityIndex.hpp"
#include "../graph/GraphQueryEngine.hpp"
#include "../graph/NodeCache.hpp"
#include "../telemetry/TelemetrySource.hpp"

/*
  Single entry point of the engine:
    telemetry -> mastery vector
    knowledge graph -> nodes
    regime + frontier -> scoring strategy -> exploratory / remedial lists

  Holds no state between calls beyond its read-only inputs. Collaborator
  errors (TelemetryError, GraphError) propagate untouched.
*/
class Recommender {
public:
    Recommender(const RecommenderConfig& config, TelemetrySource& telemetry, GraphQueryEngine& graph,
        const std::string& telemetry_filter = "_KG_Map:*");

    MasteryVector buildMasteryVector() const;
    NodeMap fetchNodes() const;

    // Pure ranking over already-fetched inputs.
    RecommendationResult rank(MasteryVector mastery, NodeMap nodes) const;

    // buildMasteryVector + fetchNodes + rank
    RecommendationResult generateRecommendations() const;

    void setNodeCache(NodeCache* node_cache) { cache = node_cache; }
    void setSimilarityIndex(const SimilarityIndex* index) { similarity = index; }
    // Ids are normalized; they are treated as fully mastered.
    void setMasteryOverrides(const std::set<std::string>& ids);

    const RecommenderConfig& config() const { return cfg; }

private:
    RecommenderConfig cfg;
    TelemetrySource& telemetry;
    GraphQueryEngine& graph;
    std::string filter;
    NodeIdNormalizer normalizer;

    NodeCache* cache = nullptr;
    const SimilarityIndex* similarity = nullptr;
    std::set<std::string> overrides;
};
