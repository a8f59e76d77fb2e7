#pragma once
#include <string>
#include <vector>
#include "GraphQueryEngine.hpp"
#include "NodeCache.hpp"
#include "../core/KnowledgeNode.hpp"
#include "../core/NodeIdNormalizer.hpp"
#include "../core/RecommenderConfig.hpp"

/*
  Fetches every candidate node with its label, optional lexical attributes
  and prerequisite edges in one aggregate SPARQL query. Rows repeat per
  prerequisite; they are folded into one KnowledgeNode per id.
*/
class KnowledgeGraphService {
public:
    KnowledgeGraphService(GraphQueryEngine& engine, const RecommenderConfig& config,
        const NodeIdNormalizer& normalizer, NodeCache* cache = nullptr);

    // GraphError propagates.
    NodeMap fetchNodes(LanguageScope scope);
    NodeMap fetchNodes() { return fetchNodes(default_scope); }

    std::string buildQuery(LanguageScope scope) const;
    NodeMap foldRows(const std::vector<BindingRow>& rows) const;

private:
    GraphQueryEngine& engine;
    const NodeIdNormalizer& normalizer;
    NodeCache* cache;

    std::vector<std::string> node_kinds;
    std::vector<std::string> placeholder_prefixes;
    LanguageScope default_scope;

    void applyAttributes(KnowledgeNode& node, const BindingRow& row) const;
};
