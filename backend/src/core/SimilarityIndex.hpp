#pragma once
#include <map>
#include <string>
#include <vector>

struct SimilarNeighbour {
    std::string neighbor_id;
    double similarity = 0.0;
};

// node_id -> semantically similar nodes
using SimilarityIndex = std::map<std::string, std::vector<SimilarNeighbour>>;
