#pragma once
#include <string>
#include <variant>
#include <vector>

// Older notes: a flat list of node ids per card index.
struct LegacyLinkage {
    std::vector<std::string> node_ids;
};

// Current notes: a relation whose target (or, failing that, source) is the node.
struct RelationLinkage {
    std::string source;
    std::string target;

    const std::string& nodeId() const { return target.empty() ? source : target; }
};

struct LinkageEntry {
    int index = 0;
    std::variant<LegacyLinkage, RelationLinkage> link;
};

using LinkageBlock = std::vector<LinkageEntry>;

// Parses the JSON text of a note's linkage field. Returns false on unparsable
// JSON or a non-array document; individual unusable entries are skipped.
bool parseLinkageBlock(const std::string& raw, LinkageBlock& out);

// Node ids linked to the given card index; the first matching entry wins.
std::vector<std::string> nodeIdsForIndex(const LinkageBlock& block, int index);
