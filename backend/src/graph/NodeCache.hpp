#pragma once
#include <map>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "../core/KnowledgeNode.hpp"

// Caller-owned memo of knowledge graph fetches. Nothing expires on its own;
// owners call invalidate() when the graph changes.
class NodeCache {
public:
    // scope|kinds|placeholder prefixes; every input that shapes the query.
    static std::string keyFor(const std::string& scope, const std::vector<std::string>& kinds,
        const std::vector<std::string>& placeholder_prefixes) {
        std::string key = scope + "|";
        appendList(key, kinds);
        key += "|";
        appendList(key, placeholder_prefixes);
        return key;
    }

    bool get(const std::string& key, NodeMap& out) const {
        auto it = entries.find(key);
        if (it == entries.end()) return false;
        out = it->second;
        spdlog::debug("Node cache hit '{}' ({} nodes)", key, out.size());
        return true;
    }

    void put(const std::string& key, const NodeMap& nodes) {
        entries[key] = nodes;
    }

    void invalidate() {
        spdlog::info("Node cache cleared ({} entries)", entries.size());
        entries.clear();
    }

    void invalidate(const std::string& key) {
        if (entries.erase(key)) spdlog::info("Node cache entry '{}' invalidated", key);
    }

    size_t size() const { return entries.size(); }

private:
    std::map<std::string, NodeMap> entries;

    static void appendList(std::string& key, const std::vector<std::string>& items) {
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) key += ",";
            key += items[i];
        }
    }
};
