#include "Linkage.hpp"
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>

using nlohmann::json;

static bool readIndex(const json& value, int& out) {
    if (value.is_number_unsigned()) {
        auto v = value.get<unsigned long long>();
        if (v > static_cast<unsigned long long>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(v);
        return true;
    }
    if (value.is_number_integer()) {
        auto v = value.get<long long>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(v);
        return true;
    }
    if (value.is_number_float()) {
        // Only whole numbers that fit an int name a card.
        double v = value.get<double>();
        if (!std::isfinite(v) || std::trunc(v) != v) return false;
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(v);
        return true;
    }
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        try {
            std::size_t used = 0;
            int v = std::stoi(s, &used);
            if (used != s.size()) return false;
            out = v;
            return true;
        }
        catch (const std::exception&) {
            return false;
        }
    }
    return false;
}

static std::string scalarText(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.dump();
    return "";
}

/*
  Linkage block layout (JSON array):
    [{"card_index": 1, "kg_link": {"source": "...", "target": "..."}},
     {"cloze_index": "2", "kg_ids": ["word-cat", "char-猫"]},
     {"card_index": 3, "kg_ids": "word-dog"}]
*/
bool parseLinkageBlock(const std::string& raw, LinkageBlock& out) {
    out.clear();

    json doc = json::parse(raw, nullptr, false);
    if (doc.is_discarded()) return false;
    if (!doc.is_array()) return false;

    for (const auto& entry : doc) {
        if (!entry.is_object()) continue;

        int index = 0;
        auto idx = entry.find("card_index");
        if (idx == entry.end() || idx->is_null()) idx = entry.find("cloze_index");
        if (idx == entry.end() || !readIndex(*idx, index)) continue;

        auto rel = entry.find("kg_link");
        if (rel != entry.end() && rel->is_object()) {
            RelationLinkage r;
            if (rel->contains("source")) r.source = scalarText(rel->at("source"));
            if (rel->contains("target")) r.target = scalarText(rel->at("target"));
            if (!r.nodeId().empty()) {
                out.push_back(LinkageEntry{index, r});
                continue;
            }
        }

        auto ids = entry.find("kg_ids");
        if (ids == entry.end()) continue;

        LegacyLinkage legacy;
        if (ids->is_array()) {
            for (const auto& k : *ids) {
                std::string s = scalarText(k);
                if (!s.empty()) legacy.node_ids.push_back(s);
            }
        }
        else {
            std::string s = scalarText(*ids);
            if (!s.empty()) legacy.node_ids.push_back(s);
        }
        out.push_back(LinkageEntry{index, legacy});
    }
    return true;
}

std::vector<std::string> nodeIdsForIndex(const LinkageBlock& block, int index) {
    for (const auto& entry : block) {
        if (entry.index != index) continue;

        if (const auto* rel = std::get_if<RelationLinkage>(&entry.link)) {
            return {rel->nodeId()};
        }
        return std::get<LegacyLinkage>(entry.link).node_ids;
    }
    return {};
}
