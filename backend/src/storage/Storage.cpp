#include "Storage.hpp"
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;

static bool readJsonFile(const std::string& filename, json& out) {
    std::ifstream in(filename);
    if (!in) {
        spdlog::error("Failed to open '{}'", filename);
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    out = json::parse(content, nullptr, false);
    if (out.is_discarded()) {
        spdlog::error("'{}' is not valid JSON", filename);
        return false;
    }
    return true;
}

template <typename T>
static T numberOr(const json& obj, const char* key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return fallback;
    return it->get<T>();
}

bool Storage::loadReviewExport(std::vector<RawReviewRecord>& records, const std::string& filename) {
    spdlog::info("Loading review export from '{}'", filename);
    records.clear();

    json doc;
    if (!readJsonFile(filename, doc)) return false;
    if (!doc.is_array()) {
        spdlog::error("Review export '{}' must be a JSON array", filename);
        return false;
    }

    for (const auto& card : doc) {
        if (!card.is_object()) {
            spdlog::warn("Skipping non-object entry in review export");
            continue;
        }

        RawReviewRecord r;
        r.card_id = numberOr<long long>(card, "cardId", 0);
        r.note_id = numberOr<long long>(card, "note", 0);
        r.card_index = numberOr<int>(card, "ord", 0) + 1;
        r.interval_days = numberOr<double>(card, "interval", 0.0);
        r.lapses = numberOr<int>(card, "lapses", 0);
        r.reps = numberOr<int>(card, "reps", 0);
        int factor = numberOr<int>(card, "factor", 0);
        if (factor > 0) r.ease_factor = factor;

        auto link = card.find("linkage");
        if (link != card.end()) {
            r.linkage = link->is_string() ? link->get<std::string>() : link->dump();
        }
        records.push_back(std::move(r));
    }

    spdlog::info("Loaded {} review records", records.size());
    return true;
}

bool Storage::loadSimilarityIndex(SimilarityIndex& index, const std::string& filename) {
    spdlog::info("Loading similarity index from '{}'", filename);
    index.clear();

    json doc;
    if (!readJsonFile(filename, doc)) return false;
    if (!doc.is_object()) {
        spdlog::error("Similarity index '{}' must be a JSON object", filename);
        return false;
    }

    std::size_t pairs = 0;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_array()) continue;

        std::vector<SimilarNeighbour> neighbours;
        for (const auto& n : it.value()) {
            if (!n.is_object()) continue;
            auto id = n.find("neighbor_id");
            if (id == n.end() || !id->is_string() || id->get<std::string>().empty()) continue;
            neighbours.push_back(SimilarNeighbour{id->get<std::string>(), numberOr<double>(n, "similarity", 0.0)});
        }
        pairs += neighbours.size();
        if (!neighbours.empty()) index[it.key()] = std::move(neighbours);
    }

    spdlog::info("Loaded {} similarity pairs for {} nodes", pairs, index.size());
    return true;
}

bool Storage::loadMasteredList(std::set<std::string>& ids, const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        spdlog::error("Failed to open '{}'", filename);
        return false;
    }

    ids.clear();
    std::string line;
    while (std::getline(in, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        auto last = line.find_last_not_of(" \t\r");
        ids.insert(line.substr(first, last - first + 1));
    }

    spdlog::info("Loaded {} mastered ids from '{}'", ids.size(), filename);
    return true;
}

ReviewExportSource::ReviewExportSource(const std::string& filename)
    : path(filename)
{
}

std::vector<RawReviewRecord> ReviewExportSource::query(const std::string& filter) {
    spdlog::debug("Review export ignores filter '{}'", filter);
    std::vector<RawReviewRecord> records;
    if (!Storage::loadReviewExport(records, path)) {
        throw TelemetryError(TelemetryError::Kind::Other, "cannot read review export: " + path);
    }
    return records;
}
