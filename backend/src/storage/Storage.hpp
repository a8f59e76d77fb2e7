#pragma once
#include <set>
#include <vector>
#include <string>
#include "../core/SimilarityIndex.hpp"
#include "../telemetry/TelemetrySource.hpp"

// Storage handles the JSON files the CLI can read instead of live services.
//
// Review export: array of card objects in AnkiConnect cardsInfo shape
//   {"cardId", "note", "ord", "interval", "lapses", "reps", "factor", "linkage"}
//   where "linkage" is the note's linkage block as a string or as embedded JSON.
//
// Similarity index: {"<node id>": [{"neighbor_id": "...", "similarity": 0.42}, ...]}
//
// Mastered list: plain text, one node id per line, '#' starts a comment.

class Storage {
public:
    static bool loadReviewExport(std::vector<RawReviewRecord>& records, const std::string& filename);
    static bool loadSimilarityIndex(SimilarityIndex& index, const std::string& filename);
    static bool loadMasteredList(std::set<std::string>& ids, const std::string& filename);
};

// Telemetry source backed by a review export file. The filter is not applied.
class ReviewExportSource : public TelemetrySource {
public:
    explicit ReviewExportSource(const std::string& filename);

    std::vector<RawReviewRecord> query(const std::string& filter) override;
    std::string name() const override { return "review export '" + path + "'"; }

private:
    std::string path;
};
