#include "TelemetryAdapter.hpp"
#include "Linkage.hpp"
#include <unordered_map>
#include <spdlog/spdlog.h>

TelemetryAdapter::TelemetryAdapter(TelemetrySource& src, const NodeIdNormalizer& norm, const std::string& f)
    : source(src), normalizer(norm), filter(f)
{
}

ReviewStateMap TelemetryAdapter::fetchReviewStates() {
    spdlog::info("Querying {} for review records (filter '{}')", source.name(), filter);
    std::vector<RawReviewRecord> records = source.query(filter);
    spdlog::info("{} returned {} review records", source.name(), records.size());
    return group(records);
}

ReviewStateMap TelemetryAdapter::group(const std::vector<RawReviewRecord>& records) const {
    ReviewStateMap out;
    std::size_t skipped = 0;

    // Cards of one note share the linkage block; parse it once per note.
    std::unordered_map<long long, LinkageBlock> parsed;
    std::unordered_map<long long, bool> broken;

    for (const auto& r : records) {
        if (r.linkage.empty()) {
            ++skipped;
            continue;
        }

        if (broken.count(r.note_id)) {
            ++skipped;
            continue;
        }

        auto it = parsed.find(r.note_id);
        if (it == parsed.end() || r.note_id == 0) {
            LinkageBlock block;
            if (!parseLinkageBlock(r.linkage, block)) {
                spdlog::warn("Skipping card {}: malformed linkage block '{}'",
                    r.card_id, r.linkage.substr(0, 50));
                if (r.note_id != 0) broken[r.note_id] = true;
                ++skipped;
                continue;
            }
            it = parsed.insert_or_assign(r.note_id, std::move(block)).first;
        }

        std::vector<std::string> ids = nodeIdsForIndex(it->second, r.card_index);
        if (ids.empty()) {
            ++skipped;
            continue;
        }

        for (const auto& raw_id : ids) {
            std::string id = normalizer.normalize(raw_id);
            if (id.empty()) continue;

            ReviewState s;
            s.node_id = id;
            s.interval_days = r.interval_days;
            s.lapses = r.lapses;
            s.reps = r.reps;
            if (r.ease_factor && *r.ease_factor > 0) s.ease_factor = r.ease_factor;
            out[id].push_back(s);
        }
    }

    spdlog::info("Grouped review states for {} nodes ({} records without usable linkage)", out.size(), skipped);
    return out;
}
