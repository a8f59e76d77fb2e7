#include "AnkiConnectSource.hpp"
#include <algorithm>
#include <unordered_map>
#include <spdlog/spdlog.h>

using nlohmann::json;

AnkiConnectSource::AnkiConnectSource(const HttpClient& client, const std::string& endpoint,
    const std::string& field)
    : http(client), url(endpoint), linkage_field(field)
{
}

json AnkiConnectSource::invoke(const std::string& action, const json& params) const {
    json payload = {{"action", action}, {"version", kApiVersion}};
    if (!params.is_null()) payload["params"] = params;

    HttpResponse res;
    try {
        res = http.postJson(url, payload.dump());
    }
    catch (const HttpError& e) {
        spdlog::error("AnkiConnect '{}' failed: {}", action, e.what());
        throw TelemetryError(e.isTimeout() ? TelemetryError::Kind::Timeout : TelemetryError::Kind::Other,
            std::string("AnkiConnect unreachable: ") + e.what());
    }

    if (!res.ok()) {
        throw TelemetryError(TelemetryError::Kind::Other,
            "AnkiConnect '" + action + "' returned HTTP " + std::to_string(res.status));
    }

    json doc = json::parse(res.body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw TelemetryError(TelemetryError::Kind::Other, "AnkiConnect '" + action + "' returned malformed JSON");
    }

    auto err = doc.find("error");
    if (err != doc.end() && !err->is_null()) {
        std::string msg = err->is_string() ? err->get<std::string>() : err->dump();
        throw TelemetryError(TelemetryError::Kind::Other, "AnkiConnect error: " + msg);
    }

    auto result = doc.find("result");
    return result == doc.end() ? json() : *result;
}

// A failed version request means the add-on is not usable; a timeout stays a timeout.
void AnkiConnectSource::checkVersion() const {
    try {
        json version = invoke("version");
        spdlog::debug("AnkiConnect API version {}", version.dump());
    }
    catch (const TelemetryError& e) {
        if (e.isTimeout()) throw;
        throw TelemetryError(TelemetryError::Kind::Other, std::string("AnkiConnect version check failed: ") + e.what());
    }
}

// Field values arrive either as {"value": "...", "order": n} or as plain strings.
std::string AnkiConnectSource::linkageOf(const json& note) const {
    auto fields = note.find("fields");
    if (fields == note.end() || !fields->is_object()) return "";

    auto f = fields->find(linkage_field);
    if (f == fields->end()) return "";
    if (f->is_string()) return f->get<std::string>();
    if (f->is_object()) {
        auto v = f->find("value");
        if (v != f->end() && v->is_string()) return v->get<std::string>();
    }
    return "";
}

template <typename T>
static T numberOr(const json& obj, const char* key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return fallback;
    return it->get<T>();
}

std::vector<RawReviewRecord> AnkiConnectSource::query(const std::string& filter) {
    checkVersion();

    json note_ids = invoke("findNotes", {{"query", filter}});
    if (!note_ids.is_array() || note_ids.empty()) {
        spdlog::warn("No notes matched '{}'", filter);
        return {};
    }

    std::vector<long long> ids;
    for (const auto& n : note_ids) {
        if (n.is_number_integer()) ids.push_back(n.get<long long>());
    }
    std::unordered_map<long long, std::string> linkage_by_note;
    std::vector<long long> card_ids;

    for (std::size_t i = 0; i < ids.size(); i += kChunkSize) {
        std::vector<long long> chunk(ids.begin() + i, ids.begin() + std::min(ids.size(), i + kChunkSize));
        json notes = invoke("notesInfo", {{"notes", chunk}});
        if (!notes.is_array()) continue;

        for (const auto& note : notes) {
            if (!note.is_object()) continue;
            long long note_id = numberOr<long long>(note, "noteId", 0);
            std::string linkage = linkageOf(note);
            if (linkage.empty()) continue;

            linkage_by_note[note_id] = linkage;
            auto cards = note.find("cards");
            if (cards != note.end() && cards->is_array()) {
                for (const auto& c : *cards) {
                    if (c.is_number_integer()) card_ids.push_back(c.get<long long>());
                }
            }
        }
    }
    spdlog::debug("AnkiConnect: {} notes with linkage, {} cards", linkage_by_note.size(), card_ids.size());

    std::vector<RawReviewRecord> records;
    records.reserve(card_ids.size());

    for (std::size_t i = 0; i < card_ids.size(); i += kChunkSize) {
        std::vector<long long> chunk(card_ids.begin() + i,
            card_ids.begin() + std::min(card_ids.size(), i + kChunkSize));
        json cards = invoke("cardsInfo", {{"cards", chunk}});
        if (!cards.is_array()) continue;

        for (const auto& card : cards) {
            if (!card.is_object()) continue;

            RawReviewRecord r;
            r.card_id = numberOr<long long>(card, "cardId", 0);
            r.note_id = numberOr<long long>(card, "note", 0);
            r.card_index = numberOr<int>(card, "ord", 0) + 1;
            r.interval_days = numberOr<double>(card, "interval", 0.0);
            r.lapses = numberOr<int>(card, "lapses", 0);
            r.reps = numberOr<int>(card, "reps", 0);
            int factor = numberOr<int>(card, "factor", 0);
            if (factor > 0) r.ease_factor = factor;

            auto link = linkage_by_note.find(r.note_id);
            if (link == linkage_by_note.end()) continue;
            r.linkage = link->second;
            records.push_back(std::move(r));
        }
    }

    return records;
}
