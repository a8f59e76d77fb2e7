#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "TelemetrySource.hpp"
#include "../net/HttpClient.hpp"

/*
  Reads card state from a running Anki instance through the AnkiConnect
  add-on (JSON-over-HTTP, API version 6):
    version -> findNotes(filter) -> notesInfo (chunks of 250) -> cardsInfo (chunks of 250)
  Each card becomes one RawReviewRecord carrying its note's linkage field.
*/
class AnkiConnectSource : public TelemetrySource {
public:
    AnkiConnectSource(const HttpClient& http, const std::string& url = "http://localhost:8765",
        const std::string& linkage_field = "_KG_Map");

    std::vector<RawReviewRecord> query(const std::string& filter) override;
    std::string name() const override { return "AnkiConnect"; }

    static constexpr std::size_t kChunkSize = 250;
    static constexpr int kApiVersion = 6;

private:
    const HttpClient& http;
    std::string url;
    std::string linkage_field;

    nlohmann::json invoke(const std::string& action, const nlohmann::json& params = nullptr) const;
    std::string linkageOf(const nlohmann::json& note) const;
    void checkVersion() const;
};
