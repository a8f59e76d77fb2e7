#include "SparqlClient.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;

SparqlClient::SparqlClient(const HttpClient& client, const std::string& url)
    : http(client), endpoint(url)
{
}

std::string SparqlClient::post(const std::string& query) {
    HttpResponse res;
    try {
        res = http.postForm(endpoint, {{"query", query}}, "application/sparql-results+json");
    }
    catch (const HttpError& e) {
        spdlog::error("SPARQL request to '{}' failed: {}", endpoint, e.what());
        throw GraphError(e.isTimeout() ? GraphError::Kind::Timeout : GraphError::Kind::Other,
            std::string("knowledge graph unreachable: ") + e.what());
    }

    if (!res.ok()) {
        throw GraphError(GraphError::Kind::Other,
            "SPARQL query failed with status " + std::to_string(res.status) + ": " + res.body.substr(0, 200));
    }
    return res.body;
}

std::vector<BindingRow> SparqlClient::select(const std::string& query) {
    spdlog::debug("SPARQL query:\n{}", query);
    return parseResults(post(query));
}

/*
  {"head": {"vars": [...]},
   "results": {"bindings": [{"node": {"type": "uri", "value": "..."}, ...}, ...]}}
*/
std::vector<BindingRow> SparqlClient::parseResults(const std::string& body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw GraphError(GraphError::Kind::Other, "failed to parse SPARQL JSON response");
    }

    std::vector<BindingRow> rows;
    auto results = doc.find("results");
    if (results == doc.end() || !results->is_object()) return rows;
    auto bindings = results->find("bindings");
    if (bindings == results->end() || !bindings->is_array()) return rows;

    rows.reserve(bindings->size());
    for (const auto& b : *bindings) {
        if (!b.is_object()) continue;
        BindingRow row;
        for (auto it = b.begin(); it != b.end(); ++it) {
            if (!it.value().is_object()) continue;
            auto v = it.value().find("value");
            if (v != it.value().end() && v->is_string()) row[it.key()] = v->get<std::string>();
        }
        rows.push_back(std::move(row));
    }
    return rows;
}
