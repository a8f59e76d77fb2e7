#pragma once
#include <string>
#include <vector>
#include "GraphQueryEngine.hpp"
#include "../net/HttpClient.hpp"

// SPARQL 1.1 protocol client for Fuseki / Oxigraph style endpoints.
class SparqlClient : public GraphQueryEngine {
public:
    SparqlClient(const HttpClient& http, const std::string& endpoint);

    std::vector<BindingRow> select(const std::string& query) override;
    std::string name() const override { return "knowledge graph (" + endpoint + ")"; }

    // Parses an application/sparql-results+json document. Throws GraphError.
    static std::vector<BindingRow> parseResults(const std::string& body);

private:
    const HttpClient& http;
    std::string endpoint;

    std::string post(const std::string& query);
};
