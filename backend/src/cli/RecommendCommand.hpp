#pragma once
#include <chrono>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/Recommendation.hpp"
#include "../core/RecommenderConfig.hpp"
#include "../graph/GraphQueryEngine.hpp"
#include "../net/HttpClient.hpp"
#include "../telemetry/TelemetrySource.hpp"
#include "../utils/logging.hpp"

// Where telemetry and graph data come from. Not part of the engine config.
struct SourceOptions {
    std::string filter = "_KG_Map:*";
    std::string linkage_field = "_KG_Map";
    std::string anki_url = "http://localhost:8765";
    std::string kg_endpoint = "http://localhost:3030/srs4autism/query";
    std::string reviews_file;        // replaces AnkiConnect when set

    long telemetry_timeout_ms = 30000;
    long graph_timeout_ms = 15000;
    long deadline_ms = 60000;        // whole recommendation call
};

struct CommandOptions {
    std::string config_file;
    SourceOptions sources;

    // Overrides applied on top of the config file
    std::optional<int> target_tier;
    std::optional<int> top_n;
    std::optional<double> slider;
    std::optional<double> mental_age;
    std::optional<LanguageScope> scope;

    std::string similarity_file;
    std::set<std::string> mastered;
    std::string mastered_file;

    bool json = false;
    bool help = false;
    Log::LogOptions log;
};

// Returns false and fills error on unknown flags or bad values.
bool parseCommandLine(const std::vector<std::string>& args, CommandOptions& out, std::string& error);

void printUsage(std::ostream& out);

/*
  The recommend command: builds the collaborators, runs the engine and
  prints the report.

  Exit codes:
    0  success, including runs degraded by a collaborator timeout
    1  hard collaborator failure ("error: <collaborator> failed: ...")
    2  invalid configuration or input files
*/
class RecommendCommand {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitCollaborator = 1;
    static constexpr int kExitUsage = 2;

    explicit RecommendCommand(const CommandOptions& options);

    // AnkiConnect (or review export) + SPARQL endpoint from the options.
    int run(std::ostream& out, std::ostream& err);

    // Same flow over caller-supplied collaborators.
    int execute(TelemetrySource& telemetry, GraphQueryEngine& graph, std::ostream& out, std::ostream& err);

    // Config file + command line overrides. Throws ConfigError.
    RecommenderConfig buildConfig() const;

    void printReport(const RecommendationResult& result, std::ostream& out) const;
    static nlohmann::json toJson(const RecommendationResult& result);

private:
    CommandOptions options;
    std::chrono::steady_clock::time_point started;
    HttpClient* telemetry_http = nullptr;
    HttpClient* graph_http = nullptr;

    long remainingMs(long stage_timeout_ms) const;
};
