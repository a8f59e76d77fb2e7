#include "RecommendCommand.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <spdlog/spdlog.h>
#include "../core/Recommender.hpp"
#include "../graph/NodeCache.hpp"
#include "../graph/SparqlClient.hpp"
#include "../storage/Storage.hpp"
#include "../telemetry/AnkiConnectSource.hpp"

/* -------------------------
   Command line
   ------------------------- */
static bool parseInt(const std::string& text, int& out) {
    try {
        std::size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = v;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

static bool parseDouble(const std::string& text, double& out) {
    try {
        std::size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size()) return false;
        out = v;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

static void splitIds(const std::string& list, std::set<std::string>& out) {
    std::stringstream ss(list);
    std::string id;
    while (std::getline(ss, id, ',')) {
        id.erase(0, id.find_first_not_of(' '));
        id.erase(id.find_last_not_of(' ') + 1);
        if (!id.empty()) out.insert(id);
    }
}

bool parseCommandLine(const std::vector<std::string>& args, CommandOptions& out, std::string& error) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];

        if (flag == "--help" || flag == "-h") { out.help = true; continue; }
        if (flag == "--json") { out.json = true; continue; }

        if (i + 1 >= args.size()) {
            error = flag.rfind("--", 0) == 0 ? "missing value for " + flag : "unexpected argument '" + flag + "'";
            return false;
        }
        const std::string& value = args[++i];

        int n = 0;
        double d = 0.0;
        if (flag == "--config") out.config_file = value;
        else if (flag == "--filter") out.sources.filter = value;
        else if (flag == "--anki-url") out.sources.anki_url = value;
        else if (flag == "--reviews-file") out.sources.reviews_file = value;
        else if (flag == "--kg-endpoint") out.sources.kg_endpoint = value;
        else if (flag == "--similarity-file") out.similarity_file = value;
        else if (flag == "--mastered") splitIds(value, out.mastered);
        else if (flag == "--mastered-file") out.mastered_file = value;
        else if (flag == "--log-file") out.log.file = value;
        else if (flag == "--target-tier") {
            if (!parseInt(value, n)) { error = "--target-tier expects an integer"; return false; }
            out.target_tier = n;
        }
        else if (flag == "--top") {
            if (!parseInt(value, n)) { error = "--top expects an integer"; return false; }
            out.top_n = n;
        }
        else if (flag == "--slider") {
            if (!parseDouble(value, d)) { error = "--slider expects a number"; return false; }
            out.slider = d;
        }
        else if (flag == "--mental-age") {
            if (!parseDouble(value, d)) { error = "--mental-age expects a number"; return false; }
            out.mental_age = d;
        }
        else if (flag == "--scope") {
            LanguageScope scope;
            if (!parseScope(value, scope)) { error = "--scope expects any, discrete or continuous"; return false; }
            out.scope = scope;
        }
        else if (flag == "--log-level") {
            if (!Log::parseLevel(value, out.log.level)) {
                error = "--log-level expects trace, debug, info, warn, error or off";
                return false;
            }
        }
        else {
            error = "unknown flag '" + flag + "'";
            return false;
        }
    }
    return true;
}

void printUsage(std::ostream& out) {
    out << "usage: waypoint [options]\n"
        "  --config FILE            recommender settings (JSON)\n"
        "  --filter QUERY           telemetry collection filter (default _KG_Map:*)\n"
        "  --anki-url URL           AnkiConnect endpoint (default http://localhost:8765)\n"
        "  --reviews-file FILE      read an exported review file instead of AnkiConnect\n"
        "  --kg-endpoint URL        SPARQL query endpoint\n"
        "  --target-tier N          discrete tier to use when no frontier is found\n"
        "  --top N                  entries per list\n"
        "  --slider S               0 = frequency, 1 = concreteness (continuous tiers)\n"
        "  --mental-age A           exclude words acquired later than A + buffer\n"
        "  --scope SCOPE            any | discrete | continuous\n"
        "  --similarity-file FILE   semantic neighbours for the continuous regime\n"
        "  --mastered ID,ID,...     treat these nodes as mastered\n"
        "  --mastered-file FILE     same, one id per line\n"
        "  --json                   print JSON instead of tables\n"
        "  --log-level LEVEL        trace | debug | info | warn | error | off\n"
        "  --log-file FILE          also write the log to FILE\n";
}

/* -------------------------
   Command
   ------------------------- */
RecommendCommand::RecommendCommand(const CommandOptions& opts)
    : options(opts), started(std::chrono::steady_clock::now())
{
}

RecommenderConfig RecommendCommand::buildConfig() const {
    RecommenderConfig config;
    if (!options.config_file.empty()) config = loadConfigFile(options.config_file);

    if (options.target_tier) config.target_discrete_level = *options.target_tier;
    if (options.top_n) config.top_n = *options.top_n;
    if (options.slider) config.slider = *options.slider;
    if (options.mental_age) config.mental_age = *options.mental_age;
    if (options.scope) config.language_scope = *options.scope;

    config.validate();
    return config;
}

long RecommendCommand::remainingMs(long stage_timeout_ms) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    long left = options.sources.deadline_ms - static_cast<long>(elapsed);
    return std::min(stage_timeout_ms, left);
}

int RecommendCommand::run(std::ostream& out, std::ostream& err) {
    const SourceOptions& src = options.sources;

    HttpClient anki_http(src.telemetry_timeout_ms);
    HttpClient sparql_http(src.graph_timeout_ms);
    telemetry_http = &anki_http;
    graph_http = &sparql_http;

    std::unique_ptr<TelemetrySource> telemetry;
    if (!src.reviews_file.empty()) {
        telemetry = std::make_unique<ReviewExportSource>(src.reviews_file);
    }
    else {
        telemetry = std::make_unique<AnkiConnectSource>(anki_http, src.anki_url, src.linkage_field);
    }
    SparqlClient sparql(sparql_http, src.kg_endpoint);

    int code = execute(*telemetry, sparql, out, err);
    telemetry_http = nullptr;
    graph_http = nullptr;
    return code;
}

int RecommendCommand::execute(TelemetrySource& telemetry, GraphQueryEngine& graph,
    std::ostream& out, std::ostream& err) {
    started = std::chrono::steady_clock::now();

    RecommenderConfig config;
    SimilarityIndex similarity;
    std::set<std::string> mastered = options.mastered;
    try {
        config = buildConfig();
    }
    catch (const ConfigError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        err << "error: invalid configuration: " << e.what() << "\n";
        return kExitUsage;
    }

    if (!options.similarity_file.empty() && !Storage::loadSimilarityIndex(similarity, options.similarity_file)) {
        err << "error: cannot read similarity index '" << options.similarity_file << "'\n";
        return kExitUsage;
    }
    if (!options.mastered_file.empty()) {
        std::set<std::string> from_file;
        if (!Storage::loadMasteredList(from_file, options.mastered_file)) {
            err << "error: cannot read mastered list '" << options.mastered_file << "'\n";
            return kExitUsage;
        }
        mastered.insert(from_file.begin(), from_file.end());
    }

    Recommender recommender(config, telemetry, graph, options.sources.filter);
    NodeCache cache;
    recommender.setNodeCache(&cache);
    if (!similarity.empty()) recommender.setSimilarityIndex(&similarity);
    recommender.setMasteryOverrides(mastered);

    // Stage 1: telemetry. A timeout leaves the mastery vector empty.
    // The deadline bounds the whole stage, however many requests it takes.
    if (telemetry_http) {
        telemetry_http->setDeadline(std::chrono::steady_clock::now()
            + std::chrono::milliseconds(remainingMs(options.sources.telemetry_timeout_ms)));
    }
    MasteryVector mastery;
    try {
        mastery = recommender.buildMasteryVector();
    }
    catch (const TelemetryError& e) {
        if (!e.isTimeout()) {
            spdlog::error("{} failed: {}", telemetry.name(), e.what());
            err << "error: " << telemetry.name() << " failed: " << e.what() << "\n";
            return kExitCollaborator;
        }
        spdlog::warn("{} timed out ({}), continuing with an empty mastery vector", telemetry.name(), e.what());
    }

    // Stage 2: knowledge graph. A timeout or an exhausted deadline leaves no candidates.
    NodeMap nodes;
    long budget = remainingMs(options.sources.graph_timeout_ms);
    if (graph_http && budget <= 0) {
        spdlog::warn("Deadline of {} ms reached before querying {}, continuing without candidates",
            options.sources.deadline_ms, graph.name());
    }
    else {
        if (graph_http) graph_http->setDeadline(std::chrono::steady_clock::now() + std::chrono::milliseconds(budget));
        try {
            nodes = recommender.fetchNodes();
        }
        catch (const GraphError& e) {
            if (!e.isTimeout()) {
                spdlog::error("{} failed: {}", graph.name(), e.what());
                err << "error: " << graph.name() << " failed: " << e.what() << "\n";
                return kExitCollaborator;
            }
            spdlog::warn("{} timed out ({}), continuing without candidates", graph.name(), e.what());
        }
    }

    RecommendationResult result = recommender.rank(std::move(mastery), std::move(nodes));

    if (options.json) out << toJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    else printReport(result, out);
    return kExitOk;
}

/* -------------------------
   Output
   ------------------------- */
static void printRows(const std::vector<Recommendation>& rows, bool remedial, std::ostream& out) {
    if (rows.empty()) {
        out << "(none)\n";
        return;
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        const Recommendation& r = rows[i];
        out << std::setw(3) << i + 1 << ". " << r.label << "  [" << r.node_id << "]\n";
        out << "     Level: " << (r.level.empty() ? "-" : r.level)
            << " | mastery=" << std::fixed << std::setprecision(3) << r.mastery;
        if (!remedial) {
            out << " | prereqs=" << r.prereq_mastery << " | score=" << r.score;
        }
        out << "\n";
        out.unsetf(std::ios::floatfield);

        if (remedial) {
            out << "     Missing prerequisites: ";
            if (r.missing_prereqs.empty()) out << "(none)";
            for (size_t j = 0; j < r.missing_prereqs.size(); ++j) {
                if (j) out << ", ";
                out << r.missing_prereqs[j];
            }
            out << "\n";
        }
    }
}

void RecommendCommand::printReport(const RecommendationResult& result, std::ostream& out) const {
    out << "Regime: " << regimeName(result.regime)
        << " | Frontier: " << (result.frontier ? result.frontier->label : "(none)")
        << " | Candidates: " << result.nodes.size() << "\n";

    out << "\n===== EXPLORATORY =====\n";
    printRows(result.exploratory, false, out);
    if (!result.excluded.empty()) {
        out << "(" << result.excluded.size() << " candidates excluded by tier or age filters)\n";
    }

    out << "\n===== REMEDIAL =====\n";
    printRows(result.remedial, true, out);

    out << "\nTracked mastery entries: " << result.mastery.size() << "\n";
}

static nlohmann::json recommendationJson(const Recommendation& r) {
    return nlohmann::json{
        {"node_id", r.node_id},
        {"label", r.label},
        {"level", r.level},
        {"mastery", r.mastery},
        {"prereq_mastery", r.prereq_mastery},
        {"score", r.score},
        {"missing_prereqs", r.missing_prereqs}
    };
}

nlohmann::json RecommendCommand::toJson(const RecommendationResult& result) {
    nlohmann::json doc;
    doc["regime"] = regimeName(result.regime);
    doc["frontier"] = result.frontier ? nlohmann::json(result.frontier->label) : nlohmann::json(nullptr);
    doc["mastery_entries"] = result.mastery.size();
    doc["candidates"] = result.nodes.size();
    doc["excluded"] = result.excluded;

    doc["exploratory"] = nlohmann::json::array();
    for (const auto& r : result.exploratory) doc["exploratory"].push_back(recommendationJson(r));
    doc["remedial"] = nlohmann::json::array();
    for (const auto& r : result.remedial) doc["remedial"].push_back(recommendationJson(r));
    return doc;
}
