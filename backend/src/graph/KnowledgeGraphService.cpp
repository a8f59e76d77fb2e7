#include "KnowledgeGraphService.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <type_traits>
#include <spdlog/spdlog.h>

KnowledgeGraphService::KnowledgeGraphService(GraphQueryEngine& eng, const RecommenderConfig& config,
    const NodeIdNormalizer& norm, NodeCache* node_cache)
    : engine(eng), normalizer(norm), cache(node_cache),
    node_kinds(config.node_kinds),
    placeholder_prefixes(config.placeholder_label_prefixes),
    default_scope(config.language_scope)
{
}

static std::string sparqlString(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string KnowledgeGraphService::buildQuery(LanguageScope scope) const {
    std::ostringstream q;
    for (const auto& ns : normalizer.namespaces()) {
        q << "PREFIX " << ns.prefix << ": <" << ns.base << ">\n";
    }
    q << "PREFIX rdfs: <http://www.w3.org/2000/01/rdf-schema#>\n\n"
      << "SELECT DISTINCT ?node ?label ?hsk ?cefr ?concreteness ?frequency ?freqRank ?aoa ?prereq\n"
      << "WHERE {\n"
      << "    VALUES ?type {";
    for (const auto& kind : node_kinds) q << " " << kind;
    q << " }\n"
      << "    ?node a ?type .\n"
      << "    ?node rdfs:label ?label .\n"
      << "    OPTIONAL { ?node srs-kg:hskLevel ?hsk }\n"
      << "    OPTIONAL { ?node srs-kg:cefrLevel ?cefr }\n"
      << "    OPTIONAL { ?node srs-kg:concreteness ?concreteness }\n"
      << "    OPTIONAL { ?node srs-kg:frequency ?frequency }\n"
      << "    OPTIONAL { ?node srs-kg:frequencyRank ?freqRank }\n"
      << "    OPTIONAL { ?node srs-kg:ageOfAcquisition ?aoa }\n"
      << "    OPTIONAL { ?node srs-kg:requiresPrerequisite ?prereq }\n";
    for (const auto& prefix : placeholder_prefixes) {
        q << "    FILTER (!STRSTARTS(STR(?label), " << sparqlString(prefix) << "))\n";
    }
    if (scope == LanguageScope::Discrete) q << "    FILTER (BOUND(?hsk))\n";
    else if (scope == LanguageScope::Continuous) q << "    FILTER (BOUND(?cefr))\n";
    q << "}\n";
    return q.str();
}

NodeMap KnowledgeGraphService::fetchNodes(LanguageScope scope) {
    std::string key = NodeCache::keyFor(scopeName(scope), node_kinds, placeholder_prefixes);
    NodeMap nodes;
    if (cache && cache->get(key, nodes)) {
        return nodes;
    }

    spdlog::info("Fetching nodes from {} (scope '{}')", engine.name(), scopeName(scope));
    std::vector<BindingRow> rows = engine.select(buildQuery(scope));
    nodes = foldRows(rows);
    spdlog::info("Knowledge graph returned {} rows for {} nodes", rows.size(), nodes.size());

    if (cache) cache->put(key, nodes);
    return nodes;
}

/* -------------------------
   Attribute parsing
   -------------------------
   Every optional attribute degrades to absent when its lexical form does
   not parse; the row itself is kept.
*/
static bool parseNumber(const std::string& text, double& out) {
    try {
        std::size_t used = 0;
        double v = std::stod(text, &used);
        while (used < text.size() && std::isspace((unsigned char)text[used])) ++used;
        if (used != text.size() || !std::isfinite(v)) return false;
        out = v;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

template <typename T>
static void parseInto(const BindingRow& row, const char* var, const std::string& node_id, std::optional<T>& out) {
    auto it = row.find(var);
    if (it == row.end() || it->second.empty()) return;

    double v = 0.0;
    if (!parseNumber(it->second, v)) {
        spdlog::warn("Node '{}': ignoring unparsable {} '{}'", node_id, var, it->second);
        return;
    }
    if constexpr (std::is_integral<T>::value) {
        double whole = std::trunc(v);
        if (whole < static_cast<double>(std::numeric_limits<T>::min())
            || whole > static_cast<double>(std::numeric_limits<T>::max())) {
            spdlog::warn("Node '{}': ignoring out-of-range {} '{}'", node_id, var, it->second);
            return;
        }
        out = static_cast<T>(whole);
    }
    else {
        out = static_cast<T>(v);
    }
}

void KnowledgeGraphService::applyAttributes(KnowledgeNode& node, const BindingRow& row) const {
    parseInto(row, "hsk", node.node_id, node.discrete_level);
    parseInto(row, "concreteness", node.node_id, node.concreteness);
    parseInto(row, "frequency", node.node_id, node.frequency);
    parseInto(row, "freqRank", node.node_id, node.frequency_rank);
    parseInto(row, "aoa", node.node_id, node.age_of_acquisition);

    auto cefr = row.find("cefr");
    if (cefr != row.end() && !cefr->second.empty()) {
        std::string level = cefr->second;
        std::transform(level.begin(), level.end(), level.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        node.continuous_level = level;
    }

    auto prereq = row.find("prereq");
    if (prereq != row.end() && !prereq->second.empty()) {
        std::string id = normalizer.normalize(prereq->second);
        if (!id.empty() && id != node.node_id) node.prerequisites.insert(id);
    }
}

NodeMap KnowledgeGraphService::foldRows(const std::vector<BindingRow>& rows) const {
    NodeMap nodes;
    for (const auto& row : rows) {
        auto node_it = row.find("node");
        auto label_it = row.find("label");
        if (node_it == row.end() || label_it == row.end()) {
            spdlog::warn("Skipping graph row without node or label");
            continue;
        }

        const std::string& label = label_it->second;
        bool placeholder = std::any_of(placeholder_prefixes.begin(), placeholder_prefixes.end(),
            [&label](const std::string& p) { return label.compare(0, p.size(), p) == 0; });
        if (placeholder) continue;

        std::string id = normalizer.normalize(node_it->second);
        if (id.empty()) continue;

        auto it = nodes.find(id);
        if (it == nodes.end()) {
            it = nodes.emplace(id, KnowledgeNode(id, label)).first;
        }
        applyAttributes(it->second, row);
    }
    return nodes;
}
