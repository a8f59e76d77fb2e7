#include "Recommender.hpp"
#include "CandidateScorer.hpp"
#include "LearningFrontier.hpp"
#include "MasteryVectorGenerator.hpp"
#include "ScoringStrategy.hpp"
#include "../graph/KnowledgeGraphService.hpp"
#include "../telemetry/TelemetryAdapter.hpp"
#include <spdlog/spdlog.h>

Recommender::Recommender(const RecommenderConfig& config, TelemetrySource& telemetry_source,
    GraphQueryEngine& graph_engine, const std::string& telemetry_filter)
    : cfg(config), telemetry(telemetry_source), graph(graph_engine), filter(telemetry_filter)
{
    cfg.validate();
}

void Recommender::setMasteryOverrides(const std::set<std::string>& ids) {
    overrides.clear();
    for (const auto& id : ids) {
        std::string normalized = normalizer.normalize(id);
        if (!normalized.empty()) overrides.insert(normalized);
    }
}

MasteryVector Recommender::buildMasteryVector() const {
    TelemetryAdapter adapter(telemetry, normalizer, filter);
    ReviewStateMap states = adapter.fetchReviewStates();
    return MasteryVectorGenerator(cfg).generate(states);
}

NodeMap Recommender::fetchNodes() const {
    KnowledgeGraphService service(graph, cfg, normalizer, cache);
    return service.fetchNodes();
}

RecommendationResult Recommender::rank(MasteryVector mastery, NodeMap nodes) const {
    MasteryVectorGenerator::applyOverrides(mastery, overrides);

    LearningFrontierDetector detector(cfg);
    RecommendationResult result;
    result.regime = detector.detectRegime(nodes);
    result.frontier = detector.findFrontier(nodes, mastery, result.regime);
    spdlog::info("Ranking {} nodes against {} mastery entries (regime {})",
        nodes.size(), mastery.size(), regimeName(result.regime));

    ScoringContext ctx;
    ctx.detector = &detector;
    ctx.frontier = result.frontier;
    ctx.mastery = &mastery;
    ctx.similarity = result.regime == Regime::Continuous ? similarity : nullptr;

    std::unique_ptr<ScoringStrategy> strategy = ScoringStrategy::create(result.regime, cfg, ctx);
    CandidateScorer scorer(cfg, *strategy, detector);

    ExploratoryRanking ranking = scorer.exploratory(nodes, mastery);
    result.exploratory = std::move(ranking.ranked);
    result.excluded = std::move(ranking.excluded);
    result.remedial = scorer.remedial(nodes, mastery);

    result.mastery = std::move(mastery);
    result.nodes = std::move(nodes);
    return result;
}

RecommendationResult Recommender::generateRecommendations() const {
    MasteryVector mastery = buildMasteryVector();
    NodeMap nodes = fetchNodes();
    return rank(std::move(mastery), std::move(nodes));
}
