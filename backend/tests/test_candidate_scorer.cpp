#include <gtest/gtest.h>
#include <algorithm>
#include "Fakes.hpp"
#include "core/CandidateScorer.hpp"
#include "core/ContinuousTierStrategy.hpp"
#include "core/DiscreteTierStrategy.hpp"

class CandidateScorerTest : public ::testing::Test {
protected:
    RecommenderConfig config;
    NodeMap nodes;
    MasteryVector mastery;

    void add(KnowledgeNode node, double m = -1.0) {
        if (m >= 0.0) mastery[node.node_id] = m;
        nodes.emplace(node.node_id, std::move(node));
    }

    ScoringContext context(const LearningFrontierDetector& detector, std::optional<Frontier> frontier) {
        ScoringContext ctx;
        ctx.detector = &detector;
        ctx.frontier = frontier;
        ctx.mastery = &mastery;
        return ctx;
    }

    static std::vector<std::string> ids(const std::vector<Recommendation>& recs) {
        std::vector<std::string> out;
        for (const auto& r : recs) out.push_back(r.node_id);
        return out;
    }
};

TEST_F(CandidateScorerTest, WeakPrerequisiteDropsNodeEntirely) {
    KnowledgeNode kitten = discreteNode("kitten", 2);
    kitten.prerequisites = {"cat", "small"};
    add(kitten);
    add(discreteNode("cat", 1), 0.9);
    add(discreteNode("small", 1), 0.5);
    add(discreteNode("dog", 2));

    LearningFrontierDetector detector(config);
    DiscreteTierStrategy strategy(config, context(detector, Frontier{2, "2"}));
    CandidateScorer scorer(config, strategy, detector);

    ExploratoryRanking ranking = scorer.exploratory(nodes, mastery);
    std::vector<std::string> got = ids(ranking.ranked);
    EXPECT_EQ(std::count(got.begin(), got.end(), "kitten"), 0);
    EXPECT_EQ(std::count(got.begin(), got.end(), "cat"), 0);     // mastered
    EXPECT_EQ(got, (std::vector<std::string>{"dog", "small"}));
    EXPECT_TRUE(ranking.excluded.empty());

    EXPECT_DOUBLE_EQ(CandidateScorer::prereqMastery(nodes.at("kitten"), mastery), 0.5);
    EXPECT_DOUBLE_EQ(CandidateScorer::prereqMastery(nodes.at("dog"), mastery), 1.0);
}

TEST_F(CandidateScorerTest, PrerequisitesAtThresholdPass) {
    KnowledgeNode kitten = discreteNode("kitten", 2);
    kitten.prerequisites = {"cat"};
    add(kitten);
    add(discreteNode("cat", 1), 0.75);

    LearningFrontierDetector detector(config);
    DiscreteTierStrategy strategy(config, context(detector, Frontier{2, "2"}));
    CandidateScorer scorer(config, strategy, detector);

    ExploratoryRanking ranking = scorer.exploratory(nodes, mastery);
    ASSERT_EQ(ranking.ranked.size(), 2u);
    EXPECT_EQ(ranking.ranked[0].node_id, "kitten");
    EXPECT_DOUBLE_EQ(ranking.ranked[0].prereq_mastery, 0.75);
    EXPECT_EQ(ranking.ranked[0].level, "2");
    EXPECT_TRUE(ranking.ranked[0].missing_prereqs.empty());
}

TEST_F(CandidateScorerTest, RemedialListsWeakReviewedNodesWithMissingPrereqs) {
    KnowledgeNode kitten = discreteNode("kitten", 2);
    kitten.prerequisites = {"cat", "small"};
    add(kitten, 0.2);
    add(discreteNode("cat", 1), 0.9);
    add(discreteNode("small", 1), 0.3);
    add(discreteNode("never-seen", 1));
    mastery["not-in-graph"] = 0.1;

    LearningFrontierDetector detector(config);
    DiscreteTierStrategy strategy(config, context(detector, std::nullopt));
    CandidateScorer scorer(config, strategy, detector);

    std::vector<Recommendation> remedial = scorer.remedial(nodes, mastery);
    ASSERT_EQ(ids(remedial), (std::vector<std::string>{"kitten", "small"}));
    EXPECT_DOUBLE_EQ(remedial[0].mastery, 0.2);
    EXPECT_EQ(remedial[0].missing_prereqs, std::vector<std::string>{"small"});
    EXPECT_DOUBLE_EQ(remedial[0].prereq_mastery, 0.3);
    EXPECT_TRUE(remedial[1].missing_prereqs.empty());

    // kitten is not exploratory (weak prerequisite) but still remedial
    std::vector<std::string> exploratory = ids(scorer.exploratory(nodes, mastery).ranked);
    EXPECT_EQ(std::count(exploratory.begin(), exploratory.end(), "kitten"), 0);
}

TEST_F(CandidateScorerTest, ListsAreSortedAndCapped) {
    config.top_n = 3;
    for (int i = 0; i < 8; ++i) {
        add(discreteNode("n" + std::to_string(i), 1 + i % 4), 0.05 * i);
    }

    LearningFrontierDetector detector(config);
    DiscreteTierStrategy strategy(config, context(detector, Frontier{2, "2"}));
    CandidateScorer scorer(config, strategy, detector);

    std::vector<Recommendation> exploratory = scorer.exploratory(nodes, mastery).ranked;
    ASSERT_EQ(exploratory.size(), 3u);
    for (size_t i = 1; i < exploratory.size(); ++i) {
        EXPECT_GE(exploratory[i - 1].score, exploratory[i].score);
    }

    std::vector<Recommendation> remedial = scorer.remedial(nodes, mastery);
    ASSERT_EQ(remedial.size(), 3u);
    EXPECT_EQ(ids(remedial), (std::vector<std::string>{"n0", "n1", "n2"}));
}

TEST_F(CandidateScorerTest, EqualScoresOrderById) {
    add(discreteNode("b", 2));
    add(discreteNode("a", 2));
    add(discreteNode("c", 2));

    LearningFrontierDetector detector(config);
    DiscreteTierStrategy strategy(config, context(detector, Frontier{2, "2"}));
    CandidateScorer scorer(config, strategy, detector);

    EXPECT_EQ(ids(scorer.exploratory(nodes, mastery).ranked), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(CandidateScorerTest, SentinelScoredNodesAreReportedAsExcluded) {
    add(continuousNode("a2", "A2"), 0.9);
    add(continuousNode("b1", "B1"), 0.1);
    add(continuousNode("c1", "C1"));
    add(continuousNode("c2", "c2"));

    LearningFrontierDetector detector(config);
    ContinuousTierStrategy strategy(config, context(detector, Frontier{2, "B1"}));
    CandidateScorer scorer(config, strategy, detector);

    ExploratoryRanking ranking = scorer.exploratory(nodes, mastery);
    EXPECT_EQ(ids(ranking.ranked), std::vector<std::string>{"b1"});
    EXPECT_EQ(ranking.excluded, (std::vector<std::string>{"c1", "c2"}));
    EXPECT_EQ(ranking.ranked[0].level, "B1");
}
