#include <gtest/gtest.h>
#include "Fakes.hpp"
#include "core/LearningFrontier.hpp"

class LearningFrontierTest : public ::testing::Test {
protected:
    RecommenderConfig config;
    NodeMap nodes;
    MasteryVector mastery;

    void addDiscrete(const std::string& id, int level, double m) {
        nodes.emplace(id, discreteNode(id, level));
        if (m > 0.0) mastery[id] = m;
    }

    void addContinuous(const std::string& id, const std::string& level, double m) {
        nodes.emplace(id, continuousNode(id, level));
        if (m > 0.0) mastery[id] = m;
    }

    // `mastered` of `total` nodes at the given level are fully mastered
    void fillDiscreteTier(int level, int mastered, int total) {
        for (int i = 0; i < total; ++i) {
            addDiscrete("l" + std::to_string(level) + "-" + std::to_string(i), level, i < mastered ? 0.95 : 0.1);
        }
    }
};

TEST_F(LearningFrontierTest, FirstTierBelowEightyPercent) {
    fillDiscreteTier(1, 9, 10);
    fillDiscreteTier(2, 6, 10);
    fillDiscreteTier(3, 0, 10);

    LearningFrontierDetector detector(config);
    auto frontier = detector.findFrontier(nodes, mastery, Regime::Discrete);
    ASSERT_TRUE(frontier.has_value());
    EXPECT_EQ(frontier->rank, 2);
    EXPECT_EQ(frontier->label, "2");
}

TEST_F(LearningFrontierTest, ExactlyEightyPercentCountsAsMastered) {
    fillDiscreteTier(1, 8, 10);
    fillDiscreteTier(2, 7, 10);

    LearningFrontierDetector detector(config);
    EXPECT_EQ(detector.findFrontier(nodes, mastery, Regime::Discrete)->rank, 2);
}

TEST_F(LearningFrontierTest, EverythingMasteredStaysAtHardestTier) {
    fillDiscreteTier(1, 5, 5);
    fillDiscreteTier(4, 5, 5);

    LearningFrontierDetector detector(config);
    EXPECT_EQ(detector.findFrontier(nodes, mastery, Regime::Discrete)->rank, 4);
}

TEST_F(LearningFrontierTest, NoTierDataMeansNoFrontier) {
    nodes.emplace("a", KnowledgeNode("a", "apple"));
    LearningFrontierDetector detector(config);
    EXPECT_FALSE(detector.findFrontier(nodes, mastery, Regime::Discrete).has_value());
    EXPECT_FALSE(detector.findFrontier(NodeMap{}, mastery, Regime::Continuous).has_value());
}

TEST_F(LearningFrontierTest, ContinuousTiersFollowConfiguredOrder) {
    addContinuous("a", "A1", 0.9);
    addContinuous("b", "a2", 0.9);
    addContinuous("c", "B1", 0.2);
    addContinuous("d", "C1", 0.0);
    addContinuous("e", "Z9", 0.0);

    LearningFrontierDetector detector(config);
    auto frontier = detector.findFrontier(nodes, mastery, Regime::Continuous);
    ASSERT_TRUE(frontier.has_value());
    EXPECT_EQ(frontier->rank, 2);
    EXPECT_EQ(frontier->label, "B1");

    EXPECT_EQ(detector.tierRank(nodes.at("b"), Regime::Continuous), 1);
    EXPECT_FALSE(detector.tierRank(nodes.at("e"), Regime::Continuous).has_value());
    EXPECT_EQ(detector.tierLabel(4, Regime::Continuous), "C1");
    EXPECT_EQ(detector.tierLabel(17, Regime::Continuous), "");
}

TEST_F(LearningFrontierTest, RegimeFollowsTierCounts) {
    LearningFrontierDetector detector(config);

    addContinuous("a", "A1", 0);
    addContinuous("b", "B1", 0);
    addDiscrete("c", 1, 0);
    EXPECT_EQ(detector.detectRegime(nodes), Regime::Continuous);

    addDiscrete("d", 2, 0);
    EXPECT_EQ(detector.detectRegime(nodes), Regime::Discrete);
}

TEST_F(LearningFrontierTest, RegimeFallsBackToLabelScript) {
    LearningFrontierDetector detector(config);

    NodeMap chinese;
    chinese.emplace("1", KnowledgeNode("1", "猫"));
    chinese.emplace("2", KnowledgeNode("2", "小狗"));
    EXPECT_EQ(detector.detectRegime(chinese), Regime::Discrete);

    NodeMap english;
    english.emplace("1", KnowledgeNode("1", "cat"));
    english.emplace("2", KnowledgeNode("2", "puppy"));
    english.emplace("3", KnowledgeNode("3", "鱼"));
    EXPECT_EQ(detector.detectRegime(english), Regime::Continuous);
}

TEST_F(LearningFrontierTest, DisabledDetectionMeansDiscrete) {
    config.auto_detect_language = false;
    LearningFrontierDetector detector(config);
    addContinuous("a", "A1", 0);
    EXPECT_EQ(detector.detectRegime(nodes), Regime::Discrete);
}
