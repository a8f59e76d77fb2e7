#include <gtest/gtest.h>
#include <cmath>
#include "core/MasteryVectorGenerator.hpp"

class MasteryVectorTest : public ::testing::Test {
protected:
    RecommenderConfig config;
    MasteryVectorGenerator generator{config};

    static ReviewState card(double interval, int lapses, std::optional<int> ease = std::nullopt) {
        ReviewState s;
        s.node_id = "srs-kg:word";
        s.interval_days = interval;
        s.lapses = lapses;
        s.ease_factor = ease;
        return s;
    }
};

TEST_F(MasteryVectorTest, UnreviewedCardScoresZero) {
    EXPECT_DOUBLE_EQ(generator.score({card(0, 0)}), 0.0);
}

TEST_F(MasteryVectorTest, NoStatesScoresZero) {
    EXPECT_DOUBLE_EQ(generator.score({}), 0.0);
}

TEST_F(MasteryVectorTest, ThirtyDayIntervalWithDefaultEase) {
    double expected = std::log(31.0) / std::log(121.0) + (2500.0 / 3500.0) * 0.2;
    EXPECT_NEAR(generator.score({card(30, 0, 2500)}), expected, 1e-9);
    EXPECT_NEAR(generator.score({card(30, 0, 2500)}), 0.859, 1e-3);
}

TEST_F(MasteryVectorTest, LapsesSubtractLinearly) {
    double clean = generator.score({card(30, 0, 2500)});
    double one = generator.score({card(30, 1, 2500)});
    EXPECT_NEAR(clean - one, 0.12, 1e-9);
}

TEST_F(MasteryVectorTest, ScoreIsClampedToUnitRange) {
    EXPECT_DOUBLE_EQ(generator.score({card(400, 0, 5000)}), 1.0);
    EXPECT_DOUBLE_EQ(generator.score({card(2, 15, 1300)}), 0.0);
    EXPECT_DOUBLE_EQ(generator.score({card(-5, -2)}), 0.0);
}

TEST_F(MasteryVectorTest, WeakestCardDecidesTheInterval) {
    double expected = std::log(6.0) / std::log(121.0);
    EXPECT_NEAR(generator.score({card(30, 0), card(5, 0)}), expected, 1e-9);
}

TEST_F(MasteryVectorTest, LapsesAreSummedAcrossCards) {
    double single = generator.score({card(60, 2, 2500)});
    double split = generator.score({card(60, 1, 2500), card(60, 1, 2500)});
    EXPECT_NEAR(single, split, 1e-9);
}

TEST_F(MasteryVectorTest, OnlyPositiveEaseFactorsAreAveraged) {
    double with_zero = generator.score({card(30, 0, 0), card(30, 0, 2500)});
    double alone = generator.score({card(30, 0, 2500)});
    EXPECT_NEAR(with_zero, alone, 1e-9);
}

TEST_F(MasteryVectorTest, MoreLapsesNeverIncreaseMastery) {
    double previous = 1.0;
    for (int lapses = 0; lapses <= 10; ++lapses) {
        double s = generator.score({card(45, lapses, 2300)});
        EXPECT_LE(s, previous) << "lapses=" << lapses;
        previous = s;
    }
}

TEST_F(MasteryVectorTest, LongerIntervalNeverDecreasesMastery) {
    double previous = 0.0;
    for (int interval = 0; interval <= 120; interval += 5) {
        double s = generator.score({card(interval, 1, 2100)});
        EXPECT_GE(s, previous) << "interval=" << interval;
        EXPECT_GE(s, 0.0);
        EXPECT_LE(s, 1.0);
        previous = s;
    }
}

TEST_F(MasteryVectorTest, GenerateSkipsNodesWithoutStates) {
    ReviewStateMap states;
    states["srs-kg:cat"] = {card(30, 0, 2500)};
    states["srs-kg:dog"] = {};

    MasteryVector v = generator.generate(states);
    EXPECT_EQ(v.size(), 1u);
    EXPECT_EQ(v.count("srs-kg:dog"), 0u);
    EXPECT_DOUBLE_EQ(masteryOf(v, "srs-kg:dog"), 0.0);
    EXPECT_GT(masteryOf(v, "srs-kg:cat"), 0.8);
}

TEST_F(MasteryVectorTest, ConfigChangesTheModel) {
    config.max_interval_for_norm = 30.0;
    config.lapse_penalty_coefficient = 0.0;
    MasteryVectorGenerator strict(config);
    EXPECT_NEAR(strict.score({card(30, 3)}), 1.0, 1e-9);
}

TEST_F(MasteryVectorTest, OverridesRaiseToFullMastery) {
    MasteryVector v{{"srs-kg:cat", 0.3}};
    MasteryVectorGenerator::applyOverrides(v, {"srs-kg:cat", "srs-kg:sun"});
    EXPECT_DOUBLE_EQ(v["srs-kg:cat"], 1.0);
    EXPECT_DOUBLE_EQ(v["srs-kg:sun"], 1.0);
}
