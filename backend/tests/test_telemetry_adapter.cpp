#include <gtest/gtest.h>
#include "Fakes.hpp"
#include "telemetry/TelemetryAdapter.hpp"

class TelemetryAdapterTest : public ::testing::Test {
protected:
    FakeTelemetrySource source;
    NodeIdNormalizer normalizer;
};

TEST_F(TelemetryAdapterTest, GroupsCardsByNormalizedNode) {
    source.addCard(1, 1, relationLinkage(1, "http://srs4autism.com/schema/word-cat"), 30, 0, 2500);
    source.addCard(2, 1, relationLinkage(1, "word-cat"), 10, 1, 2300);
    source.addCard(3, 1, relationLinkage(1, "srs-kg:word-dog"), 5, 0, 2500);

    TelemetryAdapter adapter(source, normalizer, "deck:Chinese");
    ReviewStateMap states = adapter.fetchReviewStates();

    EXPECT_EQ(source.last_filter, "deck:Chinese");
    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states["srs-kg:word-cat"].size(), 2u);
    EXPECT_EQ(states["srs-kg:word-dog"].size(), 1u);
    EXPECT_EQ(states["srs-kg:word-cat"][1].lapses, 1);
}

TEST_F(TelemetryAdapterTest, CardIndexSelectsEntry) {
    const std::string block = R"([{"card_index": 1, "kg_ids": ["word-cat"]},
                                  {"card_index": 2, "kg_ids": ["char-cat", "word-cat"]}])";
    source.addCard(7, 1, block, 20, 0);
    source.addCard(7, 2, block, 3, 0);

    TelemetryAdapter adapter(source, normalizer);
    ReviewStateMap states = adapter.fetchReviewStates();

    EXPECT_EQ(states["srs-kg:word-cat"].size(), 2u);
    EXPECT_EQ(states["srs-kg:char-cat"].size(), 1u);
    EXPECT_DOUBLE_EQ(states["srs-kg:char-cat"][0].interval_days, 3.0);
}

TEST_F(TelemetryAdapterTest, MalformedLinkageIsSkippedNotFatal) {
    source.addCard(1, 1, "{broken", 30, 0);
    source.addCard(1, 2, "{broken", 30, 0);
    source.addCard(2, 1, "", 30, 0);
    source.addCard(3, 4, relationLinkage(1, "word-cat"), 30, 0);
    source.addCard(4, 1, relationLinkage(1, "word-sun"), 30, 0);

    TelemetryAdapter adapter(source, normalizer);
    ReviewStateMap states;
    ASSERT_NO_THROW(states = adapter.fetchReviewStates());

    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states.count("srs-kg:word-sun"), 1u);
}

TEST_F(TelemetryAdapterTest, ZeroEaseFactorMeansNoEase) {
    source.addCard(1, 1, relationLinkage(1, "word-cat"), 30, 0, 0);

    TelemetryAdapter adapter(source, normalizer);
    ReviewStateMap states = adapter.fetchReviewStates();
    ASSERT_EQ(states["srs-kg:word-cat"].size(), 1u);
    EXPECT_FALSE(states["srs-kg:word-cat"][0].ease_factor.has_value());
}

TEST_F(TelemetryAdapterTest, SourceErrorsPropagate) {
    source.failure = TelemetryError::Kind::Timeout;
    TelemetryAdapter adapter(source, normalizer);

    try {
        adapter.fetchReviewStates();
        FAIL() << "expected TelemetryError";
    }
    catch (const TelemetryError& e) {
        EXPECT_TRUE(e.isTimeout());
    }
}
