#include <gtest/gtest.h>
#include "telemetry/Linkage.hpp"

TEST(LinkageTest, RelationEntryResolvesToTarget) {
    LinkageBlock block;
    ASSERT_TRUE(parseLinkageBlock(
        R"([{"card_index": 1, "kg_link": {"source": "srs-kg:char-cat", "target": "srs-kg:word-cat"}}])", block));
    ASSERT_EQ(block.size(), 1u);
    EXPECT_EQ(nodeIdsForIndex(block, 1), std::vector<std::string>{"srs-kg:word-cat"});
}

TEST(LinkageTest, RelationWithoutTargetFallsBackToSource) {
    LinkageBlock block;
    ASSERT_TRUE(parseLinkageBlock(R"([{"card_index": 2, "kg_link": {"source": "word-sun"}}])", block));
    EXPECT_EQ(nodeIdsForIndex(block, 2), std::vector<std::string>{"word-sun"});
}

TEST(LinkageTest, LegacyListAndScalarIds) {
    LinkageBlock block;
    ASSERT_TRUE(parseLinkageBlock(
        R"([{"cloze_index": "1", "kg_ids": ["word-cat", "char-cat"]},
            {"card_index": 2.0, "kg_ids": "word-dog"}])", block));

    std::vector<std::string> first{"word-cat", "char-cat"};
    EXPECT_EQ(nodeIdsForIndex(block, 1), first);
    EXPECT_EQ(nodeIdsForIndex(block, 2), std::vector<std::string>{"word-dog"});
}

TEST(LinkageTest, FirstMatchingEntryWins) {
    LinkageBlock block;
    ASSERT_TRUE(parseLinkageBlock(
        R"([{"card_index": 1, "kg_ids": ["first"]}, {"card_index": 1, "kg_ids": ["second"]}])", block));
    EXPECT_EQ(nodeIdsForIndex(block, 1), std::vector<std::string>{"first"});
}

TEST(LinkageTest, UnknownIndexHasNoNodes) {
    LinkageBlock block;
    ASSERT_TRUE(parseLinkageBlock(R"([{"card_index": 1, "kg_ids": ["a"]}])", block));
    EXPECT_TRUE(nodeIdsForIndex(block, 3).empty());
}

TEST(LinkageTest, UnusableEntriesAreSkipped) {
    LinkageBlock block;
    ASSERT_TRUE(parseLinkageBlock(
        R"([42, {"kg_ids": ["no index"]}, {"card_index": "x", "kg_ids": ["bad index"]},
            {"card_index": 4, "kg_ids": ["ok"]}])", block));
    ASSERT_EQ(block.size(), 1u);
    EXPECT_EQ(block[0].index, 4);
}

TEST(LinkageTest, OutOfRangeOrFractionalIndexIsSkipped) {
    LinkageBlock block;
    ASSERT_TRUE(parseLinkageBlock(
        R"([{"card_index": 1e20, "kg_ids": ["huge float"]},
            {"card_index": 99999999999, "kg_ids": ["huge integer"]},
            {"card_index": -99999999999, "kg_ids": ["huge negative"]},
            {"card_index": 1.5, "kg_ids": ["fraction"]},
            {"card_index": "99999999999", "kg_ids": ["huge string"]},
            {"card_index": 3, "kg_ids": ["ok"]}])", block));
    ASSERT_EQ(block.size(), 1u);
    EXPECT_EQ(block[0].index, 3);
}

TEST(LinkageTest, MalformedDocumentIsRejected) {
    LinkageBlock block;
    EXPECT_FALSE(parseLinkageBlock("{not json", block));
    EXPECT_FALSE(parseLinkageBlock(R"({"card_index": 1})", block));
    EXPECT_FALSE(parseLinkageBlock("", block));
}
