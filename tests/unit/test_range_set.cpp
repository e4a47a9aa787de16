#include <vector>

#include <gtest/gtest.h>

#include "chunkvault/ledger/range_set.h"

using chunkvault::ledger::ByteRange;
using chunkvault::ledger::RangeSet;

TEST(RangeSet, EmptySetCoversNothing) {
    RangeSet set;
    EXPECT_TRUE(set.empty());
    EXPECT_EQ(set.CoveredBytes(), 0u);
    EXPECT_FALSE(set.Covers(10));
    EXPECT_EQ(set.NextExpected(10), 0u);
    ASSERT_EQ(set.Missing(10).size(), 1u);
    EXPECT_EQ(set.Missing(10)[0], (ByteRange{0, 9}));
}

TEST(RangeSet, MergesOverlappingAndAdjacent) {
    RangeSet set;
    EXPECT_EQ(set.Insert({0, 9}), 10u);
    EXPECT_EQ(set.Insert({20, 29}), 10u);
    EXPECT_EQ(set.intervals().size(), 2u);

    // Adjacent on the left interval, overlapping nothing.
    EXPECT_EQ(set.Insert({10, 14}), 5u);
    EXPECT_EQ(set.intervals().size(), 2u);

    // Bridges the gap and overlaps both sides.
    EXPECT_EQ(set.Insert({12, 22}), 5u);
    ASSERT_EQ(set.intervals().size(), 1u);
    EXPECT_EQ(set.intervals()[0], (ByteRange{0, 29}));
    EXPECT_EQ(set.CoveredBytes(), 30u);
}

TEST(RangeSet, DuplicateInsertAddsNothing) {
    RangeSet set;
    set.Insert({100, 199});
    EXPECT_EQ(set.Insert({100, 199}), 0u);
    EXPECT_EQ(set.Insert({150, 160}), 0u);
    EXPECT_EQ(set.CoveredBytes(), 100u);
}

TEST(RangeSet, SpanningInsertSwallowsSeveralIntervals) {
    RangeSet set;
    set.Insert({10, 19});
    set.Insert({30, 39});
    set.Insert({50, 59});
    EXPECT_EQ(set.Insert({0, 99}), 70u);
    ASSERT_EQ(set.intervals().size(), 1u);
    EXPECT_TRUE(set.Covers(100));
}

TEST(RangeSet, ContainsRequiresSingleInterval) {
    RangeSet set({{0, 9}, {20, 29}});
    EXPECT_TRUE(set.Contains({0, 9}));
    EXPECT_TRUE(set.Contains({22, 25}));
    EXPECT_FALSE(set.Contains({5, 22}));
    EXPECT_FALSE(set.Contains({10, 10}));
    EXPECT_FALSE(set.Contains({30, 30}));
}

TEST(RangeSet, MissingAndNextExpected) {
    RangeSet set({{0, 199}, {400, 599}});
    const auto missing = set.Missing(1000);
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0], (ByteRange{200, 399}));
    EXPECT_EQ(missing[1], (ByteRange{600, 999}));
    EXPECT_EQ(set.NextExpected(1000), 200u);
    EXPECT_EQ(set.CoveredBytes(), 400u);
}

TEST(RangeSet, NextExpectedIsZeroWithLeadingGap) {
    RangeSet set({{5, 9}});
    EXPECT_EQ(set.NextExpected(10), 0u);
    ASSERT_EQ(set.Missing(10).size(), 1u);
    EXPECT_EQ(set.Missing(10)[0], (ByteRange{0, 4}));
}

TEST(RangeSet, CoversOnlyExactExtent) {
    RangeSet set({{0, 9}});
    EXPECT_TRUE(set.Covers(10));
    EXPECT_FALSE(set.Covers(11));
    EXPECT_EQ(set.NextExpected(10), 10u);
    EXPECT_TRUE(set.Missing(10).empty());
}

TEST(RangeSet, OrderOfInsertionDoesNotMatter) {
    const std::vector<ByteRange> chunks = {{600, 799}, {0, 199}, {800, 999}, {400, 599},
                                           {200, 399}};
    RangeSet forward(chunks);
    RangeSet backward(std::vector<ByteRange>(chunks.rbegin(), chunks.rend()));
    EXPECT_EQ(forward.intervals(), backward.intervals());
    EXPECT_TRUE(forward.Covers(1000));
}
