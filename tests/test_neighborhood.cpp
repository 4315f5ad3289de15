///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "neighborhood.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>


///////////////////////////
///        SWAPS        ///
///////////////////////////
TEST(Swaps, FollowTableThenSeatOrder) {
    SeatingPlan p = plan({{"a", "b"}, {"c"}, {"d"}});
    std::vector<Move> seen;
    bool stopped = visitSwaps(p, [&](const Move& m) {
        seen.push_back(m);
        return false;
    });

    EXPECT_FALSE(stopped);
    // (t0,t1): 2x1, (t0,t2): 2x1, (t1,t2): 1x1
    ASSERT_EQ(seen.size(), 5u);
    EXPECT_EQ(seen[0].fromTable, 0);
    EXPECT_EQ(seen[0].fromSeat, 0);
    EXPECT_EQ(seen[0].toTable, 1);
    EXPECT_EQ(seen[0].toSeat, 0);
    EXPECT_EQ(seen[1].fromSeat, 1);
    EXPECT_EQ(seen[1].toTable, 1);
    EXPECT_EQ(seen[2].toTable, 2);
    EXPECT_EQ(seen[4].fromTable, 1);
    EXPECT_EQ(seen[4].toTable, 2);
    for (const Move& m : seen) EXPECT_EQ(m.kind, Move::Kind::SWAP);
}

TEST(Swaps, VisitorCanStopTheWalk) {
    SeatingPlan p = plan({{"a", "b"}, {"c", "d"}});
    int calls = 0;
    bool stopped = visitSwaps(p, [&](const Move&) { return ++calls == 2; });
    EXPECT_TRUE(stopped);
    EXPECT_EQ(calls, 2);
}


///////////////////////////
///     RELOCATIONS     ///
///////////////////////////
TEST(Relocations, SkipFullDestinations) {
    SeatingPlan p = plan({{"a", "b"}, {"c"}});
    std::vector<Move> seen;
    visitRelocations(p, 2, [&](const Move& m) {
        seen.push_back(m);
        return false;
    });

    // Table 0 is full, so only moves into table 1 are proposed.
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].kind, Move::Kind::RELOCATE);
    EXPECT_EQ(seen[0].fromTable, 0);
    EXPECT_EQ(seen[0].fromSeat, 0);
    EXPECT_EQ(seen[0].toTable, 1);
    EXPECT_EQ(seen[1].fromSeat, 1);
}


///////////////////////////
///      SNAPSHOTS      ///
///////////////////////////
TEST(ApplyMove, SwapExchangesSeatsAndKeepsOriginal) {
    SeatingPlan p = plan({{"a", "b"}, {"c", "d"}});
    SeatingPlan next = applyMove(p, Move{Move::Kind::SWAP, 0, 1, 1, 0});

    EXPECT_EQ(next.tables[0].guestIds, (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(next.tables[1].guestIds, (std::vector<std::string>{"b", "d"}));
    EXPECT_EQ(p.tables[0].guestIds, (std::vector<std::string>{"a", "b"}));
}

TEST(ApplyMove, RelocateAppendsToDestination) {
    SeatingPlan p = plan({{"a", "b", "c"}, {"d"}});
    SeatingPlan next = applyMove(p, Move{Move::Kind::RELOCATE, 0, 1, 1, -1});

    EXPECT_EQ(next.tables[0].guestIds, (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(next.tables[1].guestIds, (std::vector<std::string>{"d", "b"}));
    EXPECT_EQ(p.tables[0].guestIds.size(), 3u);
}
