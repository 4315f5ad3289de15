///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "assignment.hpp"
#include "constraints.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::vector<Guest> numberedGuests(int n) {
    std::vector<Guest> guests;
    for (int i = 0; i < n; ++i) guests.push_back(guest("g" + std::to_string(i)));
    return guests;
}

static int tableOf(const SeatingPlan& p, const std::string& id) {
    for (int t = 0; t < (int)p.tables.size(); ++t) {
        const auto& ids = p.tables[t].guestIds;
        if (std::find(ids.begin(), ids.end(), id) != ids.end()) return t;
    }
    return -1;
}


///////////////////////////
///       RANDOM        ///
///////////////////////////
TEST(SeededRandom, SameSeedSameSequence) {
    SeededRandom a(7), b(7);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(a.upTo(100), b.upTo(100));
    }
}

TEST(SeededRandom, ShuffleIsAPermutation) {
    std::vector<int> items = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    SeededRandom rng(42);
    rng.shuffle(items);
    std::vector<int> sorted = items;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(sorted, (std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));
}


///////////////////////////
///       BUILDER       ///
///////////////////////////
TEST(InitialAssignment, SeatsEveryGuestOnceWithinCapacity) {
    std::vector<Guest> guests = numberedGuests(23);
    SeededRandom rng(42);
    SeatingPlan p = buildInitialAssignment(guests, {}, 4, 6, rng);

    ASSERT_EQ(p.tables.size(), 4u);
    std::multiset<std::string> seated;
    for (int t = 0; t < 4; ++t) {
        EXPECT_EQ(p.tables[t].tableId, tableLabel(t));
        EXPECT_LE((int)p.tables[t].guestIds.size(), 6);
        seated.insert(p.tables[t].guestIds.begin(), p.tables[t].guestIds.end());
    }
    EXPECT_EQ(seated.size(), guests.size());
    for (const Guest& g : guests) EXPECT_EQ(seated.count(g.id), 1u);
}

TEST(InitialAssignment, SameSeedSamePlan) {
    std::vector<Guest> guests = numberedGuests(15);
    SeededRandom rng1(99), rng2(99);
    EXPECT_TRUE(samePlan(buildInitialAssignment(guests, {}, 3, 5, rng1),
                         buildInitialAssignment(guests, {}, 3, 5, rng2)));
}

TEST(InitialAssignment, GroupsAreSeatedTogether) {
    std::vector<Guest> guests = numberedGuests(12);
    std::vector<Constraint> constraints = {
            constraint("g1", ConstraintType::MUST_SIT_TOGETHER, {"g3", "g7", "g11"}),
            constraint("g2", ConstraintType::MUST_SIT_TOGETHER, {"g0", "g1", "g2", "ghost"})
    };
    SeededRandom rng(5);
    SeatingPlan p = buildInitialAssignment(guests, constraints, 3, 4, rng);

    EXPECT_EQ(tableOf(p, "g3"), tableOf(p, "g7"));
    EXPECT_EQ(tableOf(p, "g3"), tableOf(p, "g11"));
    EXPECT_EQ(tableOf(p, "g0"), tableOf(p, "g1"));
    EXPECT_EQ(tableOf(p, "g0"), tableOf(p, "g2"));
    EXPECT_EQ(tableOf(p, "ghost"), -1);
    EXPECT_TRUE(validateConstraints(p, constraints, guests).valid);
}

TEST(InitialAssignment, AvoidsConflictsWhenRoomExists) {
    std::vector<Guest> guests = numberedGuests(6);
    std::vector<Constraint> constraints = {
            constraint("apart", ConstraintType::MUST_NOT_SIT_TOGETHER, {"g0", "g1", "g2"})
    };
    for (std::uint32_t seed = 1; seed <= 10; ++seed) {
        SeededRandom rng(seed);
        SeatingPlan p = buildInitialAssignment(guests, constraints, 3, 4, rng);
        EXPECT_TRUE(validateConstraints(p, constraints, guests).valid) << "seed " << seed;
    }
}

TEST(InitialAssignment, FallsBackToAnyFreeSeat) {
    std::vector<Guest> guests = numberedGuests(2);
    std::vector<Constraint> constraints = {
            constraint("apart", ConstraintType::MUST_NOT_SIT_TOGETHER, {"g0", "g1"})
    };
    SeededRandom rng(42);
    SeatingPlan p = buildInitialAssignment(guests, constraints, 1, 2, rng);
    ASSERT_EQ(p.tables.size(), 1u);
    EXPECT_EQ(p.tables[0].guestIds.size(), 2u);
}


///////////////////////////
///       REPAIR        ///
///////////////////////////
TEST(Repair, MovesLastConflictingGuestToFreeTable) {
    std::vector<Constraint> constraints = {
            constraint("apart", ConstraintType::MUST_NOT_SIT_TOGETHER, {"a", "b"})
    };
    SeatingPlan original = plan({{"a", "x", "b"}, {"y"}});
    SeatingPlan repaired = repairAssignment(original, constraints, 3);

    EXPECT_EQ(repaired.tables[0].guestIds, (std::vector<std::string>{"a", "x"}));
    EXPECT_EQ(repaired.tables[1].guestIds, (std::vector<std::string>{"y", "b"}));
    // Input is left untouched.
    EXPECT_EQ(original.tables[0].guestIds.size(), 3u);
}

TEST(Repair, SkipsTablesHoldingAnotherMember) {
    std::vector<Constraint> constraints = {
            constraint("apart", ConstraintType::MUST_NOT_SIT_TOGETHER, {"a", "b", "c"})
    };
    SeatingPlan repaired = repairAssignment(plan({{"a", "b"}, {"c"}, {}}), constraints, 4);
    EXPECT_EQ(repaired.tables[0].guestIds, (std::vector<std::string>{"a"}));
    EXPECT_EQ(repaired.tables[1].guestIds, (std::vector<std::string>{"c"}));
    EXPECT_EQ(repaired.tables[2].guestIds, (std::vector<std::string>{"b"}));
}

TEST(Repair, LeavesViolationWhenNoTableQualifies) {
    std::vector<Constraint> constraints = {
            constraint("apart", ConstraintType::MUST_NOT_SIT_TOGETHER, {"a", "b"})
    };
    SeatingPlan original = plan({{"a", "b"}, {"x", "y"}});
    EXPECT_TRUE(samePlan(repairAssignment(original, constraints, 2), original));
}
