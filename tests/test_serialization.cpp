///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../mpi/plan_serialization.hpp"
#include "../opencl/plan_encoding.hpp"
#include "../sequential/sequential_optimizer.hpp"
#include "demo_instances.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>


///////////////////////////
///    PLAN MESSAGES    ///
///////////////////////////
TEST(PlanSerialization, RestoresTheWinningPlan) {
    SeatingProblem problem = makeDemoProblem(DemoSize::S);
    GuestIndex index(problem.guests);
    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult r = optimizer.optimize(problem);

    PlanMessage sent{r.plan, r.iterations, r.finalState};
    std::vector<int> buffer;
    serializePlan(sent, index, buffer);
    PlanMessage received = deserializePlan(buffer, index);

    EXPECT_TRUE(samePlan(sent.plan, received.plan));
    EXPECT_EQ(received.iterations, r.iterations);
    EXPECT_EQ(received.finalState, r.finalState);

    OptimizationResult rebuilt = finalizeResult(problem, index, received.plan,
                                                received.iterations, received.finalState);
    EXPECT_EQ(rebuilt.metrics.weighted, r.metrics.weighted);
    EXPECT_EQ(rebuilt.explanations.overall, r.explanations.overall);
    EXPECT_EQ(rebuilt.warnings, r.warnings);
}

TEST(PlanSerialization, BufferLayout) {
    std::vector<Guest> guests = {guest("a"), guest("b"), guest("c")};
    GuestIndex index(guests);
    PlanMessage msg{plan({{"c", "a"}, {}, {"b"}}), 7, OptimizerState::CONVERGED};

    std::vector<int> buffer;
    serializePlan(msg, index, buffer);
    EXPECT_EQ(buffer, (std::vector<int>{7, (int)OptimizerState::CONVERGED, 3, 2, 2, 0, 0, 1, 1}));
}

TEST(PlanSerialization, RejectsTruncatedBuffer) {
    std::vector<Guest> guests = {guest("a"), guest("b")};
    GuestIndex index(guests);
    std::vector<int> buffer;
    serializePlan(PlanMessage{plan({{"a", "b"}}), 1, OptimizerState::CONVERGED}, index, buffer);
    buffer.pop_back();
    EXPECT_THROW(deserializePlan(buffer, index), std::runtime_error);
}

TEST(PlanSerialization, RejectsUnknownGuestPosition) {
    std::vector<Guest> guests = {guest("a")};
    GuestIndex index(guests);
    std::vector<int> buffer = {0, (int)OptimizerState::CONVERGED, 1, 1, 5};
    EXPECT_THROW(deserializePlan(buffer, index), std::runtime_error);
}


///////////////////////////
///    GUEST ENCODING   ///
///////////////////////////
TEST(GuestEncoding, CodesInFirstAppearanceOrder) {
    std::vector<Guest> guests = {
            guest("a", "Acme", "Sales", GuestType::BUYER, Seniority::SENIOR),
            guest("b", "", "Ops", GuestType::SELLER),
            guest("c", "Globex", "Sales", GuestType::CATALYST, Seniority::JUNIOR),
            guest("d", "Acme", "", GuestType::NEUTRAL)
    };
    GuestIndex index(guests);
    EncodedGuests enc = encodeGuests(index);

    EXPECT_EQ(enc.company, (std::vector<int>{0, -1, 1, 0}));
    EXPECT_EQ(enc.department, (std::vector<int>{0, 1, 0, -1}));
    EXPECT_EQ(enc.seniority, (std::vector<int>{(int)Seniority::SENIOR, -1, (int)Seniority::JUNIOR, -1}));
    EXPECT_EQ(enc.type, (std::vector<int>{(int)GuestType::BUYER, (int)GuestType::SELLER,
                                          (int)GuestType::CATALYST, (int)GuestType::NEUTRAL}));
}

TEST(GuestEncoding, ConnectionsAreSymmetric) {
    std::vector<Guest> guests = {guest("a"), guest("b"), guest("c")};
    guests[0].knownConnections = {"c", "ghost", "a"};
    guests[1].knownConnections = {"a"};
    GuestIndex index(guests);
    EncodedGuests enc = encodeGuests(index);

    EXPECT_EQ(enc.connectionOffsets, (std::vector<int>{0, 2, 3, 4}));
    EXPECT_EQ(enc.connections, (std::vector<int>{1, 2, 0, 0}));
}

TEST(GuestEncoding, PlanGridPadsEmptySeats) {
    std::vector<Guest> guests = {guest("a"), guest("b"), guest("c")};
    GuestIndex index(guests);

    std::vector<int> grid = {9};
    appendPlanGrid(plan({{"b"}, {"c", "a"}}), index, 3, 2, grid);
    EXPECT_EQ(grid, (std::vector<int>{9, 1, -1, 2, 0, -1, -1}));
}

TEST(GuestEncoding, PlanGridRejectsOverflow) {
    std::vector<Guest> guests = {guest("a"), guest("b"), guest("c")};
    GuestIndex index(guests);
    std::vector<int> grid;
    EXPECT_THROW(appendPlanGrid(plan({{"a", "b", "c"}}), index, 2, 2, grid), std::invalid_argument);
    EXPECT_THROW(appendPlanGrid(plan({{"a"}, {"b"}, {"c"}}), index, 2, 2, grid), std::invalid_argument);
}
