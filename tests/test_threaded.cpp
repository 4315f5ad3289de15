///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/sequential_optimizer.hpp"
#include "../threads/threaded_optimizer.hpp"
#include "demo_instances.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ThreadedOptimizer, ResultDoesNotDependOnThreadCount) {
    SeatingProblem problem = makeDemoProblem(DemoSize::M);

    ThreadedMultiStartOptimizer single(6, 1);
    ThreadedMultiStartOptimizer pooled(6, 4);
    OptimizationResult a = single.optimize(problem);
    OptimizationResult b = pooled.optimize(problem);

    EXPECT_TRUE(samePlan(a.plan, b.plan));
    EXPECT_EQ(a.metrics.weighted, b.metrics.weighted);
    EXPECT_EQ(a.feasible, b.feasible);
    EXPECT_EQ(single.bestStart(), pooled.bestStart());
}

TEST(ThreadedOptimizer, NeverWorseThanTheFirstStart) {
    SeatingProblem problem = makeDemoProblem(DemoSize::S);

    SequentialLocalSearchOptimizer sequential;
    OptimizationResult base = sequential.optimize(problem);

    ThreadedMultiStartOptimizer threaded(4, 2);
    OptimizationResult best = threaded.optimize(problem);

    EXPECT_FALSE(isBetterResult(base, best));
    EXPECT_GE(threaded.bestStart(), 0);
    EXPECT_LT(threaded.bestStart(), 4);
}

TEST(ThreadedOptimizer, SingleStartMatchesSequentialRun) {
    SeatingProblem problem = makeDemoProblem(DemoSize::S);

    SequentialLocalSearchOptimizer sequential;
    ThreadedMultiStartOptimizer threaded(1, 3);
    OptimizationResult a = sequential.optimize(problem);
    OptimizationResult b = threaded.optimize(problem);

    EXPECT_TRUE(samePlan(a.plan, b.plan));
    EXPECT_EQ(a.iterations, b.iterations);
    EXPECT_EQ(threaded.bestStart(), 0);
}

TEST(ThreadedOptimizer, InfeasibleProblemShortCircuits) {
    SeatingProblem problem;
    problem.guests = {guest("a"), guest("b"), guest("c")};
    problem.config.tableCount = 1;
    problem.config.seatsPerTable = 2;

    ThreadedMultiStartOptimizer threaded(3, 2);
    OptimizationResult r = threaded.optimize(problem);
    EXPECT_FALSE(r.feasible);
    EXPECT_EQ(r.finalState, OptimizerState::INFEASIBLE_TERMINATED);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0], "Not enough seats: 3 guests but only 2 seats");
}

TEST(ThreadedOptimizer, RejectsNonPositiveSizes) {
    EXPECT_THROW(ThreadedMultiStartOptimizer(0, 2), std::invalid_argument);
    EXPECT_THROW(ThreadedMultiStartOptimizer(2, 0), std::invalid_argument);
}
