///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/sequential_optimizer.hpp"
#include "constraints.hpp"
#include "demo_instances.hpp"
#include "scoring.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static void expectUniqueWithinCapacity(const SeatingProblem& problem, const OptimizationResult& result) {
    std::set<std::string> seen;
    for (const Table& t : result.plan.tables) {
        EXPECT_LE((int)t.guestIds.size(), problem.config.seatsPerTable) << t.tableId;
        for (const std::string& id : t.guestIds) {
            EXPECT_TRUE(seen.insert(id).second) << id << " seated twice";
        }
    }
}

static bool hasWarning(const OptimizationResult& r, const std::string& text) {
    return std::find(r.warnings.begin(), r.warnings.end(), text) != r.warnings.end();
}


///////////////////////////
///      SCENARIOS      ///
///////////////////////////
TEST(SequentialOptimizer, FourGuestBuyerSellerEvent) {
    SeatingProblem problem = makeDemoProblem(DemoSize::XS);
    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult r = optimizer.optimize(problem);

    EXPECT_TRUE(r.feasible);
    EXPECT_EQ(r.finalState, OptimizerState::CONVERGED);
    ASSERT_EQ(r.plan.tables.size(), 2u);
    int seated = 0;
    for (const Table& t : r.plan.tables) seated += (int)t.guestIds.size();
    EXPECT_EQ(seated, 4);
    EXPECT_GT(r.metrics.transaction, 0.5);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(SequentialOptimizer, OversizedGroupIsInfeasible) {
    SeatingProblem problem;
    problem.guests = {guest("a"), guest("b"), guest("c")};
    problem.constraints = {constraint("group", ConstraintType::MUST_SIT_TOGETHER, {"a", "b", "c"})};
    problem.config.tableCount = 3;
    problem.config.seatsPerTable = 2;

    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult r = optimizer.optimize(problem);

    EXPECT_FALSE(r.feasible);
    EXPECT_EQ(r.iterations, 0);
    EXPECT_EQ(r.finalState, OptimizerState::INFEASIBLE_TERMINATED);
    EXPECT_TRUE(r.plan.tables.empty());
    EXPECT_EQ(r.metrics.weighted, 0.0);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0], "MUST_SIT_TOGETHER constraint has 3 guests but tables only have 2 seats");
    EXPECT_EQ(r.explanations.overall, "Unable to create seating plan: " + r.warnings[0]);
    EXPECT_TRUE(r.explanations.reasonCodes.empty());
}

TEST(SequentialOptimizer, MustNotWithSingleTableStaysInfeasible) {
    SeatingProblem problem;
    problem.guests = {guest("a", "Acme"), guest("b", "Globex")};
    problem.constraints = {constraint("apart", ConstraintType::MUST_NOT_SIT_TOGETHER, {"a", "b"})};
    problem.config.tableCount = 1;
    problem.config.seatsPerTable = 4;

    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult r = optimizer.optimize(problem);

    EXPECT_FALSE(r.feasible);
    ASSERT_EQ(r.plan.tables.size(), 1u);
    EXPECT_EQ(r.plan.tables[0].guestIds.size(), 2u);
    EXPECT_FALSE(hasWarning(r, "Guest \"Guest a\" was not assigned to any table"));
}


///////////////////////////
///     PROPERTIES      ///
///////////////////////////
TEST(SequentialOptimizer, IsDeterministicForASeed) {
    SeatingProblem problem = makeDemoProblem(DemoSize::M);
    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult a = optimizer.optimize(problem);
    OptimizationResult b = optimizer.optimize(problem);

    EXPECT_TRUE(samePlan(a.plan, b.plan));
    EXPECT_EQ(a.metrics.weighted, b.metrics.weighted);
    EXPECT_EQ(a.iterations, b.iterations);
    EXPECT_EQ(a.explanations.overall, b.explanations.overall);
    ASSERT_EQ(a.explanations.reasonCodes.size(), b.explanations.reasonCodes.size());
    for (size_t i = 0; i < a.explanations.reasonCodes.size(); ++i) {
        EXPECT_EQ(a.explanations.reasonCodes[i].code, b.explanations.reasonCodes[i].code);
        EXPECT_EQ(a.explanations.reasonCodes[i].description, b.explanations.reasonCodes[i].description);
    }
    EXPECT_EQ(a.warnings, b.warnings);
}

TEST(SequentialOptimizer, EveryGuestSeatedOnceWithinCapacity) {
    SeatingProblem problem = makeDemoProblem(DemoSize::M);
    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult r = optimizer.optimize(problem);

    expectUniqueWithinCapacity(problem, r);
    for (const Guest& g : problem.guests) {
        EXPECT_FALSE(hasWarning(r, "Guest \"" + g.name + "\" was not assigned to any table"));
    }
}

TEST(SequentialOptimizer, NeverEndsBelowItsStartingPlan) {
    for (std::uint32_t seed : {1u, 42u, 1234u}) {
        SeatingProblem problem = makeDemoProblem(DemoSize::S);
        problem.config.seed = seed;
        GuestIndex index(problem.guests);
        double initial = calculateAllMetrics(buildStartingPlan(problem, index), index, problem.weights).weighted;

        SequentialLocalSearchOptimizer optimizer;
        OptimizationResult r = optimizer.optimize(problem);
        EXPECT_GE(r.metrics.weighted, initial) << "seed " << seed;
    }
}

TEST(SequentialOptimizer, ResultMetricsMatchRescoringThePlan) {
    SeatingProblem problem = makeDemoProblem(DemoSize::S);
    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult r = optimizer.optimize(problem);

    PlanMetrics again = calculateAllMetrics(r.plan, problem.guests, problem.weights);
    EXPECT_EQ(r.metrics.weighted, again.weighted);
    EXPECT_EQ(r.feasible, validateConstraints(r.plan, problem.constraints, problem.guests).valid);
}

TEST(SequentialOptimizer, ZeroIterationBudgetReturnsStartingPlan) {
    SeatingProblem problem = makeDemoProblem(DemoSize::S);
    problem.config.maxIterations = 0;
    GuestIndex index(problem.guests);
    SeatingPlan start = buildStartingPlan(problem, index);

    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult r = optimizer.optimize(problem);
    EXPECT_EQ(r.iterations, 0);
    EXPECT_EQ(r.finalState, OptimizerState::ITERATION_LIMIT_REACHED);
    EXPECT_TRUE(samePlan(r.plan, start));
}

TEST(SequentialOptimizer, IterationLimitStopsTheSearch) {
    SeatingProblem problem = makeDemoProblem(DemoSize::L);
    problem.config.maxIterations = 3;

    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult r = optimizer.optimize(problem);
    EXPECT_LE(r.iterations, 3);
    if (r.finalState == OptimizerState::ITERATION_LIMIT_REACHED) {
        EXPECT_EQ(r.iterations, 3);
    } else {
        EXPECT_EQ(r.finalState, OptimizerState::CONVERGED);
    }
}

TEST(SequentialOptimizer, WarnsAboutMissingCompany) {
    SeatingProblem problem = makeDemoProblem(DemoSize::S);
    SequentialLocalSearchOptimizer optimizer;
    OptimizationResult r = optimizer.optimize(problem);
    EXPECT_TRUE(hasWarning(r, "Guest \"Max Weber\" has no company specified"));
}


///////////////////////////
///   RESULT BUILDING   ///
///////////////////////////
TEST(ResultBuilder, WarningsListMissingCompaniesBeforeUnseatedGuests) {
    std::vector<Guest> guests = {guest("a", "Acme"), guest("b"), guest("c", "Globex"), guest("d")};
    std::vector<std::string> w = collectWarnings(guests, plan({{"a", "b"}}));
    EXPECT_EQ(w, (std::vector<std::string>{
            "Guest \"Guest b\" has no company specified",
            "Guest \"Guest d\" has no company specified",
            "Guest \"Guest c\" was not assigned to any table",
            "Guest \"Guest d\" was not assigned to any table"
    }));
}

TEST(ResultBuilder, RejectsMalformedProblems) {
    SeatingProblem problem = makeDemoProblem(DemoSize::XS);
    SequentialLocalSearchOptimizer optimizer;

    SeatingProblem noTables = problem;
    noTables.config.tableCount = 0;
    EXPECT_THROW(optimizer.optimize(noTables), std::invalid_argument);

    SeatingProblem noSeats = problem;
    noSeats.config.seatsPerTable = -1;
    EXPECT_THROW(optimizer.optimize(noSeats), std::invalid_argument);

    SeatingProblem negativeBudget = problem;
    negativeBudget.config.maxIterations = -5;
    EXPECT_THROW(validateProblem(negativeBudget), std::invalid_argument);

    SeatingProblem badWeight = problem;
    badWeight.weights.balance = -0.1;
    EXPECT_THROW(validateProblem(badWeight), std::invalid_argument);

    SeatingProblem nanWeight = problem;
    nanWeight.weights.novelty = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validateProblem(nanWeight), std::invalid_argument);

    EXPECT_NO_THROW(validateProblem(problem));
}
