///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_optimizer.hpp"
#include "constraints.hpp"
#include "scoring.hpp"
#include "logging.hpp"
#include <sstream>


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
OptimizationResult SequentialLocalSearchOptimizer::optimize(const SeatingProblem& problem) {
    validateProblem(problem);
    const OptimizerConfig& cfg = problem.config;

    // INITIALIZING
    FeasibilityResult feasibility = checkFeasibility((int)problem.guests.size(), problem.constraints,
                                                     cfg.tableCount, cfg.seatsPerTable);
    if (!feasibility.feasible) {
        if (cfg.verbose) {
            logLine(std::cout, "[SequentialLocalSearchOptimizer] infeasible: " + feasibility.reason);
        }
        return makeInfeasibleResult(feasibility.reason);
    }

    GuestIndex guests(problem.guests);
    problem_ = &problem;
    guests_ = &guests;

    current_ = buildStartingPlan(problem, guests);
    currentMetrics_ = calculateAllMetrics(current_, guests, problem.weights);

    if (cfg.verbose) {
        std::ostringstream ss;
        ss << "[SequentialLocalSearchOptimizer] seed " << cfg.seed
           << " initial score " << formatScore(currentMetrics_.weighted);
        logLine(std::cout, ss.str());
    }

    // SEARCHING
    int iterations = 0;
    OptimizerState state = OptimizerState::SEARCHING;
    while (state == OptimizerState::SEARCHING) {
        if (iterations >= cfg.maxIterations) {
            state = OptimizerState::ITERATION_LIMIT_REACHED;
            break;
        }
        iterations++;
        if (!improveOnce()) state = OptimizerState::CONVERGED;
    }

    if (cfg.verbose) {
        std::ostringstream ss;
        ss << "[SequentialLocalSearchOptimizer] seed " << cfg.seed << " " << toString(state)
           << " after " << iterations << " iterations, score " << formatScore(currentMetrics_.weighted);
        logLine(std::cout, ss.str());
    }

    OptimizationResult result = finalizeResult(problem, guests, std::move(current_), iterations, state);

    problem_ = nullptr;
    guests_ = nullptr;
    current_ = SeatingPlan{};
    return result;
}

bool SequentialLocalSearchOptimizer::tryMove(const Move& move) {
    SeatingPlan candidate = applyMove(current_, move);
    if (!validateConstraints(candidate, problem_->constraints, *guests_).valid) return false;

    PlanMetrics metrics = calculateAllMetrics(candidate, *guests_, problem_->weights);
    if (metrics.weighted <= currentMetrics_.weighted) return false;

    current_ = std::move(candidate);
    currentMetrics_ = metrics;
    return true;
}

bool SequentialLocalSearchOptimizer::improveOnce() {
    auto visit = [this](const Move& move) { return tryMove(move); };

    // The visitors walk a snapshot of the plan; they stop as soon as a move is taken.
    SeatingPlan snapshot = current_;
    if (visitSwaps(snapshot, visit)) return true;
    return visitRelocations(snapshot, problem_->config.seatsPerTable, visit);
}
