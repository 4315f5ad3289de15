///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "optimizer_base.hpp"
#include "assignment.hpp"
#include "constraints.hpp"
#include "explanations.hpp"
#include "scoring.hpp"
#include <cmath>
#include <stdexcept>
#include <unordered_set>


///////////////////////////
///     VALIDATION      ///
///////////////////////////
static void checkWeight(double w, const char* name) {
    if (!std::isfinite(w) || w < 0.0) {
        throw std::invalid_argument(std::string("Objective weight '") + name +
                                    "' must be a finite non-negative number");
    }
}

void validateProblem(const SeatingProblem& problem) {
    const OptimizerConfig& cfg = problem.config;
    if (cfg.tableCount <= 0) {
        throw std::invalid_argument("Table count must be positive, got " + std::to_string(cfg.tableCount));
    }
    if (cfg.seatsPerTable <= 0) {
        throw std::invalid_argument("Seats per table must be positive, got " +
                                    std::to_string(cfg.seatsPerTable));
    }
    if (cfg.maxIterations < 0) {
        throw std::invalid_argument("Max iterations must not be negative, got " +
                                    std::to_string(cfg.maxIterations));
    }
    checkWeight(problem.weights.novelty, "novelty");
    checkWeight(problem.weights.diversity, "diversity");
    checkWeight(problem.weights.balance, "balance");
    checkWeight(problem.weights.transaction, "transaction");
}


///////////////////////////
///   RESULT BUILDING   ///
///////////////////////////
SeatingPlan buildStartingPlan(const SeatingProblem& problem, const GuestIndex& guests) {
    const OptimizerConfig& cfg = problem.config;
    SeededRandom rng(cfg.seed);

    SeatingPlan plan = buildInitialAssignment(problem.guests, problem.constraints,
                                              cfg.tableCount, cfg.seatsPerTable, rng);
    if (!validateConstraints(plan, problem.constraints, guests).valid) {
        plan = repairAssignment(plan, problem.constraints, cfg.seatsPerTable);
    }
    return plan;
}

OptimizationResult makeInfeasibleResult(const std::string& reason) {
    OptimizationResult result;
    result.explanations.overall = "Unable to create seating plan: " + reason;
    result.warnings.push_back(reason);
    result.feasible = false;
    result.iterations = 0;
    result.finalState = OptimizerState::INFEASIBLE_TERMINATED;
    return result;
}

std::vector<std::string> collectWarnings(const std::vector<Guest>& guests, const SeatingPlan& plan) {
    std::vector<std::string> warnings;

    for (const Guest& g : guests) {
        if (g.company.empty()) {
            warnings.push_back("Guest \"" + g.name + "\" has no company specified");
        }
    }

    std::unordered_set<std::string> seated;
    for (const Table& t : plan.tables) {
        seated.insert(t.guestIds.begin(), t.guestIds.end());
    }
    for (const Guest& g : guests) {
        if (!seated.count(g.id)) {
            warnings.push_back("Guest \"" + g.name + "\" was not assigned to any table");
        }
    }
    return warnings;
}

OptimizationResult finalizeResult(const SeatingProblem& problem,
                                  const GuestIndex& guests,
                                  SeatingPlan plan,
                                  int iterations,
                                  OptimizerState finalState) {
    OptimizationResult result;
    result.metrics = calculateAllMetrics(plan, guests, problem.weights);
    result.explanations = generateExplanations(plan, guests, result.metrics, problem.constraints);
    result.warnings = collectWarnings(problem.guests, plan);
    result.feasible = validateConstraints(plan, problem.constraints, guests).valid;
    result.iterations = iterations;
    result.finalState = finalState;
    result.plan = std::move(plan);
    return result;
}

bool isBetterResult(const OptimizationResult& a, const OptimizationResult& b) {
    if (a.feasible != b.feasible) return a.feasible;
    return a.metrics.weighted > b.metrics.weighted;
}
