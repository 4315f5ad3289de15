#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "guest_index.hpp"
#include <string>
#include <vector>


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for seating optimizers.
 *
 * Implementations may be sequential, multithreaded, GPU-accelerated or
 * distributed, but all expose the same optimize() contract: domain-level
 * infeasibility is reported through the result (feasible flag, warnings),
 * never as an exception.
 */
class ISeatingOptimizer {
public:
    virtual ~ISeatingOptimizer() = default;

    /**
     * @brief Seat the guests of a problem and return the full result bundle.
     *
     * @throws std::invalid_argument if the problem is malformed (see validateProblem()).
     */
    virtual OptimizationResult optimize(const SeatingProblem& problem) = 0;
};


///////////////////////////
///   RESULT BUILDING   ///
///////////////////////////
/**
 * @brief Reject malformed inputs before any work is done.
 *
 * Throws std::invalid_argument for a non-positive table count or seat count,
 * a negative iteration budget, or a negative / non-finite weight.
 */
void validateProblem(const SeatingProblem& problem);

/**
 * @brief Greedy starting plan for a run, repaired if it violates a constraint.
 *
 * Uses config.seed for the shuffle, so the same problem always yields the
 * same starting plan.
 */
SeatingPlan buildStartingPlan(const SeatingProblem& problem, const GuestIndex& guests);

/**
 * @brief Terminal result for a problem that failed the feasibility check.
 *
 * Empty plan, zero metrics, the reason as the single warning, feasible=false,
 * zero iterations.
 */
OptimizationResult makeInfeasibleResult(const std::string& reason);

/**
 * @brief Advisories about a finished plan.
 *
 * Guests without a company come first (in guest order), followed by guests
 * that could not be seated.
 */
std::vector<std::string> collectWarnings(const std::vector<Guest>& guests, const SeatingPlan& plan);

/**
 * @brief Assemble the full result for a finished plan.
 *
 * Recomputes metrics, explanations, warnings and the final validation from
 * the plan, so any participant holding the same problem can rebuild an
 * identical result from the plan alone.
 */
OptimizationResult finalizeResult(const SeatingProblem& problem,
                                  const GuestIndex& guests,
                                  SeatingPlan plan,
                                  int iterations,
                                  OptimizerState finalState);

/**
 * @brief Ordering used to pick the winner among independent runs.
 *
 * Feasible results beat infeasible ones; then the higher weighted score wins.
 * Returns true iff a is strictly better than b.
 */
bool isBetterResult(const OptimizationResult& a, const OptimizationResult& b);
