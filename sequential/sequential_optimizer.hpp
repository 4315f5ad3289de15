#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "guest_index.hpp"
#include "neighborhood.hpp"
#include "optimizer_base.hpp"


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
/**
 * @brief Single-threaded greedy local search over seating plans.
 *
 * Starts from the greedy (and, if needed, repaired) assignment, then climbs
 * with first-improvement swaps across tables, falling back to single-guest
 * relocations when no swap helps. A move is accepted only if the resulting
 * plan validates and strictly increases the weighted score, so the search is
 * monotone and fully determined by the problem and its seed.
 */
class SequentialLocalSearchOptimizer : public ISeatingOptimizer {
public:
    SequentialLocalSearchOptimizer() = default;

    /**
     * @brief Run feasibility check, construction and local search for one problem.
     *
     * Returns the infeasible result without building anything if the static
     * check fails; otherwise the best plan reached when the search converges
     * or runs out of iterations.
     */
    OptimizationResult optimize(const SeatingProblem& problem) override;

private:
    /// Problem being optimized (owned externally, valid only during optimize()).
    const SeatingProblem* problem_ = nullptr;

    /// Id lookup over problem_->guests.
    const GuestIndex* guests_ = nullptr;

    /// Plan accepted most recently.
    SeatingPlan current_;

    /// Metrics of current_.
    PlanMetrics currentMetrics_;

    /**
     * @brief Evaluate one move and adopt it if it validates and strictly improves.
     *
     * @return true if the move was accepted.
     */
    bool tryMove(const Move& move);

    /**
     * @brief One search pass: swaps first, then relocations.
     *
     * @return true if some move was accepted.
     */
    bool improveOnce();
};
