#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "optimizer_base.hpp"
#include "../threads/threaded_optimizer.hpp"
#include <optional>


///////////////////////////
///     OPTIMIZER       ///
///////////////////////////
/**
 * @brief MPI-based multi-start wrapper around the threaded optimizer.
 *
 * Each MPI rank runs a ThreadedMultiStartOptimizer over its own block of
 * seeds (seed + rank * startsPerRank + i). The ranks agree on the winner
 * (feasible first, then highest weighted score, then lowest rank) with
 * MPI_Allreduce; the winning rank ships its plan to rank 0, which rebuilds
 * and returns the full result. Other ranks return std::nullopt.
 */
class MPIMultiStartOptimizer {
public:
    /**
     * @brief Construct a hybrid MPI + threaded optimizer.
     *
     * @param startsPerRank Independent starts run by every rank.
     * @param numThreads    Worker threads used inside each rank.
     */
    MPIMultiStartOptimizer(int startsPerRank, int numThreads);

    /**
     * @brief Optimize the problem cooperatively across all MPI ranks.
     *
     * Must be called on every rank with the same problem.
     *
     * @return The best result on rank 0, std::nullopt on other ranks.
     */
    std::optional<OptimizationResult> optimize(const SeatingProblem& problem);

    /**
     * @brief Rank that produced the result of the last optimize() call.
     */
    int winnerRank() const { return winnerRank_; }

private:
    int startsPerRank_; ///< Starts per rank.
    int numThreads_;    ///< Worker threads per rank.
    int winnerRank_ = -1;
};
