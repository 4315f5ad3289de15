#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "optimizer_base.hpp"
#include <atomic>
#include <mutex>


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
/**
 * @brief Multithreaded multi-start local search.
 *
 * Runs numStarts independent sequential searches with seeds seed, seed+1, ...
 * on a pool of worker threads. Each worker pulls the next start index from a
 * shared counter and publishes its result under a mutex. The winner is chosen
 * by (feasible, weighted score, lowest start index), so the returned result
 * does not depend on the number of threads or on scheduling.
 */
class ThreadedMultiStartOptimizer : public ISeatingOptimizer {
public:
    /**
     * @brief Create a threaded multi-start optimizer.
     *
     * @param numStarts  Number of independent starts (at least 1).
     * @param numThreads Number of worker threads (at least 1).
     */
    ThreadedMultiStartOptimizer(int numStarts, int numThreads);

    OptimizationResult optimize(const SeatingProblem& problem) override;

    /**
     * @brief Start index (0-based) of the winning run of the last optimize() call.
     */
    int bestStart() const { return bestStart_; }

private:
    int numStarts_;   ///< Number of independent starts.
    int numThreads_;  ///< Number of worker threads.

    // Shared state across workers
    const SeatingProblem* problem_ = nullptr; ///< Problem being optimized (valid only during optimize()).
    OptimizationResult best_;  ///< Best result published so far.
    int bestStart_ = -1;       ///< Start index of best_, -1 before any start finished.
    std::mutex bestMutex_;     ///< Guards best_ and bestStart_.
    std::atomic<int> nextStart_{0}; ///< Next start index to hand out.

    /**
     * @brief Worker loop: claim start indices until none remain.
     */
    void worker();

    /**
     * @brief Publish the result of one start if it beats the current best.
     */
    void publish(int start, OptimizationResult&& result);
};
