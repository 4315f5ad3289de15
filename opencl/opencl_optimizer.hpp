#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "guest_index.hpp"
#include "neighborhood.hpp"
#include "optimizer_base.hpp"
#include "opencl_scorer.hpp"
#include "plan_encoding.hpp"
#include <vector>


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
/**
 * @brief Local search that offloads candidate scoring to OpenCL.
 *
 * Walks the same neighbourhood in the same order as the sequential search,
 * but collects validated candidates into batches and scores each batch on
 * the device at once. Within a batch, the first candidate in traversal order
 * whose device score beats the current score is re-scored on the CPU and
 * accepted only if that confirms a strict improvement.
 */
class OpenCLLocalSearchOptimizer : public ISeatingOptimizer {
public:
    /**
     * @brief Construct an OpenCL-backed local search optimizer.
     *
     * @param batchSize Number of validated candidates scored per device call.
     * @throws std::runtime_error if the OpenCL context cannot be created.
     */
    explicit OpenCLLocalSearchOptimizer(int batchSize);

    OptimizationResult optimize(const SeatingProblem& problem) override;

    /**
     * @brief Number of batches sent to the device during the last optimize() call.
     */
    long long batchesEvaluated() const { return batchesEvaluated_; }

private:
    /// Target number of candidates per device batch.
    int batchSize_;

    /// OpenCL context and kernel used for batched scoring.
    SeatingOpenCLContext clctx_;

    // Per-run state, valid only during optimize()
    const SeatingProblem* problem_ = nullptr;
    const GuestIndex* guests_ = nullptr;
    EncodedGuests encoded_;
    SeatingPlan current_;
    PlanMetrics currentMetrics_;

    /// Validated candidates awaiting device scoring, in traversal order.
    std::vector<SeatingPlan> batch_;

    long long batchesEvaluated_ = 0;

    /**
     * @brief Validate one move and queue the resulting plan; flush when the batch is full.
     *
     * @return true if a flush accepted a candidate.
     */
    bool offer(const Move& move);

    /**
     * @brief Score the queued batch on the device and accept the first confirmed improvement.
     *
     * The batch is cleared in every case.
     *
     * @return true if a candidate was accepted.
     */
    bool flushBatch();

    /**
     * @brief One search pass: swaps first, then relocations.
     */
    bool improveOnce();
};
