///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_optimizer.hpp"
#include "constraints.hpp"
#include "scoring.hpp"
#include "logging.hpp"
#include <sstream>
#include <stdexcept>


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
/// Single-precision slack when comparing device scores with the double-precision current score.
static const double DEVICE_SCORE_TOLERANCE = 1e-5;

OpenCLLocalSearchOptimizer::OpenCLLocalSearchOptimizer(int batchSize)
        : batchSize_(batchSize) {
    if (batchSize_ < 1) throw std::invalid_argument("Batch size must be at least 1");
}

OptimizationResult OpenCLLocalSearchOptimizer::optimize(const SeatingProblem& problem) {
    validateProblem(problem);
    const OptimizerConfig& cfg = problem.config;

    FeasibilityResult feasibility = checkFeasibility((int)problem.guests.size(), problem.constraints,
                                                     cfg.tableCount, cfg.seatsPerTable);
    if (!feasibility.feasible) {
        return makeInfeasibleResult(feasibility.reason);
    }

    GuestIndex guests(problem.guests);
    problem_ = &problem;
    guests_ = &guests;
    encoded_ = encodeGuests(guests);
    batch_.clear();
    batchesEvaluated_ = 0;

    current_ = buildStartingPlan(problem, guests);
    currentMetrics_ = calculateAllMetrics(current_, guests, problem.weights);

    if (cfg.verbose) {
        std::ostringstream ss;
        ss << "[OpenCLLocalSearchOptimizer] batch size " << batchSize_
           << ", initial score " << formatScore(currentMetrics_.weighted);
        logLine(std::cout, ss.str());
    }

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
        ss << "[OpenCLLocalSearchOptimizer] " << toString(state) << " after " << iterations
           << " iterations, " << batchesEvaluated_ << " device batches, score "
           << formatScore(currentMetrics_.weighted);
        logLine(std::cout, ss.str());
    }

    OptimizationResult result = finalizeResult(problem, guests, std::move(current_), iterations, state);

    problem_ = nullptr;
    guests_ = nullptr;
    current_ = SeatingPlan{};
    batch_.clear();
    return result;
}

bool OpenCLLocalSearchOptimizer::offer(const Move& move) {
    SeatingPlan candidate = applyMove(current_, move);
    if (!validateConstraints(candidate, problem_->constraints, *guests_).valid) return false;

    batch_.push_back(std::move(candidate));
    if ((int)batch_.size() < batchSize_) return false;
    return flushBatch();
}

bool OpenCLLocalSearchOptimizer::flushBatch() {
    if (batch_.empty()) return false;

    const OptimizerConfig& cfg = problem_->config;
    std::vector<int> grid;
    grid.reserve(batch_.size() * (size_t)cfg.tableCount * cfg.seatsPerTable);
    for (const SeatingPlan& plan : batch_) {
        appendPlanGrid(plan, *guests_, cfg.tableCount, cfg.seatsPerTable, grid);
    }

    std::vector<PlanMetrics> deviceMetrics;
    clctx_.evaluateBatch(encoded_, grid, (int)batch_.size(), cfg.tableCount, cfg.seatsPerTable,
                         problem_->weights, deviceMetrics);
    batchesEvaluated_++;

    // First candidate in traversal order that the CPU confirms.
    for (size_t i = 0; i < batch_.size(); ++i) {
        if (deviceMetrics[i].weighted <= currentMetrics_.weighted - DEVICE_SCORE_TOLERANCE) continue;

        PlanMetrics confirmed = calculateAllMetrics(batch_[i], *guests_, problem_->weights);
        if (confirmed.weighted <= currentMetrics_.weighted) continue;

        current_ = std::move(batch_[i]);
        currentMetrics_ = confirmed;
        batch_.clear();
        return true;
    }

    batch_.clear();
    return false;
}

bool OpenCLLocalSearchOptimizer::improveOnce() {
    auto visit = [this](const Move& move) { return offer(move); };

    SeatingPlan snapshot = current_;
    if (visitSwaps(snapshot, visit) || flushBatch()) return true;
    if (visitRelocations(snapshot, problem_->config.seatsPerTable, visit) || flushBatch()) return true;
    return false;
}
