///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_optimizer.hpp"
#include "../sequential/sequential_optimizer.hpp"
#include "constraints.hpp"
#include "scoring.hpp"
#include "logging.hpp"
#include <algorithm>
#include <future>
#include <sstream>
#include <stdexcept>
#include <vector>


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
ThreadedMultiStartOptimizer::ThreadedMultiStartOptimizer(int numStarts, int numThreads)
        : numStarts_(numStarts),
          numThreads_(numThreads) {
    if (numStarts_ < 1) throw std::invalid_argument("Number of starts must be at least 1");
    if (numThreads_ < 1) throw std::invalid_argument("Number of threads must be at least 1");
}

OptimizationResult ThreadedMultiStartOptimizer::optimize(const SeatingProblem& problem) {
    validateProblem(problem);
    const OptimizerConfig& cfg = problem.config;

    // Every start would fail the same static check.
    FeasibilityResult feasibility = checkFeasibility((int)problem.guests.size(), problem.constraints,
                                                     cfg.tableCount, cfg.seatsPerTable);
    if (!feasibility.feasible) {
        bestStart_ = -1;
        return makeInfeasibleResult(feasibility.reason);
    }

    // Reset shared state before starting a new run.
    problem_ = &problem;
    best_ = OptimizationResult{};
    bestStart_ = -1;
    nextStart_ = 0;

    int workers = std::min(numThreads_, numStarts_);
    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        tasks.push_back(std::async(std::launch::async, [this]() { this->worker(); }));
    }
    // get() rethrows anything a worker threw.
    for (auto& t : tasks) t.get();

    if (cfg.verbose) {
        std::ostringstream ss;
        ss << "[ThreadedMultiStartOptimizer] best start " << bestStart_ << " (seed "
           << cfg.seed + (std::uint32_t)bestStart_ << "), score " << formatScore(best_.metrics.weighted)
           << (best_.feasible ? "" : ", infeasible");
        logLine(std::cout, ss.str());
    }

    problem_ = nullptr;
    return std::move(best_);
}

void ThreadedMultiStartOptimizer::worker() {
    SequentialLocalSearchOptimizer local;
    for (int start = nextStart_++; start < numStarts_; start = nextStart_++) {
        SeatingProblem seeded = *problem_;
        seeded.config.seed = problem_->config.seed + (std::uint32_t)start;
        publish(start, local.optimize(seeded));
    }
}

void ThreadedMultiStartOptimizer::publish(int start, OptimizationResult&& result) {
    std::lock_guard<std::mutex> lock(bestMutex_);
    bool better = bestStart_ < 0 ||
                  isBetterResult(result, best_) ||
                  (!isBetterResult(best_, result) && start < bestStart_);
    if (better) {
        best_ = std::move(result);
        bestStart_ = start;
    }
}
