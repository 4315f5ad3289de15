///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_optimizer.hpp"
#include "plan_serialization.hpp"
#include "constraints.hpp"
#include "scoring.hpp"
#include "logging.hpp"
#include <mpi.h>
#include <limits>
#include <sstream>
#include <vector>


///////////////////////////
///     OPTIMIZER       ///
///////////////////////////
MPIMultiStartOptimizer::MPIMultiStartOptimizer(int startsPerRank, int numThreads)
        : startsPerRank_(startsPerRank),
          numThreads_(numThreads) {}

std::optional<OptimizationResult> MPIMultiStartOptimizer::optimize(const SeatingProblem& problem) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    validateProblem(problem);
    const OptimizerConfig& cfg = problem.config;

    // Same input on every rank, so every rank reaches the same verdict.
    FeasibilityResult feasibility = checkFeasibility((int)problem.guests.size(), problem.constraints,
                                                     cfg.tableCount, cfg.seatsPerTable);
    if (!feasibility.feasible) {
        winnerRank_ = 0;
        if (rank != 0) return std::nullopt;
        return makeInfeasibleResult(feasibility.reason);
    }

    // Each rank searches its own block of seeds.
    SeatingProblem local = problem;
    local.config.seed = cfg.seed + (std::uint32_t)(rank * startsPerRank_);

    ThreadedMultiStartOptimizer threaded(startsPerRank_, numThreads_);
    OptimizationResult localBest = threaded.optimize(local);

    if (cfg.verbose) {
        std::ostringstream ss;
        ss << "[MPIMultiStartOptimizer] rank " << rank << " local best " << formatScore(localBest.metrics.weighted)
           << (localBest.feasible ? "" : " (infeasible)");
        logLine(std::cout, ss.str());
    }

    // FEASIBLE FIRST
    int localFeasible = localBest.feasible ? 1 : 0;
    int anyFeasible = 0;
    MPI_Allreduce(&localFeasible, &anyFeasible, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);

    // THEN HIGHEST SCORE
    bool candidate = localFeasible == anyFeasible;
    double localScore = candidate ? localBest.metrics.weighted : -std::numeric_limits<double>::infinity();
    double globalBestScore = 0.0;
    MPI_Allreduce(&localScore, &globalBestScore, 1, MPI_DOUBLE, MPI_MAX, MPI_COMM_WORLD);

    // THEN LOWEST RANK
    int myClaim = (candidate && localScore == globalBestScore) ? rank : size;
    int winner = size;
    MPI_Allreduce(&myClaim, &winner, 1, MPI_INT, MPI_MIN, MPI_COMM_WORLD);
    winnerRank_ = winner;

    const int TAG_META = 300;
    const int TAG_DATA = 301;

    // Case 1: winner is rank 0, no transfer needed.
    if (winner == 0) {
        if (rank != 0) return std::nullopt;
        return localBest;
    }

    // Case 2: winner is some non-root rank; send its plan to rank 0.
    GuestIndex guests(problem.guests);
    if (rank == winner) {
        std::vector<int> buf;
        serializePlan(PlanMessage{localBest.plan, localBest.iterations, localBest.finalState}, guests, buf);
        int len = (int)buf.size();

        MPI_Send(&len, 1, MPI_INT, 0, TAG_META, MPI_COMM_WORLD);
        if (len > 0) {
            MPI_Send(buf.data(), len, MPI_INT, 0, TAG_DATA, MPI_COMM_WORLD);
        }
        return std::nullopt;
    }
    if (rank != 0) return std::nullopt;

    int len = 0;
    MPI_Recv(&len, 1, MPI_INT, winner, TAG_META, MPI_COMM_WORLD, MPI_STATUS_IGNORE);

    std::vector<int> buf(len);
    if (len > 0) {
        MPI_Recv(buf.data(), len, MPI_INT, winner, TAG_DATA, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
    }

    PlanMessage message = deserializePlan(buf, guests);
    return finalizeResult(problem, guests, std::move(message.plan), message.iterations, message.finalState);
}
