///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "mpi_optimizer.hpp"
#include "cli_options.hpp"
#include "demo_instances.hpp"
#include "formatting.hpp"
#include <mpi.h>
#include <exception>
#include <iostream>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the hybrid MPI + threads seating optimizer.
 *
 * Initializes MPI, builds the same demo event on each rank, runs the
 * MPIMultiStartOptimizer and finalizes MPI. Rank 0 prints the run header and
 * the best plan found across all ranks.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    int status = 0;
    try {
        CliOptions opts = parseCliOptions(argc, argv);
        if (opts.help) {
            if (rank == 0) std::cout << cliUsage(argv[0]);
            MPI_Finalize();
            return 0;
        }

        SeatingProblem problem = makeDemoProblem(opts.demo);
        applyCliOptions(opts, problem);

        if (rank == 0) {
            std::cout << "========================================\n";
            std::cout << "MPI+THREADS SEATING OPTIMIZER (MULTI-START)\n";
            std::cout << "Processes: " << size << "\n";
            std::cout << "Demo: " << toString(opts.demo) << ", guests: " << problem.guests.size() << "\n";
            std::cout << "Starts per rank: " << opts.starts << ", threads per rank: " << opts.threads << "\n";
            std::cout << "========================================\n";
        }

        MPIMultiStartOptimizer optimizer(opts.starts, opts.threads);

        double start = MPI_Wtime();
        std::optional<OptimizationResult> result = optimizer.optimize(problem);
        double elapsedMs = (MPI_Wtime() - start) * 1000.0;

        if (rank == 0 && result) {
            std::cout << "Best plan from rank " << optimizer.winnerRank() << "\n";
            std::cout << "Time: " << elapsedMs << " ms\n\n";
            printSeatingPlan(problem, *result);
            std::cout << "========================================\n";
            status = result->feasible ? 0 : 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "rank " << rank << " error: " << e.what() << "\n";
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    MPI_Finalize();
    return status;
}
