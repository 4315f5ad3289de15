///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/sequential_optimizer.hpp"
#include "model.hpp"
#include "cli_options.hpp"
#include "demo_instances.hpp"
#include "formatting.hpp"
#include <chrono>
#include <exception>
#include <iostream>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the sequential seating optimizer.
 *
 * Builds a demo event, applies command-line overrides, runs the single-threaded
 * local search, measures its runtime and prints the resulting seating plan.
 */
int main(int argc, char** argv) {
    try {
        CliOptions opts = parseCliOptions(argc, argv);
        if (opts.help) {
            std::cout << cliUsage(argv[0]);
            return 0;
        }

        SeatingProblem problem = makeDemoProblem(opts.demo);
        applyCliOptions(opts, problem);

        SequentialLocalSearchOptimizer optimizer;

        // Measure wall-clock time of the search.
        auto start = std::chrono::high_resolution_clock::now();
        OptimizationResult result = optimizer.optimize(problem);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "========================================\n";
        std::cout << "SEQUENTIAL SEATING OPTIMIZER\n";
        std::cout << "Demo: " << toString(opts.demo) << "\n";
        std::cout << "Guests: " << problem.guests.size() << ", tables: " << problem.config.tableCount
                  << " x " << problem.config.seatsPerTable << " seats\n";
        std::cout << "Time: " << ms << " ms\n";
        std::cout << "========================================\n";

        printSeatingPlan(problem, result);
        std::cout << "========================================\n";
        return result.feasible ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
