///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../threads/threaded_optimizer.hpp"
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
 * @brief Demo entry point for the threaded multi-start seating optimizer.
 *
 * Runs --starts independent local searches (seeds seed, seed+1, ...) on
 * --threads worker threads and prints the best plan found.
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

        ThreadedMultiStartOptimizer optimizer(opts.starts, opts.threads);

        auto start = std::chrono::high_resolution_clock::now();
        OptimizationResult result = optimizer.optimize(problem);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "========================================\n";
        std::cout << "THREADED MULTI-START SEATING OPTIMIZER\n";
        std::cout << "Demo: " << toString(opts.demo) << "\n";
        std::cout << "Guests: " << problem.guests.size() << ", tables: " << problem.config.tableCount
                  << " x " << problem.config.seatsPerTable << " seats\n";
        std::cout << "Starts: " << opts.starts << ", threads: " << opts.threads << "\n";
        if (optimizer.bestStart() >= 0) {
            std::cout << "Best start: " << optimizer.bestStart() << "\n";
        }
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
