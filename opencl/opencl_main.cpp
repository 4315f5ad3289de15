///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "cli_options.hpp"
#include "demo_instances.hpp"
#include "formatting.hpp"
#include "opencl_optimizer.hpp"
#include <chrono>
#include <exception>
#include <iostream>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the OpenCL-backed seating optimizer.
 *
 * Builds a demo event, runs the local search with batched device scoring
 * and prints the resulting plan.
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

        std::cout << "========================================\n";
        std::cout << "OPENCL SEATING OPTIMIZER\n";
        std::cout << "Demo: " << toString(opts.demo) << ", guests: " << problem.guests.size() << "\n";
        std::cout << "Device batch size: " << opts.batchSize << "\n";
        std::cout << "========================================\n";

        OpenCLLocalSearchOptimizer optimizer(opts.batchSize);

        auto start = std::chrono::high_resolution_clock::now();
        OptimizationResult result = optimizer.optimize(problem);
        auto end = std::chrono::high_resolution_clock::now();
        double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "OpenCL optimizer time: " << elapsedMs << " ms, "
                  << optimizer.batchesEvaluated() << " device batches\n\n";
        printSeatingPlan(problem, result);
        std::cout << "========================================\n";
        return result.feasible ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
