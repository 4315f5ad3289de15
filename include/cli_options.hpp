#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "demo_instances.hpp"
#include <cstdint>
#include <optional>
#include <string>


///////////////////////////
///       OPTIONS       ///
///////////////////////////
/// Geometry limits accepted on the command line.
static constexpr int MIN_TABLES = 1;
static constexpr int MAX_TABLES = 100;
static constexpr int MIN_SEATS_PER_TABLE = 2;
static constexpr int MAX_SEATS_PER_TABLE = 20;

/**
 * @brief Command-line options shared by every driver.
 *
 * Unset optionals keep the value the demo problem already carries.
 */
struct CliOptions {
    DemoSize demo = DemoSize::S; ///< --demo XS|S|M|L|XL
    std::optional<int> tables; ///< --tables N
    std::optional<int> seats; ///< --seats N
    std::optional<int> maxIterations; ///< --max-iterations N
    std::optional<std::uint32_t> seed; ///< --seed N
    std::optional<ObjectiveWeights> weights; ///< --weights novelty,diversity,balance,transaction
    bool verbose = false; ///< --verbose
    int starts = 4; ///< --starts N (multi-start drivers)
    int threads = 4; ///< --threads N (multi-start drivers)
    int batchSize = 256; ///< --batch-size N (OpenCL driver)
    bool help = false; ///< --help
};

/**
 * @brief Parse argv in the "--flag value" style.
 *
 * @throws std::runtime_error on an unknown flag, a missing or malformed
 *         value, or a value outside its allowed range.
 */
CliOptions parseCliOptions(int argc, const char* const* argv);

/**
 * @brief Overlay the options on a problem; weights are normalized to sum to 1.
 */
void applyCliOptions(const CliOptions& options, SeatingProblem& problem);

/**
 * @brief Usage text for a driver.
 */
std::string cliUsage(const std::string& program);
