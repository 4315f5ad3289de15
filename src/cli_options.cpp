///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cli_options.hpp"
#include "scoring.hpp"
#include <sstream>
#include <stdexcept>
#include <vector>


///////////////////////////
///       PARSING       ///
///////////////////////////
static long long parseInteger(const std::string& flag, const std::string& text) {
    size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid value for " + flag + ": '" + text + "'");
    }
    if (pos != text.size()) {
        throw std::runtime_error("invalid value for " + flag + ": '" + text + "'");
    }
    return value;
}

static int parseIntInRange(const std::string& flag, const std::string& text, long long lo, long long hi) {
    long long value = parseInteger(flag, text);
    if (value < lo || value > hi) {
        std::ostringstream ss;
        ss << flag << " must be in [" << lo << "," << hi << "], got " << value;
        throw std::runtime_error(ss.str());
    }
    return (int)value;
}

static double parseDouble(const std::string& flag, const std::string& text) {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid value for " + flag + ": '" + text + "'");
    }
    if (pos != text.size()) {
        throw std::runtime_error("invalid value for " + flag + ": '" + text + "'");
    }
    return value;
}

static ObjectiveWeights parseWeights(const std::string& flag, const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        double v = parseDouble(flag, item);
        if (!(v >= 0.0)) {
            throw std::runtime_error(flag + " values must be non-negative, got '" + item + "'");
        }
        values.push_back(v);
    }
    if (values.size() != 4) {
        throw std::runtime_error(flag + " expects four comma-separated numbers: novelty,diversity,balance,transaction");
    }
    return ObjectiveWeights{values[0], values[1], values[2], values[3]};
}

CliOptions parseCliOptions(int argc, const char* const* argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](const char* flag) {
            if (i + 1 >= argc) {
                throw std::runtime_error(std::string("missing value for ") + flag);
            }
            return std::string(argv[++i]);
        };

        if (a == "--demo") {
            opts.demo = parseDemoSize(need("--demo"));
        } else if (a == "--tables") {
            opts.tables = parseIntInRange(a, need("--tables"), MIN_TABLES, MAX_TABLES);
        } else if (a == "--seats") {
            opts.seats = parseIntInRange(a, need("--seats"), MIN_SEATS_PER_TABLE, MAX_SEATS_PER_TABLE);
        } else if (a == "--max-iterations") {
            opts.maxIterations = parseIntInRange(a, need("--max-iterations"), 0, 1000000000);
        } else if (a == "--seed") {
            opts.seed = (std::uint32_t)parseIntInRange(a, need("--seed"), 0, 2147483647);
        } else if (a == "--weights") {
            opts.weights = parseWeights(a, need("--weights"));
        } else if (a == "--verbose") {
            opts.verbose = true;
        } else if (a == "--starts") {
            opts.starts = parseIntInRange(a, need("--starts"), 1, 100000);
        } else if (a == "--threads") {
            opts.threads = parseIntInRange(a, need("--threads"), 1, 1024);
        } else if (a == "--batch-size") {
            opts.batchSize = parseIntInRange(a, need("--batch-size"), 1, 1000000);
        } else if (a == "--help" || a == "-h") {
            opts.help = true;
        } else {
            throw std::runtime_error("unknown argument: " + a);
        }
    }
    return opts;
}

void applyCliOptions(const CliOptions& options, SeatingProblem& problem) {
    if (options.tables) problem.config.tableCount = *options.tables;
    if (options.seats) problem.config.seatsPerTable = *options.seats;
    if (options.maxIterations) problem.config.maxIterations = *options.maxIterations;
    if (options.seed) problem.config.seed = *options.seed;
    if (options.weights) problem.weights = *options.weights;
    problem.weights = normalizeWeights(problem.weights);
    problem.config.verbose = options.verbose;
}

std::string cliUsage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "  --demo XS|S|M|L|XL          demo event to seat (default S)\n"
       << "  --tables N                  table count override [" << MIN_TABLES << "," << MAX_TABLES << "]\n"
       << "  --seats N                   seats per table override [" << MIN_SEATS_PER_TABLE << ","
       << MAX_SEATS_PER_TABLE << "]\n"
       << "  --max-iterations N          local search budget (default " << DEFAULT_MAX_ITERATIONS << ")\n"
       << "  --seed N                    shuffle seed (default " << DEFAULT_SEED << ")\n"
       << "  --weights a,b,c,d           novelty,diversity,balance,transaction weights\n"
       << "  --starts N                  independent starts (multi-start drivers)\n"
       << "  --threads N                 worker threads (multi-start drivers)\n"
       << "  --batch-size N              candidates per device batch (OpenCL driver)\n"
       << "  --verbose                   log search progress\n";
    return ss.str();
}
