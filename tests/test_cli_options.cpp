///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cli_options.hpp"
#include "demo_instances.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static CliOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "seating");
    return parseCliOptions((int)args.size(), args.data());
}

static std::string parseError(std::vector<const char*> args) {
    try {
        parse(std::move(args));
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}


///////////////////////////
///       PARSING       ///
///////////////////////////
TEST(CliOptions, DefaultsWithoutArguments) {
    CliOptions o = parse({});
    EXPECT_EQ(o.demo, DemoSize::S);
    EXPECT_FALSE(o.tables.has_value());
    EXPECT_FALSE(o.seed.has_value());
    EXPECT_FALSE(o.weights.has_value());
    EXPECT_FALSE(o.verbose);
    EXPECT_FALSE(o.help);
    EXPECT_EQ(o.starts, 4);
    EXPECT_EQ(o.threads, 4);
    EXPECT_EQ(o.batchSize, 256);
}

TEST(CliOptions, ParsesEveryFlag) {
    CliOptions o = parse({"--demo", "xl", "--tables", "12", "--seats", "6", "--max-iterations", "50",
                          "--seed", "7", "--weights", "1,2,3,4", "--verbose", "--starts", "8",
                          "--threads", "2", "--batch-size", "64", "--help"});
    EXPECT_EQ(o.demo, DemoSize::XL);
    EXPECT_EQ(o.tables.value(), 12);
    EXPECT_EQ(o.seats.value(), 6);
    EXPECT_EQ(o.maxIterations.value(), 50);
    EXPECT_EQ(o.seed.value(), 7u);
    ASSERT_TRUE(o.weights.has_value());
    EXPECT_EQ(o.weights->novelty, 1.0);
    EXPECT_EQ(o.weights->transaction, 4.0);
    EXPECT_TRUE(o.verbose);
    EXPECT_EQ(o.starts, 8);
    EXPECT_EQ(o.threads, 2);
    EXPECT_EQ(o.batchSize, 64);
    EXPECT_TRUE(o.help);
}

TEST(CliOptions, ReportsMalformedArguments) {
    EXPECT_EQ(parseError({"--bogus"}), "unknown argument: --bogus");
    EXPECT_EQ(parseError({"--tables"}), "missing value for --tables");
    EXPECT_EQ(parseError({"--tables", "12x"}), "invalid value for --tables: '12x'");
    EXPECT_EQ(parseError({"--tables", "101"}), "--tables must be in [1,100], got 101");
    EXPECT_EQ(parseError({"--seats", "1"}), "--seats must be in [2,20], got 1");
    EXPECT_EQ(parseError({"--weights", "1,2,3"}),
              "--weights expects four comma-separated numbers: novelty,diversity,balance,transaction");
    EXPECT_EQ(parseError({"--weights", "1,-2,3,4"}), "--weights values must be non-negative, got '-2'");
    EXPECT_THROW(parse({"--demo", "huge"}), std::runtime_error);
}


///////////////////////////
///      APPLYING       ///
///////////////////////////
TEST(CliOptions, OverridesAndNormalizesProblem) {
    SeatingProblem problem = makeDemoProblem(DemoSize::S);
    int defaultSeats = problem.config.seatsPerTable;
    applyCliOptions(parse({"--tables", "4", "--seed", "9", "--weights", "2,0,0,2", "--verbose"}), problem);

    EXPECT_EQ(problem.config.tableCount, 4);
    EXPECT_EQ(problem.config.seatsPerTable, defaultSeats);
    EXPECT_EQ(problem.config.seed, 9u);
    EXPECT_TRUE(problem.config.verbose);
    EXPECT_DOUBLE_EQ(problem.weights.novelty, 0.5);
    EXPECT_DOUBLE_EQ(problem.weights.diversity, 0.0);
    EXPECT_DOUBLE_EQ(problem.weights.transaction, 0.5);
}

TEST(DemoInstances, SizeNamesAreCaseInsensitive) {
    EXPECT_EQ(parseDemoSize("xs"), DemoSize::XS);
    EXPECT_EQ(parseDemoSize("M"), DemoSize::M);
    EXPECT_EQ(parseDemoSize("Xl"), DemoSize::XL);
    EXPECT_EQ(toString(DemoSize::L), "L");
    EXPECT_THROW(parseDemoSize("XXL"), std::runtime_error);
}

TEST(DemoInstances, GeneratedEventsFitTheirTables) {
    for (DemoSize size : {DemoSize::XS, DemoSize::S, DemoSize::M, DemoSize::L, DemoSize::XL}) {
        SeatingProblem p = makeDemoProblem(size);
        EXPECT_LE((int)p.guests.size(), p.config.tableCount * p.config.seatsPerTable) << toString(size);
    }
}
