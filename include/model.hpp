#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <cstdint>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief Ordered seniority levels a guest may declare.
 */
enum class Seniority { JUNIOR, MID, SENIOR, EXECUTIVE };

/// Number of distinct seniority levels (used for the ideal even share).
static constexpr int SENIORITY_LEVELS = 4;

/**
 * @brief Categorical role of a guest at a business event.
 */
enum class GuestType { BUYER, SELLER, NEUTRAL, CATALYST };

/**
 * @brief A single event attendee.
 *
 * Optional text fields use the empty string for "absent". Known connections
 * are interpreted bidirectionally: a pair is connected if either side lists
 * the other.
 */
struct Guest {
    std::string id; ///< Opaque identifier, unique within an event.
    std::string name; ///< Display name.
    std::string company; ///< Employer (empty if unknown).
    std::string department; ///< Department or team (empty if unknown).
    std::string jobTitle; ///< Job title (informational only).
    std::optional<Seniority> seniority; ///< Seniority level, if declared.
    GuestType type = GuestType::NEUTRAL; ///< Role used by the transaction objective.
    std::vector<std::string> tags; ///< Free-form tags (informational only).
    std::vector<std::string> knownConnections; ///< Ids of guests this person already knows.
};

/**
 * @brief Kinds of placement rules understood by the engine.
 */
enum class ConstraintType {
    MUST_SIT_TOGETHER,
    MUST_NOT_SIT_TOGETHER,
    MAX_SELLERS_PER_TABLE,
    MIN_BUYERS_PER_TABLE
};

/**
 * @brief A placement rule over a set of guests or over every table.
 *
 * MAX_SELLERS_PER_TABLE and MIN_BUYERS_PER_TABLE are evaluated against every
 * table; their guestIds are carried but not consulted.
 */
struct Constraint {
    std::string id; ///< Constraint identifier.
    ConstraintType type; ///< Rule kind.
    std::vector<std::string> guestIds; ///< Guests the rule refers to.
    std::optional<int> value; ///< Threshold for numeric kinds (defaults: 2 sellers, 1 buyer).
    int priority = 1; ///< Advisory metadata; no logic depends on it.
};

/// Default threshold for MAX_SELLERS_PER_TABLE.
static constexpr int DEFAULT_MAX_SELLERS = 2;

/// Default threshold for MIN_BUYERS_PER_TABLE.
static constexpr int DEFAULT_MIN_BUYERS = 1;

/**
 * @brief Relative importance of the four soft objectives.
 *
 * Consumed as given by the scoring engine; see normalizeWeights() for the
 * separate normalization utility.
 */
struct ObjectiveWeights {
    double novelty = 0.25; ///< Objective A: new professional connections.
    double diversity = 0.25; ///< Objective B: cross-company / cross-department mixing.
    double balance = 0.25; ///< Objective C: balanced conversations.
    double transaction = 0.25; ///< Objective D: buyer/seller opportunities.
};

/**
 * @brief One table of the seating plan.
 */
struct Table {
    std::string tableId; ///< Stable label ("table_1", "table_2", ...).
    std::vector<std::string> guestIds; ///< Guests seated at this table, in seat order.
};

/**
 * @brief Complete table-by-table assignment for one run.
 *
 * A guest id appears in at most one table.
 */
struct SeatingPlan {
    std::vector<Table> tables;
};

/**
 * @brief Objective scores of a plan, each in [0, 1], plus the weighted sum.
 */
struct PlanMetrics {
    double novelty = 0.0;
    double diversity = 0.0;
    double balance = 0.0;
    double transaction = 0.0;
    double weighted = 0.0; ///< Dot product of the four scores with the weights.
};

/**
 * @brief Soft objectives a reason code may be attributed to.
 */
enum class Objective { NOVELTY, DIVERSITY, BALANCE, TRANSACTION };

/**
 * @brief Effect of a reason code on plan quality.
 */
enum class Impact { POSITIVE, NEGATIVE, NEUTRAL };

/**
 * @brief Structured, attributable explanation unit.
 */
struct ReasonCode {
    std::string code; ///< Tag, e.g. "BUYER_SELLER_MIX".
    std::string tableId; ///< Table the reason concerns.
    std::vector<std::string> guestIds; ///< Guests the reason concerns.
    std::string description; ///< Short static-template description.
    Impact impact = Impact::NEUTRAL;
    std::optional<Objective> objective; ///< Objective the reason speaks to, if any.
};

/**
 * @brief Explanation lines for a single table.
 */
struct TableExplanation {
    std::string tableId;
    std::vector<std::string> lines;
};

/**
 * @brief Explanations for a finished plan.
 */
struct PlanExplanations {
    std::vector<TableExplanation> perTable; ///< One entry per non-empty table, in table order.
    std::string overall; ///< One-paragraph summary.
    std::vector<ReasonCode> reasonCodes; ///< Raw codes for downstream text generation.
};

/**
 * @brief States of the local search state machine.
 */
enum class OptimizerState {
    INITIALIZING,
    SEARCHING,
    CONVERGED,
    ITERATION_LIMIT_REACHED,
    INFEASIBLE_TERMINATED
};

/**
 * @brief Terminal output bundle of one optimization run.
 */
struct OptimizationResult {
    SeatingPlan plan; ///< Final plan (empty when infeasible).
    PlanMetrics metrics; ///< Metrics of the final plan.
    PlanExplanations explanations; ///< Reason codes and summaries.
    std::vector<std::string> warnings; ///< Free-text advisories.
    bool feasible = false; ///< True iff the final plan satisfies every constraint.
    int iterations = 0; ///< Local search iterations consumed.
    OptimizerState finalState = OptimizerState::INITIALIZING; ///< Terminal search state.
};

/// Default run parameters.
static constexpr int DEFAULT_TABLE_COUNT = 10;
static constexpr int DEFAULT_SEATS_PER_TABLE = 8;
static constexpr int DEFAULT_MAX_ITERATIONS = 1000;
static constexpr std::uint32_t DEFAULT_SEED = 42;

/**
 * @brief Table geometry and search budget for one run.
 */
struct OptimizerConfig {
    int tableCount = DEFAULT_TABLE_COUNT; ///< Number of tables.
    int seatsPerTable = DEFAULT_SEATS_PER_TABLE; ///< Capacity of every table.
    int maxIterations = DEFAULT_MAX_ITERATIONS; ///< Local search iteration budget.
    std::uint32_t seed = DEFAULT_SEED; ///< Seed of the shuffle used by the builder.
    bool verbose = false; ///< Log progress lines to stdout.
};

/**
 * @brief Complete problem instance handed to an optimizer.
 *
 * Bundles the caller-supplied, already-normalized guest and constraint
 * records with the objective weights and run configuration.
 */
struct SeatingProblem {
    std::vector<Guest> guests; ///< All guests to seat.
    std::vector<Constraint> constraints; ///< Placement rules.
    ObjectiveWeights weights; ///< Soft objective weights.
    OptimizerConfig config; ///< Geometry and search budget.
};


///////////////////////////
///       NAMING        ///
///////////////////////////
std::string toString(Seniority s);
std::string toString(GuestType t);
std::string toString(ConstraintType t);
std::string toString(Objective o);
std::string toString(Impact i);
std::string toString(OptimizerState s);

/**
 * @brief Stable label of the table at a 0-based index ("table_<index+1>").
 */
std::string tableLabel(int index);
