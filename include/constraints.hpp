#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "guest_index.hpp"
#include <string>
#include <vector>


///////////////////////////
///     FEASIBILITY     ///
///////////////////////////
/**
 * @brief Verdict of the static pre-flight check.
 */
struct FeasibilityResult {
    bool feasible = true; ///< False if no valid plan can exist.
    std::string reason; ///< Human-readable reason when infeasible, empty otherwise.
};

/**
 * @brief Static feasibility check run once before any assignment attempt.
 *
 * Checks, in order:
 *  - total guests fit in tableCount × seatsPerTable seats,
 *  - every MUST_SIT_TOGETHER group fits on a single table.
 * Other constraint kinds are enforced dynamically during assignment and search.
 *
 * @param guestCount    Number of guests to seat.
 * @param constraints   Placement rules of the event.
 * @param tableCount    Number of tables.
 * @param seatsPerTable Capacity of every table.
 */
FeasibilityResult checkFeasibility(int guestCount,
                                   const std::vector<Constraint>& constraints,
                                   int tableCount,
                                   int seatsPerTable);


///////////////////////////
///     VALIDATION      ///
///////////////////////////
/**
 * @brief One broken rule found in a plan.
 */
struct ConstraintViolation {
    std::string constraintId; ///< Id of the violated constraint.
    ConstraintType constraintType; ///< Kind of the violated constraint.
    std::string message; ///< Human-readable description.
    std::string tableId; ///< Offending table, empty when the violation spans tables.
    std::vector<std::string> guestIds; ///< Offending guests.
};

/**
 * @brief Outcome of validating a plan against every constraint.
 */
struct ValidationResult {
    bool valid = true;
    std::vector<ConstraintViolation> violations;
};

/**
 * @brief Reporting granularity for MUST_NOT_SIT_TOGETHER checks.
 *
 * FIRST_MATCH reports only the first offending table per constraint (the
 * behaviour relied on by the search); ALL reports every offending table.
 */
enum class ValidationMode { FIRST_MATCH, ALL };

/**
 * @brief Validate a plan against every constraint.
 *
 * Pure function: no mutation, no randomness. Constraint references to
 * unknown or unseated guest ids are ignored.
 *
 * @param plan        Candidate plan.
 * @param constraints Rules to check, in order.
 * @param guests      Id lookup over the guests of the run.
 * @param mode        Reporting granularity for MUST_NOT_SIT_TOGETHER.
 */
ValidationResult validateConstraints(const SeatingPlan& plan,
                                     const std::vector<Constraint>& constraints,
                                     const GuestIndex& guests,
                                     ValidationMode mode = ValidationMode::FIRST_MATCH);

/**
 * @brief Convenience overload that builds the guest lookup on the fly.
 */
ValidationResult validateConstraints(const SeatingPlan& plan,
                                     const std::vector<Constraint>& constraints,
                                     const std::vector<Guest>& guests,
                                     ValidationMode mode = ValidationMode::FIRST_MATCH);
