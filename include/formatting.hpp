#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <iosfwd>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Print a finished plan: one small table per seating table, then the
 * metrics, per-table explanations, overall summary and warnings.
 */
void printSeatingPlan(const SeatingProblem& problem, const OptimizationResult& result, std::ostream& os);

/**
 * @brief Print the plan to stdout.
 */
void printSeatingPlan(const SeatingProblem& problem, const OptimizationResult& result);
