#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Sizes of the built-in demo events.
 *
 * XS: 4 guests, 2 tables of 2 (one buyer/seller pair per table is optimal).
 * S:  12 hand-written guests, 3 tables of 5, one constraint of every kind.
 * M:  40 generated guests, 6 tables of 8.
 * L:  120 generated guests, 15 tables of 10.
 * XL: 400 generated guests, 50 tables of 10.
 */
enum class DemoSize { XS, S, M, L, XL };

/**
 * @brief Build a deterministic demo problem with default weights and config.
 */
SeatingProblem makeDemoProblem(DemoSize size);

/**
 * @brief Parse "XS", "S", "M", "L" or "XL" (case-insensitive).
 *
 * @throws std::runtime_error for any other name.
 */
DemoSize parseDemoSize(const std::string& name);

std::string toString(DemoSize size);
