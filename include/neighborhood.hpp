#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <functional>


///////////////////////////
///        MOVES        ///
///////////////////////////
/**
 * @brief Local search perturbation of a plan.
 *
 * SWAP exchanges the guest at (fromTable, fromSeat) with the guest at
 * (toTable, toSeat). RELOCATE removes the guest at (fromTable, fromSeat) and
 * appends it to toTable; toSeat is unused.
 */
struct Move {
    enum class Kind { SWAP, RELOCATE } kind;
    int fromTable;
    int fromSeat;
    int toTable;
    int toSeat;
};

/// Visitor over candidate moves; returning true stops the walk.
using MoveVisitor = std::function<bool(const Move&)>;

/**
 * @brief Visit every cross-table swap in search order.
 *
 * Table pairs (t1 < t2) in table-index order, then seats of t1, then seats
 * of t2. Moves are generated lazily; the neighborhood of a large event does
 * not fit comfortably in memory.
 *
 * @return true if the visitor stopped the walk early.
 */
bool visitSwaps(const SeatingPlan& plan, const MoveVisitor& visit);

/**
 * @brief Visit every single-guest relocation in search order.
 *
 * Source table t1, then destination table t2 != t1 with a free seat, then
 * seats of t1.
 *
 * @return true if the visitor stopped the walk early.
 */
bool visitRelocations(const SeatingPlan& plan, int seatsPerTable, const MoveVisitor& visit);

/**
 * @brief Apply a move to a fresh copy of the plan.
 *
 * The input plan is never modified, so a rejected trial leaves no residue.
 */
SeatingPlan applyMove(const SeatingPlan& plan, const Move& move);
