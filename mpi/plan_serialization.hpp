#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "guest_index.hpp"
#include <vector>


///////////////////////////
///    SERIALIZATION    ///
///////////////////////////
/**
 * @brief A finished search reduced to what is needed to rebuild its result.
 */
struct PlanMessage {
    SeatingPlan plan;
    int iterations = 0;
    OptimizerState finalState = OptimizerState::CONVERGED;
};

/**
 * @brief Serialize a plan into a flat integer buffer for MPI transfer.
 *
 * Layout: iterations, finalState, tableCount, then for every table its guest
 * count followed by the guests' positions in the guest vector. Table labels
 * are not sent; they are recomputed from the table index.
 *
 * @param message Plan and search outcome to encode.
 * @param guests  Id lookup over the guests of the run (same on every rank).
 * @param buffer  Output flat buffer; cleared and filled by this function.
 */
void serializePlan(const PlanMessage& message, const GuestIndex& guests, std::vector<int>& buffer);

/**
 * @brief Rebuild a plan from a buffer produced by serializePlan().
 *
 * @throws std::runtime_error if the buffer is truncated or references a
 *         guest position outside the guest vector.
 */
PlanMessage deserializePlan(const std::vector<int>& buffer, const GuestIndex& guests);
