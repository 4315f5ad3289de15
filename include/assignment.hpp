#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>


///////////////////////////
///       RANDOM        ///
///////////////////////////
/**
 * @brief Deterministic random source keyed by an explicit integer seed.
 *
 * Every optimization call owns its own instance; two instances built from
 * the same seed produce the same sequence.
 */
class SeededRandom {
public:
    explicit SeededRandom(std::uint32_t seed) : engine_(seed) {}

    /**
     * @brief Uniform integer in [0, bound].
     */
    std::size_t upTo(std::size_t bound);

    /**
     * @brief Unbiased in-place Fisher-Yates shuffle.
     */
    template <typename T>
    void shuffle(std::vector<T>& items) {
        for (std::size_t i = items.size(); i > 1; --i) {
            std::size_t j = upTo(i - 1);
            std::swap(items[i - 1], items[j]);
        }
    }

private:
    std::mt19937 engine_;
};


///////////////////////////
///       BUILDER       ///
///////////////////////////
/**
 * @brief Build the initial plan by constrained greedy placement.
 *
 * Steps:
 *  1. create tableCount empty tables labelled table_1..table_N,
 *  2. seat MUST_SIT_TOGETHER groups (input order) at the first table with
 *     room for the whole group; groups without such a table are skipped,
 *  3. shuffle the remaining guests with the seeded random source,
 *  4. round-robin over tables, accepting the first table with a free seat
 *     and no MUST_NOT_SIT_TOGETHER partner of the guest,
 *  5. otherwise force the guest into the first table with a free seat.
 * A guest is left unseated only if every table is full.
 *
 * @param guests        Guests to seat.
 * @param constraints   Placement rules.
 * @param tableCount    Number of tables.
 * @param seatsPerTable Capacity of every table.
 * @param rng           Seeded random source (advanced by the shuffle).
 */
SeatingPlan buildInitialAssignment(const std::vector<Guest>& guests,
                                   const std::vector<Constraint>& constraints,
                                   int tableCount,
                                   int seatsPerTable,
                                   SeededRandom& rng);

/**
 * @brief Reduce MUST_NOT_SIT_TOGETHER violations of a plan.
 *
 * For each such constraint and each table seating more than one member,
 * relocates the excess members (last first) to the first other table with a
 * free seat and no member of the same constraint. Members without such a
 * table stay where they are. MUST_SIT_TOGETHER groups are not reconsidered.
 *
 * @return A repaired copy of the plan; the input is not modified.
 */
SeatingPlan repairAssignment(const SeatingPlan& plan,
                             const std::vector<Constraint>& constraints,
                             int seatsPerTable);
