#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "guest_index.hpp"
#include <vector>


///////////////////////////
///      ENCODING       ///
///////////////////////////
/**
 * @brief Dense integer view of the guests of a run, as uploaded to the device.
 *
 * Strings are replaced by codes assigned in order of first appearance; -1
 * stands for an absent company, department or seniority. Connections are
 * stored symmetrically in CSR layout: the neighbours of guest i are
 * connections[connectionOffsets[i] .. connectionOffsets[i + 1]).
 */
struct EncodedGuests {
    std::vector<int> company;
    std::vector<int> department;
    std::vector<int> seniority;
    std::vector<int> type;
    std::vector<int> connectionOffsets; ///< size: guests + 1
    std::vector<int> connections;
};

/**
 * @brief Encode every guest of the index; unknown connection ids are dropped.
 */
EncodedGuests encodeGuests(const GuestIndex& guests);

/**
 * @brief Append one plan as a tableCount × seatsPerTable grid of guest positions.
 *
 * Seat s of table t lands at offset t * seatsPerTable + s; unused seats and
 * missing tables are filled with -1.
 *
 * @throws std::invalid_argument if the plan has more tables or a table more
 *         guests than the grid holds.
 */
void appendPlanGrid(const SeatingPlan& plan,
                    const GuestIndex& guests,
                    int tableCount,
                    int seatsPerTable,
                    std::vector<int>& grid);
