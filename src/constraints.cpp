///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// guestId -> index of the table seating that guest.
using SeatMap = std::unordered_map<std::string, int>;

static SeatMap buildSeatMap(const SeatingPlan& plan) {
    SeatMap seats;
    for (int t = 0; t < (int)plan.tables.size(); ++t) {
        for (const std::string& gid : plan.tables[t].guestIds) {
            seats[gid] = t;
        }
    }
    return seats;
}

/**
 * @brief Check that every seated member of a group occupies one table.
 */
static void checkMustSitTogether(const Constraint& c,
                                 const SeatingPlan& plan,
                                 const SeatMap& seats,
                                 std::vector<ConstraintViolation>& out) {
    std::vector<int> tables;
    for (const std::string& gid : c.guestIds) {
        auto it = seats.find(gid);
        if (it == seats.end()) continue;
        if (std::find(tables.begin(), tables.end(), it->second) == tables.end()) {
            tables.push_back(it->second);
        }
    }
    if (tables.size() <= 1) return;

    std::ostringstream msg;
    msg << "Guests must sit together but are at " << tables.size() << " different tables (";
    for (size_t i = 0; i < tables.size(); ++i) {
        if (i > 0) msg << ", ";
        msg << plan.tables[tables[i]].tableId;
    }
    msg << ")";

    out.push_back({c.id, c.type, msg.str(), "", c.guestIds});
}

/**
 * @brief Check that no table seats more than one member of a group.
 *
 * Tables are inspected in the order their first member appears in the
 * constraint; in FIRST_MATCH mode only the first offending table is reported.
 */
static void checkMustNotSitTogether(const Constraint& c,
                                    const SeatingPlan& plan,
                                    const SeatMap& seats,
                                    ValidationMode mode,
                                    std::vector<ConstraintViolation>& out) {
    std::vector<std::pair<int, std::vector<std::string>>> byTable;
    for (const std::string& gid : c.guestIds) {
        auto it = seats.find(gid);
        if (it == seats.end()) continue;
        auto slot = std::find_if(byTable.begin(), byTable.end(),
                                 [&](const std::pair<int, std::vector<std::string>>& e) {
                                     return e.first == it->second;
                                 });
        if (slot == byTable.end()) {
            byTable.push_back({it->second, {gid}});
        } else {
            slot->second.push_back(gid);
        }
    }

    for (const auto& entry : byTable) {
        if (entry.second.size() <= 1) continue;
        std::ostringstream msg;
        msg << "Guests must not sit together but " << entry.second.size()
            << " are at the same table";
        out.push_back({c.id, c.type, msg.str(), plan.tables[entry.first].tableId, entry.second});
        if (mode == ValidationMode::FIRST_MATCH) return;
    }
}

/**
 * @brief Ids of the guests at a table whose type matches.
 */
static std::vector<std::string> guestsOfType(const Table& table, const GuestIndex& guests, GuestType type) {
    std::vector<std::string> ids;
    for (const std::string& gid : table.guestIds) {
        const Guest* g = guests.find(gid);
        if (g && g->type == type) ids.push_back(gid);
    }
    return ids;
}

static void checkMaxSellersPerTable(const Constraint& c,
                                    const SeatingPlan& plan,
                                    const GuestIndex& guests,
                                    std::vector<ConstraintViolation>& out) {
    int maxSellers = c.value.value_or(DEFAULT_MAX_SELLERS);
    for (const Table& table : plan.tables) {
        std::vector<std::string> sellers = guestsOfType(table, guests, GuestType::SELLER);
        if ((int)sellers.size() <= maxSellers) continue;
        std::ostringstream msg;
        msg << "Table has " << sellers.size() << " sellers, max allowed is " << maxSellers;
        out.push_back({c.id, c.type, msg.str(), table.tableId, std::move(sellers)});
    }
}

static void checkMinBuyersPerTable(const Constraint& c,
                                   const SeatingPlan& plan,
                                   const GuestIndex& guests,
                                   std::vector<ConstraintViolation>& out) {
    int minBuyers = c.value.value_or(DEFAULT_MIN_BUYERS);
    for (const Table& table : plan.tables) {
        // Empty tables are exempt.
        if (table.guestIds.empty()) continue;
        std::vector<std::string> buyers = guestsOfType(table, guests, GuestType::BUYER);
        if ((int)buyers.size() >= minBuyers) continue;
        std::ostringstream msg;
        msg << "Table has " << buyers.size() << " buyers, minimum required is " << minBuyers;
        out.push_back({c.id, c.type, msg.str(), table.tableId, std::move(buyers)});
    }
}


///////////////////////////
///     FEASIBILITY     ///
///////////////////////////
FeasibilityResult checkFeasibility(int guestCount,
                                   const std::vector<Constraint>& constraints,
                                   int tableCount,
                                   int seatsPerTable) {
    FeasibilityResult result;

    long long totalSeats = (long long)tableCount * seatsPerTable;
    if (guestCount > totalSeats) {
        std::ostringstream ss;
        ss << "Not enough seats: " << guestCount << " guests but only " << totalSeats << " seats";
        result.feasible = false;
        result.reason = ss.str();
        return result;
    }

    for (const Constraint& c : constraints) {
        if (c.type != ConstraintType::MUST_SIT_TOGETHER) continue;
        if ((int)c.guestIds.size() > seatsPerTable) {
            std::ostringstream ss;
            ss << "MUST_SIT_TOGETHER constraint has " << c.guestIds.size()
               << " guests but tables only have " << seatsPerTable << " seats";
            result.feasible = false;
            result.reason = ss.str();
            return result;
        }
    }

    return result;
}


///////////////////////////
///     VALIDATION      ///
///////////////////////////
ValidationResult validateConstraints(const SeatingPlan& plan,
                                     const std::vector<Constraint>& constraints,
                                     const GuestIndex& guests,
                                     ValidationMode mode) {
    ValidationResult result;
    SeatMap seats = buildSeatMap(plan);

    for (const Constraint& c : constraints) {
        switch (c.type) {
            case ConstraintType::MUST_SIT_TOGETHER:
                checkMustSitTogether(c, plan, seats, result.violations);
                break;
            case ConstraintType::MUST_NOT_SIT_TOGETHER:
                checkMustNotSitTogether(c, plan, seats, mode, result.violations);
                break;
            case ConstraintType::MAX_SELLERS_PER_TABLE:
                checkMaxSellersPerTable(c, plan, guests, result.violations);
                break;
            case ConstraintType::MIN_BUYERS_PER_TABLE:
                checkMinBuyersPerTable(c, plan, guests, result.violations);
                break;
        }
    }

    result.valid = result.violations.empty();
    return result;
}

ValidationResult validateConstraints(const SeatingPlan& plan,
                                     const std::vector<Constraint>& constraints,
                                     const std::vector<Guest>& guests,
                                     ValidationMode mode) {
    GuestIndex index(guests);
    return validateConstraints(plan, constraints, index, mode);
}
