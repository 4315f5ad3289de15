///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "neighborhood.hpp"
#include <utility>


///////////////////////////
///        MOVES        ///
///////////////////////////
bool visitSwaps(const SeatingPlan& plan, const MoveVisitor& visit) {
    int numTables = (int)plan.tables.size();
    for (int t1 = 0; t1 < numTables; ++t1) {
        for (int t2 = t1 + 1; t2 < numTables; ++t2) {
            int n1 = (int)plan.tables[t1].guestIds.size();
            int n2 = (int)plan.tables[t2].guestIds.size();
            for (int g1 = 0; g1 < n1; ++g1) {
                for (int g2 = 0; g2 < n2; ++g2) {
                    if (visit(Move{Move::Kind::SWAP, t1, g1, t2, g2})) return true;
                }
            }
        }
    }
    return false;
}

bool visitRelocations(const SeatingPlan& plan, int seatsPerTable, const MoveVisitor& visit) {
    int numTables = (int)plan.tables.size();
    for (int t1 = 0; t1 < numTables; ++t1) {
        for (int t2 = 0; t2 < numTables; ++t2) {
            if (t1 == t2) continue;
            // Destination must have a free seat.
            if ((int)plan.tables[t2].guestIds.size() >= seatsPerTable) continue;
            int n1 = (int)plan.tables[t1].guestIds.size();
            for (int g = 0; g < n1; ++g) {
                if (visit(Move{Move::Kind::RELOCATE, t1, g, t2, -1})) return true;
            }
        }
    }
    return false;
}

SeatingPlan applyMove(const SeatingPlan& plan, const Move& move) {
    SeatingPlan next = plan;
    std::vector<std::string>& from = next.tables[move.fromTable].guestIds;
    std::vector<std::string>& to = next.tables[move.toTable].guestIds;

    if (move.kind == Move::Kind::SWAP) {
        std::swap(from[move.fromSeat], to[move.toSeat]);
    } else {
        std::string guest = std::move(from[move.fromSeat]);
        from.erase(from.begin() + move.fromSeat);
        to.push_back(std::move(guest));
    }
    return next;
}
