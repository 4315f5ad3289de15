///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "assignment.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>


///////////////////////////
///       RANDOM        ///
///////////////////////////
std::size_t SeededRandom::upTo(std::size_t bound) {
    std::uniform_int_distribution<std::size_t> dist(0, bound);
    return dist(engine_);
}


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// guestId -> ids of guests it must not share a table with.
using ConflictMap = std::unordered_map<std::string, std::unordered_set<std::string>>;

static ConflictMap buildConflictMap(const std::vector<Constraint>& constraints) {
    ConflictMap conflicts;
    for (const Constraint& c : constraints) {
        if (c.type != ConstraintType::MUST_NOT_SIT_TOGETHER) continue;
        for (const std::string& a : c.guestIds) {
            for (const std::string& b : c.guestIds) {
                if (a != b) conflicts[a].insert(b);
            }
        }
    }
    return conflicts;
}

static bool hasConflict(const Table& table, const std::string& guestId, const ConflictMap& conflicts) {
    auto it = conflicts.find(guestId);
    if (it == conflicts.end()) return false;
    for (const std::string& seated : table.guestIds) {
        if (it->second.count(seated)) return true;
    }
    return false;
}

static bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}


///////////////////////////
///       BUILDER       ///
///////////////////////////
SeatingPlan buildInitialAssignment(const std::vector<Guest>& guests,
                                   const std::vector<Constraint>& constraints,
                                   int tableCount,
                                   int seatsPerTable,
                                   SeededRandom& rng) {
    SeatingPlan plan;
    plan.tables.reserve(tableCount);
    for (int t = 0; t < tableCount; ++t) {
        plan.tables.push_back({tableLabel(t), {}});
    }

    std::unordered_set<std::string> known;
    for (const Guest& g : guests) known.insert(g.id);
    std::unordered_set<std::string> placed;

    // HARD GROUPS FIRST
    // Each group goes to the first table with room for all of its members.
    for (const Constraint& c : constraints) {
        if (c.type != ConstraintType::MUST_SIT_TOGETHER) continue;
        int groupSize = (int)c.guestIds.size();

        auto target = std::find_if(plan.tables.begin(), plan.tables.end(), [&](const Table& t) {
            return (int)t.guestIds.size() + groupSize <= seatsPerTable;
        });
        if (target == plan.tables.end()) continue; // left to the fallback pass

        for (const std::string& gid : c.guestIds) {
            if (!known.count(gid) || placed.count(gid)) continue;
            target->guestIds.push_back(gid);
            placed.insert(gid);
        }
    }

    // SHUFFLED ROUND-ROBIN
    std::vector<const Guest*> remaining;
    for (const Guest& g : guests) {
        if (!placed.count(g.id)) remaining.push_back(&g);
    }
    rng.shuffle(remaining);

    ConflictMap conflicts = buildConflictMap(constraints);
    int tableIndex = 0;

    for (const Guest* guest : remaining) {
        bool seated = false;
        for (int attempts = 0; attempts < tableCount; ++attempts) {
            Table& table = plan.tables[(tableIndex + attempts) % tableCount];
            if ((int)table.guestIds.size() >= seatsPerTable) continue;
            if (hasConflict(table, guest->id, conflicts)) continue;
            table.guestIds.push_back(guest->id);
            seated = true;
            break;
        }

        // Last resort: accept the violation to keep every guest seated.
        if (!seated) {
            for (Table& table : plan.tables) {
                if ((int)table.guestIds.size() < seatsPerTable) {
                    table.guestIds.push_back(guest->id);
                    break;
                }
            }
        }

        // The pointer advances once per guest regardless of where they sat.
        tableIndex = (tableIndex + 1) % tableCount;
    }

    return plan;
}

SeatingPlan repairAssignment(const SeatingPlan& plan,
                             const std::vector<Constraint>& constraints,
                             int seatsPerTable) {
    SeatingPlan repaired = plan;

    for (const Constraint& c : constraints) {
        if (c.type != ConstraintType::MUST_NOT_SIT_TOGETHER) continue;

        for (int t = 0; t < (int)repaired.tables.size(); ++t) {
            std::vector<std::string> conflicting;
            for (const std::string& gid : repaired.tables[t].guestIds) {
                if (contains(c.guestIds, gid)) conflicting.push_back(gid);
            }

            while (conflicting.size() > 1) {
                std::string guestToMove = conflicting.back();
                conflicting.pop_back();

                int destination = -1;
                for (int o = 0; o < (int)repaired.tables.size(); ++o) {
                    if (o == t) continue;
                    const Table& other = repaired.tables[o];
                    if ((int)other.guestIds.size() >= seatsPerTable) continue;
                    bool holdsMember = std::any_of(other.guestIds.begin(), other.guestIds.end(),
                                                   [&](const std::string& id) { return contains(c.guestIds, id); });
                    if (holdsMember) continue;
                    destination = o;
                    break;
                }
                if (destination < 0) continue; // residual violation

                std::vector<std::string>& source = repaired.tables[t].guestIds;
                source.erase(std::find(source.begin(), source.end(), guestToMove));
                repaired.tables[destination].guestIds.push_back(guestToMove);
            }
        }
    }

    return repaired;
}
