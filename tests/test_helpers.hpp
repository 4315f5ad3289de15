#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///      FIXTURES       ///
///////////////////////////
inline Guest guest(const std::string& id,
                   const std::string& company = "",
                   const std::string& department = "",
                   GuestType type = GuestType::NEUTRAL,
                   std::optional<Seniority> seniority = std::nullopt) {
    Guest g;
    g.id = id;
    g.name = "Guest " + id;
    g.company = company;
    g.department = department;
    g.type = type;
    g.seniority = seniority;
    return g;
}

inline Constraint constraint(const std::string& id,
                             ConstraintType type,
                             std::vector<std::string> guestIds,
                             std::optional<int> value = std::nullopt) {
    Constraint c;
    c.id = id;
    c.type = type;
    c.guestIds = std::move(guestIds);
    c.value = value;
    return c;
}

/// Plan with tables labelled table_1, table_2, ... holding the given ids.
inline SeatingPlan plan(const std::vector<std::vector<std::string>>& tables) {
    SeatingPlan p;
    for (int t = 0; t < (int)tables.size(); ++t) {
        p.tables.push_back({tableLabel(t), tables[t]});
    }
    return p;
}

inline bool samePlan(const SeatingPlan& a, const SeatingPlan& b) {
    if (a.tables.size() != b.tables.size()) return false;
    for (size_t t = 0; t < a.tables.size(); ++t) {
        if (a.tables[t].tableId != b.tables[t].tableId) return false;
        if (a.tables[t].guestIds != b.tables[t].guestIds) return false;
    }
    return true;
}
