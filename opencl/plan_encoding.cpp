///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "plan_encoding.hpp"
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Maps distinct non-empty strings to 0, 1, 2, ... in order of first appearance.
class CodeTable {
public:
    int codeOf(const std::string& value) {
        if (value.empty()) return -1;
        auto it = codes_.find(value);
        if (it != codes_.end()) return it->second;
        int code = (int)codes_.size();
        codes_.emplace(value, code);
        return code;
    }

private:
    std::unordered_map<std::string, int> codes_;
};


///////////////////////////
///      ENCODING       ///
///////////////////////////
EncodedGuests encodeGuests(const GuestIndex& guests) {
    const std::vector<Guest>& list = guests.guests();
    int n = (int)list.size();

    EncodedGuests out;
    out.company.reserve(n);
    out.department.reserve(n);
    out.seniority.reserve(n);
    out.type.reserve(n);

    CodeTable companies, departments;
    std::vector<std::set<int>> neighbours(n);

    for (int i = 0; i < n; ++i) {
        const Guest& g = list[i];
        out.company.push_back(companies.codeOf(g.company));
        out.department.push_back(departments.codeOf(g.department));
        out.seniority.push_back(g.seniority ? (int)*g.seniority : -1);
        out.type.push_back((int)g.type);

        for (const std::string& other : g.knownConnections) {
            int j = guests.indexOf(other);
            if (j < 0 || j == i) continue;
            neighbours[i].insert(j);
            neighbours[j].insert(i);
        }
    }

    // Flatten to CSR.
    out.connectionOffsets.resize(n + 1);
    int offset = 0;
    for (int i = 0; i < n; ++i) {
        out.connectionOffsets[i] = offset;
        for (int j : neighbours[i]) {
            out.connections.push_back(j);
            ++offset;
        }
    }
    out.connectionOffsets[n] = offset;
    return out;
}

void appendPlanGrid(const SeatingPlan& plan,
                    const GuestIndex& guests,
                    int tableCount,
                    int seatsPerTable,
                    std::vector<int>& grid) {
    if ((int)plan.tables.size() > tableCount) {
        throw std::invalid_argument("Plan has more tables than the encoding grid");
    }

    size_t base = grid.size();
    grid.resize(base + (size_t)tableCount * seatsPerTable, -1);

    for (int t = 0; t < (int)plan.tables.size(); ++t) {
        const std::vector<std::string>& ids = plan.tables[t].guestIds;
        if ((int)ids.size() > seatsPerTable) {
            throw std::invalid_argument("Table " + plan.tables[t].tableId + " exceeds the encoding grid");
        }
        for (int s = 0; s < (int)ids.size(); ++s) {
            grid[base + (size_t)t * seatsPerTable + s] = guests.indexOf(ids[s]);
        }
    }
}
