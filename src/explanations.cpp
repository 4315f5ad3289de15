///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "explanations.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Distinct non-empty values of a field, in order of first appearance.
 */
template <typename Field>
static std::vector<std::string> distinctValues(const std::vector<const Guest*>& seated, Field field) {
    std::vector<std::string> values;
    for (const Guest* g : seated) {
        const std::string& v = field(*g);
        if (v.empty()) continue;
        if (std::find(values.begin(), values.end(), v) == values.end()) values.push_back(v);
    }
    return values;
}

static std::vector<std::string> idsOf(const std::vector<const Guest*>& group) {
    std::vector<std::string> ids;
    for (const Guest* g : group) ids.push_back(g->id);
    return ids;
}

static std::string joinNames(const std::vector<const Guest*>& group) {
    std::string names;
    for (const Guest* g : group) {
        if (g->name.empty()) continue;
        if (!names.empty()) names += ", ";
        names += g->name;
    }
    return names;
}


///////////////////////////
///    EXPLANATIONS     ///
///////////////////////////
PlanExplanations generateExplanations(const SeatingPlan& plan,
                                      const GuestIndex& guests,
                                      const PlanMetrics& metrics,
                                      const std::vector<Constraint>& constraints) {
    PlanExplanations out;

    for (const Table& table : plan.tables) {
        std::vector<const Guest*> seated;
        for (const std::string& gid : table.guestIds) {
            const Guest* g = guests.find(gid);
            if (g) seated.push_back(g);
        }
        if (seated.empty()) continue;

        TableExplanation entry;
        entry.tableId = table.tableId;

        // Every reason records its text both in the table entry and as a code.
        auto emit = [&](const std::string& code,
                        std::vector<std::string> ids,
                        const std::string& text,
                        Impact impact,
                        std::optional<Objective> objective) {
            entry.lines.push_back(text);
            out.reasonCodes.push_back({code, table.tableId, std::move(ids), text, impact, objective});
        };

        // COMPANY MIX
        std::vector<std::string> companies =
                distinctValues(seated, [](const Guest& g) -> const std::string& { return g.company; });
        if (companies.size() > 1) {
            std::ostringstream text;
            text << "Cross-company networking: " << companies.size() << " different companies represented";
            emit("COMPANY_DIVERSITY", table.guestIds, text.str(), Impact::POSITIVE, Objective::DIVERSITY);
        } else if (companies.size() == 1 && seated.size() > 2) {
            emit("SAME_COMPANY", table.guestIds, "Same company table: All guests from " + companies[0],
                 Impact::NEGATIVE, Objective::NOVELTY);
        }

        // DEPARTMENT MIX
        std::vector<std::string> departments =
                distinctValues(seated, [](const Guest& g) -> const std::string& { return g.department; });
        if (departments.size() > 2) {
            std::ostringstream text;
            text << "Department mix: " << departments.size() << " different departments";
            emit("DEPARTMENT_DIVERSITY", table.guestIds, text.str(), Impact::POSITIVE, Objective::DIVERSITY);
        }

        // SENIORITY MIX
        std::vector<Seniority> levels;
        for (const Guest* g : seated) {
            if (g->seniority && std::find(levels.begin(), levels.end(), *g->seniority) == levels.end()) {
                levels.push_back(*g->seniority);
            }
        }
        if (levels.size() > 2) {
            std::ostringstream text;
            text << "Balanced seniority: " << levels.size() << " experience levels";
            emit("SENIORITY_MIX", table.guestIds, text.str(), Impact::POSITIVE, Objective::BALANCE);
        }

        // BUYER / SELLER DYNAMICS
        std::vector<const Guest*> buyers, sellers, catalysts;
        for (const Guest* g : seated) {
            if (g->type == GuestType::BUYER) buyers.push_back(g);
            else if (g->type == GuestType::SELLER) sellers.push_back(g);
            else if (g->type == GuestType::CATALYST) catalysts.push_back(g);
        }

        if (!buyers.empty() && !sellers.empty()) {
            std::ostringstream text;
            text << "Business opportunity: " << buyers.size() << " buyer(s) and "
                 << sellers.size() << " seller(s)";
            std::vector<std::string> ids = idsOf(buyers);
            std::vector<std::string> sellerIds = idsOf(sellers);
            ids.insert(ids.end(), sellerIds.begin(), sellerIds.end());
            emit("BUYER_SELLER_MIX", std::move(ids), text.str(), Impact::POSITIVE, Objective::TRANSACTION);
        }

        if (!catalysts.empty()) {
            emit("CATALYST_PRESENT", idsOf(catalysts), "Conversation catalyst: " + joinNames(catalysts),
                 Impact::POSITIVE, Objective::BALANCE);
        }

        std::vector<std::string> sellerCompanies;
        int sellersWithCompany = 0;
        for (const Guest* s : sellers) {
            if (s->company.empty()) continue;
            sellersWithCompany++;
            if (std::find(sellerCompanies.begin(), sellerCompanies.end(), s->company) == sellerCompanies.end()) {
                sellerCompanies.push_back(s->company);
            }
        }
        if (sellersWithCompany > (int)sellerCompanies.size()) {
            emit("COMPETING_SELLERS", idsOf(sellers), "Note: Multiple sellers from the same company",
                 Impact::NEGATIVE, Objective::TRANSACTION);
        }

        // REQUESTED GROUPS
        for (const Constraint& c : constraints) {
            if (c.type != ConstraintType::MUST_SIT_TOGETHER) continue;
            std::vector<const Guest*> members;
            for (const std::string& gid : c.guestIds) {
                if (std::find(table.guestIds.begin(), table.guestIds.end(), gid) == table.guestIds.end()) break;
                const Guest* g = guests.find(gid);
                if (g) members.push_back(g);
            }
            if (members.size() != c.guestIds.size()) continue;
            emit("MUST_SIT_TOGETHER_SATISFIED", idsOf(members), "Grouped by request: " + joinNames(members),
                 Impact::NEUTRAL, std::nullopt);
        }

        out.perTable.push_back(std::move(entry));
    }

    out.overall = generateOverallSummary(metrics, plan, guests.size(), out.reasonCodes);
    return out;
}

std::string generateOverallSummary(const PlanMetrics& metrics,
                                   const SeatingPlan& plan,
                                   int guestCount,
                                   const std::vector<ReasonCode>& reasonCodes) {
    std::vector<std::string> parts;

    {
        std::ostringstream ss;
        ss << "Overall optimization score: " << std::fixed << std::setprecision(1)
           << metrics.weighted * 100.0 << "%";
        parts.push_back(ss.str());
    }

    // Highlight the strongest objective; ties keep declaration order.
    std::vector<std::pair<std::string, double>> objectives = {
            {"new connections", metrics.novelty},
            {"cross-department mixing", metrics.diversity},
            {"balanced conversations", metrics.balance},
            {"business opportunities", metrics.transaction},
    };
    std::stable_sort(objectives.begin(), objectives.end(),
                     [](const std::pair<std::string, double>& a, const std::pair<std::string, double>& b) {
                         return a.second > b.second;
                     });
    if (objectives[0].second >= 0.7) {
        std::ostringstream ss;
        ss << "Strong performance in " << objectives[0].first << " ("
           << std::fixed << std::setprecision(0) << objectives[0].second * 100.0 << "%)";
        parts.push_back(ss.str());
    }

    int positive = (int)std::count_if(reasonCodes.begin(), reasonCodes.end(),
                                      [](const ReasonCode& r) { return r.impact == Impact::POSITIVE; });
    int negative = (int)std::count_if(reasonCodes.begin(), reasonCodes.end(),
                                      [](const ReasonCode& r) { return r.impact == Impact::NEGATIVE; });
    if (positive > negative * 2) {
        parts.push_back("Well-balanced tables with good networking potential");
    } else if (negative > positive) {
        parts.push_back("Some trade-offs were made to satisfy hard constraints");
    }

    int occupied = (int)std::count_if(plan.tables.begin(), plan.tables.end(),
                                      [](const Table& t) { return !t.guestIds.empty(); });
    {
        std::ostringstream ss;
        ss << guestCount << " guests across " << occupied << " tables";
        parts.push_back(ss.str());
    }

    std::string summary;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) summary += ". ";
        summary += parts[i];
    }
    return summary + ".";
}
