///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "scoring.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Resolve the guests seated at a table, skipping unknown ids.
 */
static std::vector<const Guest*> seatedGuests(const Table& table, const GuestIndex& guests) {
    std::vector<const Guest*> seated;
    seated.reserve(table.guestIds.size());
    for (const std::string& gid : table.guestIds) {
        const Guest* g = guests.find(gid);
        if (g) seated.push_back(g);
    }
    return seated;
}

static bool sameNonEmpty(const std::string& a, const std::string& b) {
    return !a.empty() && !b.empty() && a == b;
}

/**
 * @brief Number of distinct non-empty values of a field over a table.
 */
template <typename Field>
static int countDistinct(const std::vector<const Guest*>& seated, Field field) {
    std::set<std::string> values;
    for (const Guest* g : seated) {
        const std::string& v = field(*g);
        if (!v.empty()) values.insert(v);
    }
    return (int)values.size();
}

/**
 * @brief True if two or more sellers at the table share a company.
 */
static bool hasCompetingSellers(const std::vector<const Guest*>& seated) {
    std::set<std::string> companies;
    int sellersWithCompany = 0;
    for (const Guest* g : seated) {
        if (g->type != GuestType::SELLER || g->company.empty()) continue;
        companies.insert(g->company);
        sellersWithCompany++;
    }
    return sellersWithCompany > (int)companies.size();
}


///////////////////////////
///       SCORING       ///
///////////////////////////
double noveltyScore(const SeatingPlan& plan, const GuestIndex& guests) {
    double totalScore = 0.0;
    long long totalPairs = 0;

    for (const Table& table : plan.tables) {
        std::vector<const Guest*> seated = seatedGuests(table, guests);

        // Score each unordered pair at the table.
        for (size_t i = 0; i < seated.size(); ++i) {
            for (size_t j = i + 1; j < seated.size(); ++j) {
                const Guest& g1 = *seated[i];
                const Guest& g2 = *seated[j];
                double pairScore = 1.0;

                if (sameNonEmpty(g1.company, g2.company)) pairScore -= 0.4;
                if (sameNonEmpty(g1.department, g2.department)) pairScore -= 0.3;
                if (guests.connected(g1.id, g2.id)) pairScore -= 0.3;

                totalScore += std::max(0.0, pairScore);
                totalPairs++;
            }
        }
    }

    return totalPairs > 0 ? totalScore / (double)totalPairs : 1.0;
}

double diversityScore(const SeatingPlan& plan, const GuestIndex& guests) {
    double totalScore = 0.0;
    int occupiedTables = 0;

    for (const Table& table : plan.tables) {
        std::vector<const Guest*> seated = seatedGuests(table, guests);
        if (seated.empty()) continue;
        occupiedTables++;

        double size = (double)seated.size();
        int companies = countDistinct(seated, [](const Guest& g) -> const std::string& { return g.company; });
        int departments = countDistinct(seated, [](const Guest& g) -> const std::string& { return g.department; });

        totalScore += (companies / size + departments / size) / 2.0;
    }

    return occupiedTables > 0 ? totalScore / occupiedTables : 1.0;
}

double balanceScore(const SeatingPlan& plan, const GuestIndex& guests) {
    double totalScore = 0.0;
    int occupiedTables = 0;

    for (const Table& table : plan.tables) {
        std::vector<const Guest*> seated = seatedGuests(table, guests);
        if (seated.empty()) continue;
        occupiedTables++;

        // SENIORITY EVENNESS
        std::array<int, SENIORITY_LEVELS> levelCount{};
        int withSeniority = 0;
        for (const Guest* g : seated) {
            if (!g->seniority) continue;
            levelCount[(int)*g->seniority]++;
            withSeniority++;
        }

        double seniorityTerm = 0.5; // no seniority data: neutral
        if (withSeniority > 0) {
            double ideal = (double)withSeniority / SENIORITY_LEVELS;
            double sum = 0.0;
            int presentLevels = 0;
            for (int count : levelCount) {
                if (count == 0) continue;
                double term = 1.0 - std::abs(count - ideal) / std::max(1.0, ideal);
                sum += std::min(1.0, std::max(0.0, term));
                presentLevels++;
            }
            seniorityTerm = sum / presentLevels;
        }

        // GUEST TYPE MIX
        std::set<GuestType> types;
        for (const Guest* g : seated) types.insert(g->type);
        double typeTerm = types.size() > 1 ? 1.0 : 0.5;

        totalScore += (seniorityTerm + typeTerm) / 2.0;
    }

    return occupiedTables > 0 ? totalScore / occupiedTables : 1.0;
}

double transactionScore(const SeatingPlan& plan, const GuestIndex& guests) {
    double totalScore = 0.0;
    int occupiedTables = 0;

    for (const Table& table : plan.tables) {
        std::vector<const Guest*> seated = seatedGuests(table, guests);
        if (seated.empty()) continue;
        occupiedTables++;

        int buyers = 0, sellers = 0, catalysts = 0;
        for (const Guest* g : seated) {
            if (g->type == GuestType::BUYER) buyers++;
            else if (g->type == GuestType::SELLER) sellers++;
            else if (g->type == GuestType::CATALYST) catalysts++;
        }

        double tableScore = 0.5;
        if (buyers > 0 && sellers > 0) {
            tableScore += 0.4;
            tableScore += 0.2 * (double)std::min(buyers, sellers) / std::max(buyers, sellers);
        }
        if (catalysts > 0 && (buyers > 0 || sellers > 0)) {
            tableScore += 0.2;
        }
        if (hasCompetingSellers(seated)) {
            tableScore -= 0.3;
        }
        if ((sellers > 0 && buyers == 0) || (buyers > 0 && sellers == 0)) {
            tableScore -= 0.2;
        }

        totalScore += std::min(1.0, std::max(0.0, tableScore));
    }

    return occupiedTables > 0 ? totalScore / occupiedTables : 0.5;
}

double weightedScore(double novelty, double diversity, double balance, double transaction,
                     const ObjectiveWeights& weights) {
    return novelty * weights.novelty +
           diversity * weights.diversity +
           balance * weights.balance +
           transaction * weights.transaction;
}

PlanMetrics calculateAllMetrics(const SeatingPlan& plan,
                                const GuestIndex& guests,
                                const ObjectiveWeights& weights) {
    PlanMetrics m;
    m.novelty = noveltyScore(plan, guests);
    m.diversity = diversityScore(plan, guests);
    m.balance = balanceScore(plan, guests);
    m.transaction = transactionScore(plan, guests);
    m.weighted = weightedScore(m.novelty, m.diversity, m.balance, m.transaction, weights);
    return m;
}

PlanMetrics calculateAllMetrics(const SeatingPlan& plan,
                                const std::vector<Guest>& guests,
                                const ObjectiveWeights& weights) {
    GuestIndex index(guests);
    return calculateAllMetrics(plan, index, weights);
}


///////////////////////////
///       WEIGHTS       ///
///////////////////////////
ObjectiveWeights normalizeWeights(const ObjectiveWeights& weights) {
    double sum = weights.novelty + weights.diversity + weights.balance + weights.transaction;
    if (sum == 0.0) {
        return ObjectiveWeights{0.25, 0.25, 0.25, 0.25};
    }
    return ObjectiveWeights{
            weights.novelty / sum,
            weights.diversity / sum,
            weights.balance / sum,
            weights.transaction / sum
    };
}

std::string formatScore(double score) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0) << score * 100.0 << "%";
    return ss.str();
}
