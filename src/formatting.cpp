///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "guest_index.hpp"
#include "scoring.hpp"
#include <iomanip>
#include <iostream>
#include <string>

///////////////////////////
///       HELPERS       ///
///////////////////////////

/**
 * @brief Cell text for an optional field; absent values print as "-".
 */
static std::string orDash(const std::string& value) {
    return value.empty() ? "-" : value;
}

/**
 * @brief Print the header row for a per-table guest listing.
 *
 * Uses fixed-width columns to align name, company, department, seniority and type.
 */
static void printTableHeader(std::ostream& os) {
    os << "    "
       << std::left << std::setw(18) << "Guest"
       << " | " << std::left << std::setw(12) << "Company"
       << " | " << std::left << std::setw(12) << "Department"
       << " | " << std::left << std::setw(9)  << "Seniority"
       << " | " << std::left << std::setw(8)  << "Type"
       << "\n";

    os << "    "
       << std::string(18, '-')
       << "-+-" << std::string(12, '-')
       << "-+-" << std::string(12, '-')
       << "-+-" << std::string(9, '-')
       << "-+-" << std::string(8, '-')
       << "\n";
}

static void printMetric(std::ostream& os, const char* label, double score) {
    os << "  " << std::left << std::setw(12) << label << formatScore(score) << "\n";
}

///////////////////////////
///      PRINTING       ///
///////////////////////////
void printSeatingPlan(const SeatingProblem& problem, const OptimizationResult& result, std::ostream& os) {
    GuestIndex guests(problem.guests);

    os << "Status: " << (result.feasible ? "feasible" : "infeasible")
       << " (" << toString(result.finalState) << ", " << result.iterations << " iterations)\n";

    for (const Table& table : result.plan.tables) {
        os << "----------------------------------------\n";
        os << table.tableId << " (" << table.guestIds.size() << "/" << problem.config.seatsPerTable << "):\n";

        if (table.guestIds.empty()) {
            os << "  (empty)\n";
            continue;
        }

        printTableHeader(os);
        for (const std::string& gid : table.guestIds) {
            const Guest* g = guests.find(gid);
            // Fallback names make ids without a guest record obvious.
            std::string name = g ? g->name : "Unknown(" + gid + ")";
            std::string seniority = g && g->seniority ? toString(*g->seniority) : "-";
            std::string type = g ? toString(g->type) : "-";

            os << "    "
               << std::left << std::setw(18) << name
               << " | " << std::left << std::setw(12) << (g ? orDash(g->company) : "-")
               << " | " << std::left << std::setw(12) << (g ? orDash(g->department) : "-")
               << " | " << std::left << std::setw(9)  << seniority
               << " | " << std::left << std::setw(8)  << type
               << "\n";
        }

        for (const TableExplanation& e : result.explanations.perTable) {
            if (e.tableId != table.tableId) continue;
            for (const std::string& line : e.lines) {
                os << "    * " << line << "\n";
            }
        }
    }

    os << "----------------------------------------\n";
    os << "Metrics:\n";
    printMetric(os, "Novelty", result.metrics.novelty);
    printMetric(os, "Diversity", result.metrics.diversity);
    printMetric(os, "Balance", result.metrics.balance);
    printMetric(os, "Transaction", result.metrics.transaction);
    printMetric(os, "Weighted", result.metrics.weighted);

    os << "\nSummary: " << result.explanations.overall << "\n";

    if (!result.warnings.empty()) {
        os << "\nWarnings:\n";
        for (const std::string& w : result.warnings) {
            os << "  ! " << w << "\n";
        }
    }
}

void printSeatingPlan(const SeatingProblem& problem, const OptimizationResult& result) {
    printSeatingPlan(problem, result, std::cout);
}
