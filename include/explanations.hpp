#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "guest_index.hpp"
#include <string>
#include <vector>


///////////////////////////
///    EXPLANATIONS     ///
///////////////////////////
/**
 * @brief Derive reason codes and text summaries for a finished plan.
 *
 * Purely descriptive: nothing here feeds back into scoring. Empty tables
 * produce no entry. Texts are static templates; richer narrative is left to
 * downstream collaborators consuming the reason codes.
 *
 * @param plan        Finished plan.
 * @param guests      Id lookup over the guests of the run.
 * @param metrics     Metrics of the plan.
 * @param constraints Rules of the run (for satisfied-group reasons).
 */
PlanExplanations generateExplanations(const SeatingPlan& plan,
                                      const GuestIndex& guests,
                                      const PlanMetrics& metrics,
                                      const std::vector<Constraint>& constraints);

/**
 * @brief One-paragraph summary of a plan.
 *
 * Reports the weighted score, the strongest objective (if >= 0.7), the
 * positive/negative balance of the reason codes and the guest/table counts.
 */
std::string generateOverallSummary(const PlanMetrics& metrics,
                                   const SeatingPlan& plan,
                                   int guestCount,
                                   const std::vector<ReasonCode>& reasonCodes);
