#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "guest_index.hpp"
#include <string>
#include <vector>


///////////////////////////
///       SCORING       ///
///////////////////////////
/**
 * @brief Objective A: new professional connections.
 *
 * Mean over every co-seated unordered pair of a pair score that starts at 1.0
 * and loses 0.4 for a shared company, 0.3 for a shared department and 0.3 for
 * a known connection (floored at 0). Returns 1.0 when no pairs exist.
 */
double noveltyScore(const SeatingPlan& plan, const GuestIndex& guests);

/**
 * @brief Objective B: cross-company and cross-department mixing.
 *
 * Per non-empty table, the mean of distinct companies / size and distinct
 * departments / size; averaged over non-empty tables (1.0 if none).
 */
double diversityScore(const SeatingPlan& plan, const GuestIndex& guests);

/**
 * @brief Objective C: balanced seniority and guest-type mix.
 *
 * Per non-empty table, the mean of a seniority evenness term and a guest-type
 * term; averaged over non-empty tables (1.0 if none).
 */
double balanceScore(const SeatingPlan& plan, const GuestIndex& guests);

/**
 * @brief Objective D: buyer/seller opportunities.
 *
 * Per non-empty table, a 0.5 baseline adjusted for buyer/seller presence,
 * catalysts, buyer/seller ratio and competing sellers, clamped to [0, 1];
 * averaged over non-empty tables (0.5 if none).
 */
double transactionScore(const SeatingPlan& plan, const GuestIndex& guests);

/**
 * @brief Dot product of the four scores with the weights (no renormalization).
 */
double weightedScore(double novelty, double diversity, double balance, double transaction,
                     const ObjectiveWeights& weights);

/**
 * @brief Compute all four objective scores and the weighted composite.
 *
 * Pure and deterministic; calling it twice on the same plan yields identical
 * metrics.
 */
PlanMetrics calculateAllMetrics(const SeatingPlan& plan,
                                const GuestIndex& guests,
                                const ObjectiveWeights& weights);

/**
 * @brief Convenience overload that builds the guest lookup on the fly.
 */
PlanMetrics calculateAllMetrics(const SeatingPlan& plan,
                                const std::vector<Guest>& guests,
                                const ObjectiveWeights& weights);


///////////////////////////
///       WEIGHTS       ///
///////////////////////////
/**
 * @brief Scale weights so they sum to 1.0.
 *
 * Falls back to equal weights (0.25 each) when the sum is zero.
 */
ObjectiveWeights normalizeWeights(const ObjectiveWeights& weights);

/**
 * @brief Format a 0-1 score as a whole percentage, e.g. "73%".
 */
std::string formatScore(double score);
