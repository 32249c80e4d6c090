/**
 * @file Summary.hpp
 * @brief Change tallies and impact classification
 */

#ifndef STRUCTDIFF_SUMMARY_HPP
#define STRUCTDIFF_SUMMARY_HPP

#include "structdiff/Change.hpp"
#include <vector>

namespace structdiff {

/**
 * @brief Derive an impact level from change counts
 *
 * Checked in order, first match wins:
 * - no changes → Low
 * - removed > 5 or total > 20 → High
 * - removed > 0 or total > 10 → Medium
 * - otherwise → Low
 *
 * Never returns ImpactLevel::Critical.
 */
ImpactLevel classify_impact(int added, int removed, int modified);

/**
 * @brief Count changes per operation and classify the impact
 */
DiffSummary summarize(const std::vector<Change>& changes);

} // namespace structdiff

#endif // STRUCTDIFF_SUMMARY_HPP
