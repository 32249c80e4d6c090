/**
 * @file Summary.cpp
 * @brief Implementation of change tallies
 */

#include "structdiff/Summary.hpp"

namespace structdiff {

ImpactLevel classify_impact(int added, int removed, int modified) {
    const int total = added + removed + modified;

    if (total == 0) {
        return ImpactLevel::Low;
    }

    // High must be checked first: total > 20 also satisfies total > 10
    if (removed > 5 || total > 20) {
        return ImpactLevel::High;
    }

    if (removed > 0 || total > 10) {
        return ImpactLevel::Medium;
    }

    return ImpactLevel::Low;
}

DiffSummary summarize(const std::vector<Change>& changes) {
    DiffSummary summary;

    for (const auto& change : changes) {
        switch (change.operation) {
            case ChangeOperation::Add: ++summary.added; break;
            case ChangeOperation::Remove: ++summary.removed; break;
            case ChangeOperation::Replace: ++summary.modified; break;
        }
    }

    summary.impact = classify_impact(summary.added, summary.removed, summary.modified);
    return summary;
}

} // namespace structdiff
