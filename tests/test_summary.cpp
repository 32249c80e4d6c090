/**
 * @file test_summary.cpp
 * @brief Tests for change tallies and impact classification
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "structdiff/Errors.hpp"
#include "structdiff/Summary.hpp"

using namespace structdiff;

namespace {

std::vector<Change> make_changes(int added, int removed, int modified) {
    std::vector<Change> changes;
    for (int i = 0; i < added; ++i) {
        changes.push_back(Change::add("a" + std::to_string(i), i));
    }
    for (int i = 0; i < removed; ++i) {
        changes.push_back(Change::remove("r" + std::to_string(i), i));
    }
    for (int i = 0; i < modified; ++i) {
        changes.push_back(Change::replace("m" + std::to_string(i), i, i + 1));
    }
    return changes;
}

} // namespace

// ============================================================================
// summarize
// ============================================================================

TEST(Summarize, EmptyList) {
    auto s = summarize({});
    EXPECT_EQ(s.added, 0);
    EXPECT_EQ(s.removed, 0);
    EXPECT_EQ(s.modified, 0);
    EXPECT_EQ(s.impact, ImpactLevel::Low);
}

TEST(Summarize, CountsPerOperation) {
    auto s = summarize(make_changes(2, 1, 3));
    EXPECT_EQ(s.added, 2);
    EXPECT_EQ(s.removed, 1);
    EXPECT_EQ(s.modified, 3);
    EXPECT_EQ(s.total(), 6);
}

TEST(Summarize, TotalMatchesChangeCount) {
    for (int a = 0; a < 4; ++a) {
        for (int r = 0; r < 4; ++r) {
            for (int m = 0; m < 4; ++m) {
                auto changes = make_changes(a, r, m);
                EXPECT_EQ(summarize(changes).total(), static_cast<int>(changes.size()));
            }
        }
    }
}

TEST(Summarize, SingleReplaceIsLow) {
    EXPECT_EQ(summarize(make_changes(0, 0, 1)).impact, ImpactLevel::Low);
}

// ============================================================================
// classify_impact thresholds
// ============================================================================

TEST(ClassifyImpact, NoChangesIsLow) {
    EXPECT_EQ(classify_impact(0, 0, 0), ImpactLevel::Low);
}

TEST(ClassifyImpact, SmallAdditiveChangeIsLow) {
    EXPECT_EQ(classify_impact(5, 0, 5), ImpactLevel::Low);
}

TEST(ClassifyImpact, AnyRemovalIsAtLeastMedium) {
    EXPECT_EQ(classify_impact(0, 1, 0), ImpactLevel::Medium);
    EXPECT_EQ(classify_impact(0, 5, 0), ImpactLevel::Medium);
}

TEST(ClassifyImpact, MoreThanTenIsMedium) {
    EXPECT_EQ(classify_impact(11, 0, 0), ImpactLevel::Medium);
    EXPECT_EQ(classify_impact(10, 0, 10), ImpactLevel::Medium);
}

TEST(ClassifyImpact, MoreThanFiveRemovalsIsHigh) {
    EXPECT_EQ(classify_impact(0, 6, 0), ImpactLevel::High);
}

TEST(ClassifyImpact, MoreThanTwentyIsHighEvenWithoutRemovals) {
    EXPECT_EQ(classify_impact(0, 0, 21), ImpactLevel::High);
    EXPECT_EQ(classify_impact(20, 0, 1), ImpactLevel::High);
}

TEST(ClassifyImpact, NeverCritical) {
    for (int a = 0; a <= 30; a += 3) {
        for (int r = 0; r <= 30; r += 3) {
            for (int m = 0; m <= 30; m += 3) {
                EXPECT_NE(classify_impact(a, r, m), ImpactLevel::Critical);
            }
        }
    }
}

TEST(ClassifyImpact, MonotonicInRemovals) {
    for (int a = 0; a <= 25; ++a) {
        for (int m = 0; m <= 25; m += 5) {
            ImpactLevel previous = classify_impact(a, 0, m);
            for (int r = 1; r <= 10; ++r) {
                ImpactLevel current = classify_impact(a, r, m);
                EXPECT_GE(static_cast<int>(current), static_cast<int>(previous))
                    << "a=" << a << " r=" << r << " m=" << m;
                previous = current;
            }
        }
    }
}

// ============================================================================
// Names
// ============================================================================

TEST(ImpactNames, ToString) {
    EXPECT_EQ(to_string(ImpactLevel::Low), "low");
    EXPECT_EQ(to_string(ImpactLevel::Medium), "medium");
    EXPECT_EQ(to_string(ImpactLevel::High), "high");
    EXPECT_EQ(to_string(ImpactLevel::Critical), "critical");
}

TEST(ImpactNames, ParseRoundTrips) {
    for (auto level : {ImpactLevel::Low, ImpactLevel::Medium,
                       ImpactLevel::High, ImpactLevel::Critical}) {
        EXPECT_EQ(parse_impact(to_string(level)), level);
    }
}

TEST(ImpactNames, ParseRejectsUnknown) {
    EXPECT_THROW(parse_impact("severe"), OptionsError);
    EXPECT_THROW(parse_impact("High"), OptionsError);
    EXPECT_THROW(parse_impact(""), OptionsError);
}

TEST(OperationNames, ToString) {
    EXPECT_EQ(to_string(ChangeOperation::Add), "add");
    EXPECT_EQ(to_string(ChangeOperation::Remove), "remove");
    EXPECT_EQ(to_string(ChangeOperation::Replace), "replace");
}
