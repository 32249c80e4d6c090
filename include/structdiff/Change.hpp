/**
 * @file Change.hpp
 * @brief Change set data model
 *
 * Value objects produced fresh for every comparison:
 * - Change: one path-addressed add/remove/replace
 * - DiffSummary: counts per operation plus an impact label
 * - DiffResult: everything a caller needs to print or decide on exit codes
 */

#ifndef STRUCTDIFF_CHANGE_HPP
#define STRUCTDIFF_CHANGE_HPP

#include "structdiff/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace structdiff {

/**
 * @brief Kind of edit
 */
enum class ChangeOperation {
    Add,
    Remove,
    Replace
};

/// "add", "remove" or "replace"
std::string to_string(ChangeOperation op);

/**
 * @brief Coarse severity of a change set, ordered Low < Critical
 *
 * Critical is part of the vocabulary but never produced by
 * classify_impact().
 */
enum class ImpactLevel {
    Low,
    Medium,
    High,
    Critical
};

/// "low", "medium", "high" or "critical"
std::string to_string(ImpactLevel level);

/**
 * @brief Parse an impact name as written by to_string()
 * @throws OptionsError for anything but "low", "medium", "high", "critical"
 */
ImpactLevel parse_impact(const std::string& name);

/**
 * @brief One edit between two tree values
 *
 * Add carries only new_value, Remove only old_value, Replace both. Use the
 * factory functions to keep that invariant.
 */
struct Change {
    std::string path;
    ChangeOperation operation = ChangeOperation::Replace;
    std::optional<Value> old_value;
    std::optional<Value> new_value;
    std::vector<std::string> context; // reserved, always empty

    static Change add(std::string path, Value new_value);
    static Change remove(std::string path, Value old_value);
    static Change replace(std::string path, Value old_value, Value new_value);
};

bool operator==(const Change& a, const Change& b);
bool operator!=(const Change& a, const Change& b);

/**
 * @brief Tally of a change list
 *
 * Invariant: added + removed + modified == number of changes.
 */
struct DiffSummary {
    int added = 0;
    int removed = 0;
    int modified = 0;
    ImpactLevel impact = ImpactLevel::Low;

    int total() const noexcept { return added + removed + modified; }
};

/**
 * @brief Outcome of one comparison
 */
struct DiffResult {
    bool has_changes = false;
    std::vector<Change> changes; // walk order
    DiffSummary summary;
    std::string patch;           // output of the selected formatter
    std::string left_label;
    std::string right_label;
};

} // namespace structdiff

#endif // STRUCTDIFF_CHANGE_HPP
