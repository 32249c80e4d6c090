/**
 * @file TreeDiff.hpp
 * @brief Recursive structural comparison of two tree values
 */

#ifndef STRUCTDIFF_TREEDIFF_HPP
#define STRUCTDIFF_TREEDIFF_HPP

#include "structdiff/Change.hpp"
#include "structdiff/Value.hpp"
#include <string>
#include <vector>

namespace structdiff {

/**
 * @brief Compare two tree values
 *
 * Rules:
 * - Equal values produce no changes (checked before anything else).
 * - Mapping vs mapping: every key of either side is visited once, in
 *   sorted key order. A key only on the right is an Add, only on the left
 *   a Remove; a key on both sides is compared recursively.
 * - Sequence vs sequence: elements are paired by index up to the longer
 *   length. Extra right elements are Adds, extra left elements Removes.
 * - Anything else (type mismatch, differing scalars) is one Replace at
 *   the current path.
 *
 * Sequence comparison is positional. Swapping two elements yields
 * replacements at both indices, not a move. Normalize with ignore_order
 * to compare keyed sequences by identity instead.
 *
 * @param path Path of left/right inside the document ("" at the root)
 * @param left Old value
 * @param right New value
 * @return Changes in walk order
 *
 * Example:
 * ```cpp
 * Value a = {{"items", {"a", "b", "c"}}};
 * Value b = {{"items", {"a", "b", "d"}}};
 * auto changes = compute_diff("", a, b);
 * // one Replace at "items[2]": "c" -> "d"
 * ```
 */
std::vector<Change> compute_diff(const std::string& path,
                                 const Value& left, const Value& right);

} // namespace structdiff

#endif // STRUCTDIFF_TREEDIFF_HPP
