/**
 * @file Normalize.hpp
 * @brief Pre-diff normalization of tree values
 *
 * normalize() produces an independent copy of a tree and optionally:
 * - strips volatile metadata fields (timestamps, versions, uids)
 * - sorts sequences of keyed mappings so element order stops mattering
 */

#ifndef STRUCTDIFF_NORMALIZE_HPP
#define STRUCTDIFF_NORMALIZE_HPP

#include "structdiff/Value.hpp"
#include <array>

namespace structdiff {

/**
 * @brief Dotted paths removed when metadata is ignored
 *
 * All rooted at a top-level "metadata" mapping. Fed one by one into
 * remove_by_dot().
 */
constexpr std::array<const char*, 8> kMetadataPaths = {
    "metadata.createdAt",
    "metadata.updatedAt",
    "metadata.version",
    "metadata.modifiedBy",
    "metadata.creationTimestamp",
    "metadata.resourceVersion",
    "metadata.generation",
    "metadata.uid",
};

/**
 * @brief Keys identifying sequence elements, in priority order
 */
constexpr std::array<const char*, 3> kStableKeys = {"id", "name", "key"};

/**
 * @brief Copy a value through a serialization round trip
 *
 * Dumps the value to JSON text and parses it back. If the value cannot be
 * serialized (invalid UTF-8 in a string) or does not survive the round
 * trip unchanged (non-finite numbers), a warning is logged and a plain
 * copy of the original is returned instead. Never throws.
 */
Value deep_copy(const Value& value);

/**
 * @brief Remove every path in kMetadataPaths from a tree
 * @return Number of fields actually removed
 */
int remove_metadata_fields(Value& data);

/**
 * @brief Check whether a sequence qualifies for order-independent sorting
 *
 * True only for a non-empty sequence whose elements are all mappings, each
 * holding at least one of the stable keys.
 */
bool has_stable_key(const Value& sequence);

/**
 * @brief Ordering of two keyed mappings
 *
 * Uses the first stable key present in both elements. Strings compare
 * lexicographically, numbers numerically, anything else by compact JSON
 * text. Without a common key the elements are equivalent.
 *
 * @return true if a sorts before b
 */
bool stable_key_less(const Value& a, const Value& b);

/**
 * @brief Sort every eligible sequence in the tree, in place
 *
 * Visits sequences reachable through mappings and sequences, parent first.
 * Sequences failing has_stable_key() keep their order.
 */
void sort_stable_arrays(Value& data);

/**
 * @brief Produce a normalized, independent copy of a tree
 *
 * @param value Input tree
 * @param ignore_metadata Strip kMetadataPaths
 * @param ignore_order Canonicalize keyed sequences
 */
Value normalize(const Value& value, bool ignore_metadata, bool ignore_order);

} // namespace structdiff

#endif // STRUCTDIFF_NORMALIZE_HPP
