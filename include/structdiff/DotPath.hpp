/**
 * @file DotPath.hpp
 * @brief Path utilities for addressing nodes inside a tree value
 *
 * Two path flavours are used by the engine:
 * - Dotted removal paths like "metadata.createdAt", which only walk
 *   mappings (split_dot_path, remove_by_dot).
 * - Change paths like "outer.items[2].name", built by the differ while it
 *   walks both trees (child_key_path, child_index_path) and rendered as
 *   slash pointers by the JSON-Patch formatter (to_patch_pointer).
 */

#ifndef STRUCTDIFF_DOTPATH_HPP
#define STRUCTDIFF_DOTPATH_HPP

#include "structdiff/Value.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace structdiff {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped.
 *
 * Examples:
 * - "metadata.uid" → ["metadata", "uid"]
 * - "a..b" → ["a", "b"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Remove the node at a dotted path
 *
 * Walks mappings segment by segment. If any intermediate segment is
 * missing or is not a mapping, nothing happens. Sequences are never
 * entered.
 *
 * @param data Tree modified in place
 * @param path Dot-separated path
 * @return true if a key was erased, false if the path did not resolve
 *
 * Example:
 * ```cpp
 * Value doc = {{"metadata", {{"uid", "abc"}, {"name", "x"}}}};
 * remove_by_dot(doc, "metadata.uid");   // true, doc.metadata == {"name": "x"}
 * remove_by_dot(doc, "metadata.uid");   // false, no-op
 * remove_by_dot(doc, "metadata.name.x"); // false, "name" is a string
 * ```
 */
bool remove_by_dot(Value& data, const std::string& path);

/**
 * @brief Path of a mapping child
 *
 * @return key at the root, otherwise "parent.key"
 */
std::string child_key_path(const std::string& parent, const std::string& key);

/**
 * @brief Path of a sequence element, "parent[index]"
 */
std::string child_index_path(const std::string& parent, std::size_t index);

/**
 * @brief Convert a change path to a slash pointer
 *
 * Prefixes "/" and replaces every '.' with '/'. Brackets are kept and
 * dots inside keys are not escaped, so this is a display form, not an
 * RFC 6901 pointer.
 *
 * Examples:
 * - "outer.inner" → "/outer/inner"
 * - "items[2]" → "/items[2]"
 * - "" → "/"
 */
std::string to_patch_pointer(const std::string& path);

} // namespace structdiff

#endif // STRUCTDIFF_DOTPATH_HPP
