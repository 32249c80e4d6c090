/**
 * @file Options.hpp
 * @brief Comparison options and their parsing
 *
 * Options reach the engine from three places, lowest precedence first:
 * - DiffOptions defaults
 * - an options document (JSON/YAML/TOML file) via options_from_value()
 * - command-line flags, with resolve_format() settling the output format
 */

#ifndef STRUCTDIFF_OPTIONS_HPP
#define STRUCTDIFF_OPTIONS_HPP

#include "structdiff/Value.hpp"
#include <string>

namespace structdiff {

/**
 * @brief Output encoding of a change set
 */
enum class DiffFormat {
    Unified,
    SideBySide,
    JsonPatch,
    Semantic
};

/// "unified", "side-by-side", "json-patch" or "semantic"
std::string to_string(DiffFormat format);

/**
 * @brief Parse a format name
 * @throws OptionsError for anything but the four names of to_string()
 */
DiffFormat parse_format(const std::string& name);

/**
 * @brief Options for Differ
 */
struct DiffOptions {
    DiffFormat format = DiffFormat::Unified;
    bool ignore_metadata = false; // strip kMetadataPaths before diffing
    bool ignore_order = false;    // sort keyed sequences before diffing
    int context_lines = 3;        // reserved hint for the unified formatter
    bool colorize = false;        // reserved display hint
    bool semantic = false;        // force the semantic formatter
};

/**
 * @brief Read options from a decoded options document
 *
 * Recognized keys: "format" (string), "ignoreMetadata", "ignoreOrder",
 * "colorize", "semantic" (booleans), "contextLines" (integer >= 0).
 * Unknown keys are ignored; absent keys keep the value from base.
 *
 * @param doc Mapping of option names to values
 * @param base Options to start from
 * @throws OptionsError if doc is not a mapping, a key has the wrong type,
 *         or "format" names an unknown format
 *
 * Example:
 * ```cpp
 * Value doc = {{"format", "json-patch"}, {"ignoreOrder", true}};
 * DiffOptions opts = options_from_value(doc);
 * // opts.format == DiffFormat::JsonPatch, opts.ignore_order == true
 * ```
 */
DiffOptions options_from_value(const Value& doc, DiffOptions base = {});

/**
 * @brief Settle the output format from command-line flags
 *
 * Precedence, lowest first: format, output (if non-empty), side_by_side,
 * semantic.
 *
 * @throws OptionsError if output names an unknown format
 */
DiffFormat resolve_format(DiffFormat format, const std::string& output,
                          bool side_by_side, bool semantic);

} // namespace structdiff

#endif // STRUCTDIFF_OPTIONS_HPP
