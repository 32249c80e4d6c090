/**
 * @file Loader.hpp
 * @brief Loading documents from files into tree values
 *
 * Supported formats:
 * - JSON files (using nlohmann::json)
 * - YAML files (using yaml-cpp)
 * - TOML files (using toml++)
 */

#ifndef STRUCTDIFF_LOADER_HPP
#define STRUCTDIFF_LOADER_HPP

#include "structdiff/Value.hpp"
#include <string>

namespace structdiff {

// ============================================================================
// Single-format loading
// ============================================================================

/**
 * @brief Load a document from a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a document from a YAML file.
 *
 * Only the first document of a multi-document stream is read. Scalar
 * typing:
 * - quoted scalars are strings
 * - null, ~ and empty values are null
 * - true/false (any case) are booleans
 * - integers, then floats, if the whole scalar converts
 * - everything else is a string
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if YAML syntax is invalid
 */
Value load_yaml_file(const std::string& path);

/**
 * @brief Load a document from a TOML file.
 *
 * Tables map to mappings, arrays to sequences. Dates and times become
 * their TOML text.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

// ============================================================================
// Auto-detect
// ============================================================================

/**
 * @brief Load a document, picking the format from the file extension.
 *
 * - ".json" → JSON, ".yaml"/".yml" → YAML, ".toml" → TOML
 * - any other extension: YAML first, then JSON
 * - "-" (stdin) is not supported
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the content cannot be parsed
 */
Value load_document_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace structdiff

#endif // STRUCTDIFF_LOADER_HPP
