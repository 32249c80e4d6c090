/**
 * @file Differ.hpp
 * @brief Public entry point of the diff engine
 *
 * A Differ runs the whole pipeline for one pair of documents:
 * normalize both sides, compare, summarize, render.
 *
 * Example:
 * ```cpp
 * DiffOptions opts;
 * opts.format = DiffFormat::JsonPatch;
 * Differ differ(opts);
 *
 * Value left = {{"key", "old"}};
 * Value right = {{"key", "new"}};
 * DiffResult result = differ.compare(left, right, "a.json", "b.json");
 * // result.changes: one Replace at "key"
 * // result.patch: [{"op": "replace", "path": "/key", "value": "new"}]
 * ```
 */

#ifndef STRUCTDIFF_DIFFER_HPP
#define STRUCTDIFF_DIFFER_HPP

#include "structdiff/Change.hpp"
#include "structdiff/Options.hpp"
#include "structdiff/Value.hpp"
#include <string>
#include <utility>

namespace structdiff {

/**
 * @brief Stateless comparison facade configured by DiffOptions
 *
 * Every call allocates its own result; a const Differ may be shared
 * between threads.
 */
class Differ {
public:
    Differ() = default;
    explicit Differ(DiffOptions options) : options_(std::move(options)) {}

    const DiffOptions& options() const noexcept { return options_; }

    /**
     * @brief Compare two decoded documents
     *
     * @param left Old document
     * @param right New document
     * @param left_label Display name of the old document
     * @param right_label Display name of the new document
     * @return Result with changes, summary and rendered patch
     * @throws FormatError if the selected formatter fails; no partial
     *         result is returned
     */
    DiffResult compare(const Value& left, const Value& right,
                       const std::string& left_label,
                       const std::string& right_label) const;

    /**
     * @brief Load two files and compare them
     *
     * The file paths are used as labels.
     *
     * @throws DocumentLoadError naming the side ("left"/"right") that
     *         could not be loaded
     * @throws FormatError if rendering fails
     */
    DiffResult compare_files(const std::string& left_path,
                             const std::string& right_path) const;

private:
    DiffOptions options_;
};

} // namespace structdiff

#endif // STRUCTDIFF_DIFFER_HPP
