/**
 * @file Differ.cpp
 * @brief Implementation of the comparison facade
 */

#include "structdiff/Differ.hpp"
#include "structdiff/Errors.hpp"
#include "structdiff/Formatters.hpp"
#include "structdiff/Loader.hpp"
#include "structdiff/Logging.hpp"
#include "structdiff/Normalize.hpp"
#include "structdiff/Summary.hpp"
#include "structdiff/TreeDiff.hpp"

namespace structdiff {

DiffResult Differ::compare(const Value& left, const Value& right,
                           const std::string& left_label,
                           const std::string& right_label) const {
    const Value left_norm = normalize(left, options_.ignore_metadata, options_.ignore_order);
    const Value right_norm = normalize(right, options_.ignore_metadata, options_.ignore_order);

    DiffResult result;
    result.changes = compute_diff("", left_norm, right_norm);
    result.has_changes = !result.changes.empty();
    result.summary = summarize(result.changes);
    result.left_label = left_label;
    result.right_label = right_label;

    logger()->debug("{} vs {}: {} added, {} removed, {} modified (impact {})",
                    left_label, right_label, result.summary.added,
                    result.summary.removed, result.summary.modified,
                    to_string(result.summary.impact));

    auto formatter = make_formatter(options_);
    try {
        result.patch = formatter->format(result);
    } catch (const FormatError&) {
        throw;
    } catch (const std::exception& e) {
        throw FormatError(formatter->name(), e.what());
    }

    return result;
}

namespace {

    Value load_side(const std::string& side, const std::string& path) {
        try {
            return load_document_file(path);
        } catch (const DiffError& e) {
            throw DocumentLoadError(side, path, e.what());
        }
    }

} // anonymous namespace

DiffResult Differ::compare_files(const std::string& left_path,
                                 const std::string& right_path) const {
    const Value left = load_side("left", left_path);
    const Value right = load_side("right", right_path);
    return compare(left, right, left_path, right_path);
}

} // namespace structdiff
