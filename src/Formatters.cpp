/**
 * @file Formatters.cpp
 * @brief Implementation of the four change set renderers
 */

#include "structdiff/Formatters.hpp"
#include "structdiff/DotPath.hpp"
#include "structdiff/Errors.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace structdiff {

// ============================================================================
// Shared helpers
// ============================================================================

std::string format_value(const Value& value) {
    // dump() quotes strings and writes containers compactly
    return value.dump(-1, ' ', false, Value::error_handler_t::replace);
}

std::string truncate(const std::string& text, std::size_t max_len) {
    if (text.size() <= max_len) {
        return text;
    }
    if (max_len < 3) {
        return text.substr(0, max_len);
    }
    return text.substr(0, max_len - 3) + "...";
}

namespace {

    const Value& old_of(const Change& change) {
        static const Value null_value;
        return change.old_value ? *change.old_value : null_value;
    }

    const Value& new_of(const Change& change) {
        static const Value null_value;
        return change.new_value ? *change.new_value : null_value;
    }

    /**
     * @brief "path: value" text used by unified and side-by-side output
     */
    std::string entry(const std::string& path, const Value& value) {
        return path + ": " + format_value(value);
    }

} // anonymous namespace

// ============================================================================
// Unified
// ============================================================================

std::string UnifiedFormatter::format(const DiffResult& result) const {
    if (!result.has_changes) {
        return "";
    }

    std::ostringstream oss;
    oss << "--- " << result.left_label << "\n";
    oss << "+++ " << result.right_label << "\n";

    for (const auto& change : result.changes) {
        switch (change.operation) {
            case ChangeOperation::Add:
                oss << "+ " << entry(change.path, new_of(change)) << "\n";
                break;
            case ChangeOperation::Remove:
                oss << "- " << entry(change.path, old_of(change)) << "\n";
                break;
            case ChangeOperation::Replace:
                oss << "- " << entry(change.path, old_of(change)) << "\n";
                oss << "+ " << entry(change.path, new_of(change)) << "\n";
                break;
        }
    }

    return oss.str();
}

// ============================================================================
// Side-by-side
// ============================================================================

std::string SideBySideFormatter::format(const DiffResult& result) const {
    if (!result.has_changes) {
        return "";
    }

    const int col_width = width_ / 2;
    const std::size_t cell = static_cast<std::size_t>(std::max(col_width - 3, 0));
    const std::size_t rule = static_cast<std::size_t>(std::max(col_width - 1, 0));

    std::ostringstream oss;
    oss << std::left << std::setw(static_cast<int>(cell)) << result.left_label
        << " | " << result.right_label << "\n";
    oss << std::string(rule, '-') << "|" << std::string(rule, '-') << "\n";

    for (const auto& change : result.changes) {
        std::string left;
        std::string right;

        switch (change.operation) {
            case ChangeOperation::Add:
                right = entry(change.path, new_of(change));
                break;
            case ChangeOperation::Remove:
                left = entry(change.path, old_of(change));
                break;
            case ChangeOperation::Replace:
                left = entry(change.path, old_of(change));
                right = entry(change.path, new_of(change));
                break;
        }

        oss << std::left << std::setw(static_cast<int>(cell)) << truncate(left, cell)
            << " | " << truncate(right, cell) << "\n";
    }

    return oss.str();
}

// ============================================================================
// JSON-Patch-like
// ============================================================================

std::string JsonPatchFormatter::format(const DiffResult& result) const {
    if (!result.has_changes) {
        return "[]";
    }

    Value patch = Value::array();
    for (const auto& change : result.changes) {
        Value op = {
            {"op", to_string(change.operation)},
            {"path", to_patch_pointer(change.path)}
        };
        if (change.operation != ChangeOperation::Remove) {
            op["value"] = new_of(change);
        }
        patch.push_back(std::move(op));
    }

    try {
        return patch.dump(2);
    } catch (const Value::type_error& e) {
        throw FormatError(name(), e.what());
    }
}

// ============================================================================
// Semantic
// ============================================================================

std::string SemanticFormatter::format(const DiffResult& result) const {
    if (!result.has_changes) {
        return "No changes detected\n";
    }

    std::ostringstream oss;
    oss << "Comparing: " << result.left_label << " vs " << result.right_label << "\n\n";
    oss << "Changes:\n";

    for (const auto& change : result.changes) {
        switch (change.operation) {
            case ChangeOperation::Add:
                oss << "  + " << change.path << ": " << format_value(new_of(change)) << "\n";
                break;
            case ChangeOperation::Remove:
                oss << "  - " << change.path << ": " << format_value(old_of(change)) << "\n";
                break;
            case ChangeOperation::Replace:
                oss << "  ~ " << change.path << ": " << format_value(old_of(change))
                    << " \xE2\x86\x92 " << format_value(new_of(change)) << "\n";
                break;
        }
    }

    const auto& s = result.summary;
    oss << "\nSummary: " << s.modified << " modified, " << s.added << " added, "
        << s.removed << " removed\n";
    oss << "Impact: " << to_string(s.impact) << "\n";

    return oss.str();
}

// ============================================================================
// Selection
// ============================================================================

std::unique_ptr<Formatter> make_formatter(const DiffOptions& options) {
    if (options.semantic) {
        return std::make_unique<SemanticFormatter>();
    }

    switch (options.format) {
        case DiffFormat::SideBySide:
            return std::make_unique<SideBySideFormatter>(
                SideBySideFormatter::kDefaultWidth, options.colorize);
        case DiffFormat::JsonPatch:
            return std::make_unique<JsonPatchFormatter>();
        case DiffFormat::Semantic:
            return std::make_unique<SemanticFormatter>();
        case DiffFormat::Unified:
            break;
    }
    return std::make_unique<UnifiedFormatter>(options.context_lines, options.colorize);
}

} // namespace structdiff
