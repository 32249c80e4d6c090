/**
 * @file Formatters.hpp
 * @brief Text renderings of a DiffResult
 *
 * Four independent formatters share one contract: format(result) returns
 * the report text, or a format-specific sentinel when the result has no
 * changes:
 * - UnifiedFormatter: ""
 * - SideBySideFormatter: ""
 * - JsonPatchFormatter: "[]"
 * - SemanticFormatter: "No changes detected\n"
 */

#ifndef STRUCTDIFF_FORMATTERS_HPP
#define STRUCTDIFF_FORMATTERS_HPP

#include "structdiff/Change.hpp"
#include "structdiff/Options.hpp"
#include "structdiff/Value.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace structdiff {

/**
 * @brief Render a value for display
 *
 * Strings are JSON-quoted, sequences and mappings are compact JSON,
 * anything else is its JSON scalar text (42, 3.5, true, null). Invalid
 * UTF-8 is replaced, so this never throws.
 */
std::string format_value(const Value& value);

/**
 * @brief Cut text to at most max_len bytes, ending in "..." when cut
 */
std::string truncate(const std::string& text, std::size_t max_len);

/**
 * @brief Renderer interface
 */
class Formatter {
public:
    virtual ~Formatter() = default;

    /**
     * @brief Render the change set of a result
     * @throws FormatError if a value cannot be rendered
     */
    virtual std::string format(const DiffResult& result) const = 0;

    /// Format name as accepted by parse_format()
    virtual std::string name() const = 0;
};

/**
 * @brief "--- left" / "+++ right" header, then +/- lines per change
 *
 * ```
 * --- a.json
 * +++ b.json
 * - key: "old"
 * + key: "new"
 * ```
 */
class UnifiedFormatter : public Formatter {
public:
    UnifiedFormatter(int context_lines = 3, bool colorize = false)
        : context_lines_(context_lines), colorize_(colorize) {}

    std::string format(const DiffResult& result) const override;
    std::string name() const override { return "unified"; }

    int context_lines() const noexcept { return context_lines_; }
    bool colorize() const noexcept { return colorize_; }

private:
    int context_lines_;
    bool colorize_;
};

/**
 * @brief Two fixed-width columns, old on the left, new on the right
 *
 * Each column is width/2 wide; cell text is truncated to fit.
 */
class SideBySideFormatter : public Formatter {
public:
    static constexpr int kDefaultWidth = 120;

    explicit SideBySideFormatter(int width = kDefaultWidth, bool colorize = false)
        : width_(width), colorize_(colorize) {}

    std::string format(const DiffResult& result) const override;
    std::string name() const override { return "side-by-side"; }

    int width() const noexcept { return width_; }
    bool colorize() const noexcept { return colorize_; }

private:
    int width_;
    bool colorize_;
};

/**
 * @brief JSON array of {"op", "path", "value"} objects
 *
 * Paths go through to_patch_pointer(); "value" is omitted for removals.
 * Close to RFC 6902 in shape only: keys containing dots are not escaped
 * and sequence indices keep their brackets.
 */
class JsonPatchFormatter : public Formatter {
public:
    std::string format(const DiffResult& result) const override;
    std::string name() const override { return "json-patch"; }
};

/**
 * @brief Prose report with a trailing summary and impact line
 */
class SemanticFormatter : public Formatter {
public:
    std::string format(const DiffResult& result) const override;
    std::string name() const override { return "semantic"; }
};

/**
 * @brief Pick the formatter for a set of options
 *
 * options.semantic forces SemanticFormatter; otherwise options.format
 * decides.
 */
std::unique_ptr<Formatter> make_formatter(const DiffOptions& options);

} // namespace structdiff

#endif // STRUCTDIFF_FORMATTERS_HPP
