/**
 * @file Errors.hpp
 * @brief Exception types for structdiff
 *
 * Error taxonomy:
 * - DiffError: Base class
 * - FileNotFoundError: Input document not found
 * - ParseError: Input document is not valid JSON/YAML/TOML
 * - DocumentLoadError: One side of a file comparison could not be loaded
 * - FormatError: A formatter could not render the change set
 * - OptionsError: Invalid diff options
 *
 * Normalization never raises: a failed deep copy degrades to the original
 * value, and removing a path that does not exist is a no-op.
 */

#ifndef STRUCTDIFF_ERRORS_HPP
#define STRUCTDIFF_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace structdiff {

/**
 * @brief Base class for all structdiff exceptions
 */
class DiffError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input document not found
 */
class FileNotFoundError : public DiffError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : DiffError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Input document syntax error (JSON/YAML/TOML)
 */
class ParseError : public DiffError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ParseError(std::string file, std::string details)
        : DiffError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief One side of a file comparison failed to load
 *
 * Wraps FileNotFoundError / ParseError raised by the loader so the caller
 * can tell which input was at fault.
 */
class DocumentLoadError : public DiffError {
public:
    /**
     * @brief Construct with side, path and cause
     * @param side "left" or "right"
     * @param path Path of the document that failed
     * @param details Message of the underlying error
     */
    DocumentLoadError(std::string side, std::string path, std::string details)
        : DiffError("failed to parse " + side + " file: " + details)
        , side_(std::move(side))
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the side that failed ("left" or "right")
     */
    const std::string& side() const noexcept {
        return side_;
    }

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string side_;
    std::string path_;
    std::string details_;
};

/**
 * @brief A formatter could not render the change set
 *
 * Raised e.g. when a value cannot be encoded as JSON. The whole comparison
 * fails; no partial patch is returned.
 */
class FormatError : public DiffError {
public:
    /**
     * @brief Construct with formatter name and error details
     * @param formatter Name of the formatter (e.g. "json-patch")
     * @param details What could not be rendered
     */
    FormatError(std::string formatter, std::string details)
        : DiffError("failed to format diff (" + formatter + "): " + details)
        , formatter_(std::move(formatter))
        , details_(std::move(details))
    {}

    const std::string& formatter() const noexcept {
        return formatter_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string formatter_;
    std::string details_;
};

/**
 * @brief Invalid diff options (unknown format name, mistyped option)
 */
class OptionsError : public DiffError {
public:
    using DiffError::DiffError;
};

} // namespace structdiff

#endif // STRUCTDIFF_ERRORS_HPP
