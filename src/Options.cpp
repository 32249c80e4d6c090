/**
 * @file Options.cpp
 * @brief Implementation of option parsing
 */

#include "structdiff/Options.hpp"
#include "structdiff/Errors.hpp"

#include <limits>

namespace structdiff {

std::string to_string(DiffFormat format) {
    switch (format) {
        case DiffFormat::Unified: return "unified";
        case DiffFormat::SideBySide: return "side-by-side";
        case DiffFormat::JsonPatch: return "json-patch";
        case DiffFormat::Semantic: return "semantic";
    }
    return "unknown";
}

DiffFormat parse_format(const std::string& name) {
    if (name == "unified") return DiffFormat::Unified;
    if (name == "side-by-side") return DiffFormat::SideBySide;
    if (name == "json-patch") return DiffFormat::JsonPatch;
    if (name == "semantic") return DiffFormat::Semantic;
    throw OptionsError("Unknown diff format: '" + name +
                       "' (expected unified, side-by-side, json-patch or semantic)");
}

namespace {

    /**
     * @brief Read an optional boolean option
     */
    void read_bool(const Value& doc, const char* key, bool& out) {
        auto it = doc.find(key);
        if (it == doc.end()) return;
        if (!it->is_boolean()) {
            throw OptionsError(std::string("Option '") + key +
                               "' must be a boolean, got " + type_name(*it));
        }
        out = it->get<bool>();
    }

} // anonymous namespace

DiffOptions options_from_value(const Value& doc, DiffOptions base) {
    if (!doc.is_object()) {
        throw OptionsError("Options document must be a mapping, got " + type_name(doc));
    }

    DiffOptions opts = base;

    auto fmt = doc.find("format");
    if (fmt != doc.end()) {
        if (!fmt->is_string()) {
            throw OptionsError("Option 'format' must be a string, got " + type_name(*fmt));
        }
        opts.format = parse_format(fmt->get<std::string>());
    }

    read_bool(doc, "ignoreMetadata", opts.ignore_metadata);
    read_bool(doc, "ignoreOrder", opts.ignore_order);
    read_bool(doc, "colorize", opts.colorize);
    read_bool(doc, "semantic", opts.semantic);

    auto ctx = doc.find("contextLines");
    if (ctx != doc.end()) {
        if (!ctx->is_number_integer() || ctx->get<long long>() < 0 ||
            ctx->get<long long>() > std::numeric_limits<int>::max()) {
            throw OptionsError("Option 'contextLines' must be a non-negative integer");
        }
        opts.context_lines = ctx->get<int>();
    }

    return opts;
}

DiffFormat resolve_format(DiffFormat format, const std::string& output,
                          bool side_by_side, bool semantic) {
    DiffFormat resolved = format;
    if (!output.empty()) {
        resolved = parse_format(output);
    }
    if (side_by_side) {
        resolved = DiffFormat::SideBySide;
    }
    if (semantic) {
        resolved = DiffFormat::Semantic;
    }
    return resolved;
}

} // namespace structdiff
