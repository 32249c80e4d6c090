/**
 * @file Loader.cpp
 * @brief Document loading implementation
 *
 * - JSON files (using nlohmann::json)
 * - YAML files (using yaml-cpp)
 * - TOML files (using toml++)
 */

#include "structdiff/Loader.hpp"
#include "structdiff/Errors.hpp"
#include "structdiff/Logging.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace structdiff {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Value parse_json_text(const std::string& path, const std::string& content) {
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(path, e.what());
    }
}

/**
 * @brief Convert a yaml-cpp node to a Value.
 */
Value yaml_node_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return Value(nullptr);

        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();

            // Quoted scalars and explicit !!str are always strings
            if (node.Tag() == "!" || node.Tag() == "tag:yaml.org,2002:str") {
                return Value(text);
            }

            const std::string lower = to_lower(text);
            if (lower == "true") return Value(true);
            if (lower == "false") return Value(false);

            long long i = 0;
            if (YAML::convert<long long>::decode(node, i)) {
                return Value(static_cast<std::int64_t>(i));
            }
            unsigned long long u = 0;
            if (YAML::convert<unsigned long long>::decode(node, u)) {
                return Value(static_cast<std::uint64_t>(u));
            }
            double d = 0.0;
            if (YAML::convert<double>::decode(node, d)) {
                return Value(d);
            }
            return Value(text);
        }

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& elem : node) {
                arr.push_back(yaml_node_to_json(elem));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                obj[it->first.as<std::string>()] = yaml_node_to_json(it->second);
            }
            return obj;
        }
    }
    return Value(nullptr);
}

Value parse_yaml_text(const std::string& path, const std::string& content) {
    try {
        return yaml_node_to_json(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        throw ParseError(path, e.what());
    }
}

/**
 * @brief Convert toml++ value to nlohmann::json.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Single-format loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    logger()->debug("loading {} as JSON", path);
    return parse_json_text(path, read_file(path));
}

Value load_yaml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    logger()->debug("loading {} as YAML", path);
    return parse_yaml_text(path, read_file(path));
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    logger()->debug("loading {} as TOML", path);

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw ParseError(path, details.str());
    }

    return toml_value_to_json(table);
}

// ============================================================================
// Auto-detect
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_document_file(const std::string& path) {
    if (path == "-") {
        throw ParseError(path, "reading from stdin is not supported");
    }

    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);

    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".yaml" || ext == ".yml") {
        return load_yaml_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }

    // Unknown extension: YAML first, then JSON
    logger()->debug("loading {} (format by content)", path);
    const std::string content = read_file(path);
    try {
        return parse_yaml_text(path, content);
    } catch (const ParseError&) {
        logger()->debug("{} is not YAML, trying JSON", path);
    }
    try {
        return parse_json_text(path, content);
    } catch (const ParseError&) {
        throw ParseError(path, "file is not valid YAML or JSON");
    }
}

} // namespace structdiff
