/**
 * @file Value.hpp
 * @brief Tree value type compared by the diff engine
 *
 * Uses nlohmann::json as the underlying value model. A decoded JSON, YAML
 * or TOML document is one of:
 * - Null
 * - Bool (true | false)
 * - Number (integer, unsigned or float; compared numerically)
 * - String (std::string, UTF-8)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...}, keys kept in sorted order)
 */

#ifndef STRUCTDIFF_VALUE_HPP
#define STRUCTDIFF_VALUE_HPP

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace structdiff {

/**
 * @brief Tagged tree value
 *
 * This is an alias for nlohmann::json. Dispatch on the node kind goes
 * through Value::value_t (see type_name()).
 *
 * Mapping keys are stored in a std::map, so iteration over a mapping is
 * always in sorted key order. This keeps diff output deterministic for a
 * fixed input.
 *
 * Equality (operator==) is structural and numeric across number
 * representations: Value(1) == Value(1.0). The differ uses equivalent(),
 * which additionally treats NaN as equal to NaN.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "float",
 *         "string", "sequence", "mapping", "binary")
 */
inline std::string type_name(const Value& val) {
    switch (val.type()) {
        case Value::value_t::null: return "null";
        case Value::value_t::boolean: return "boolean";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return "integer";
        case Value::value_t::number_float: return "float";
        case Value::value_t::string: return "string";
        case Value::value_t::array: return "sequence";
        case Value::value_t::object: return "mapping";
        case Value::value_t::binary: return "binary";
        case Value::value_t::discarded: return "discarded";
    }
    return "unknown";
}

/**
 * @brief Structural equality of two trees
 *
 * Same as operator== (numbers compare numerically across integer and
 * float), except that two NaN floats are equal. Every tree is therefore
 * equivalent to itself.
 */
inline bool equivalent(const Value& a, const Value& b) {
    if (a.is_number_float() && b.is_number_float()) {
        const double x = a.get<double>();
        const double y = b.get<double>();
        return x == y || (std::isnan(x) && std::isnan(y));
    }

    if (a.is_array() && b.is_array()) {
        return a.size() == b.size()
            && std::equal(a.begin(), a.end(), b.begin(),
                          [](const Value& l, const Value& r) { return equivalent(l, r); });
    }

    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) {
            return false;
        }
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !equivalent(*it, *other)) {
                return false;
            }
        }
        return true;
    }

    return a == b;
}

} // namespace structdiff

#endif // STRUCTDIFF_VALUE_HPP
