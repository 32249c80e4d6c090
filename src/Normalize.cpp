/**
 * @file Normalize.cpp
 * @brief Implementation of pre-diff normalization
 */

#include "structdiff/Normalize.hpp"
#include "structdiff/DotPath.hpp"
#include "structdiff/Logging.hpp"

#include <algorithm>

namespace structdiff {

Value deep_copy(const Value& value) {
    try {
        Value copy = Value::parse(value.dump());
        if (copy == value) {
            return copy;
        }
        logger()->warn("deep copy of {} value did not round-trip; "
                       "continuing on the original", type_name(value));
    } catch (const Value::exception& e) {
        logger()->warn("deep copy of {} value failed ({}); "
                       "continuing on the original", type_name(value), e.what());
    }
    return value;
}

int remove_metadata_fields(Value& data) {
    int removed = 0;
    for (const char* path : kMetadataPaths) {
        if (remove_by_dot(data, path)) {
            ++removed;
        }
    }
    return removed;
}

bool has_stable_key(const Value& sequence) {
    if (!sequence.is_array() || sequence.empty()) {
        return false;
    }

    return std::all_of(sequence.begin(), sequence.end(), [](const Value& item) {
        if (!item.is_object()) {
            return false;
        }
        return std::any_of(kStableKeys.begin(), kStableKeys.end(),
                           [&item](const char* key) { return item.contains(key); });
    });
}

namespace {

bool value_less(const Value& a, const Value& b) {
    if (a.is_string() && b.is_string()) {
        return a.get_ref<const std::string&>() < b.get_ref<const std::string&>();
    }
    if (a.is_number() && b.is_number()) {
        return a.get<double>() < b.get<double>();
    }
    return a.dump(-1, ' ', false, Value::error_handler_t::replace)
         < b.dump(-1, ' ', false, Value::error_handler_t::replace);
}

} // namespace

bool stable_key_less(const Value& a, const Value& b) {
    if (!a.is_object() || !b.is_object()) {
        return false;
    }

    for (const char* key : kStableKeys) {
        auto ia = a.find(key);
        auto ib = b.find(key);
        if (ia != a.end() && ib != b.end()) {
            return value_less(*ia, *ib);
        }
    }
    return false;
}

void sort_stable_arrays(Value& data) {
    switch (data.type()) {
        case Value::value_t::object:
            for (auto& child : data) {
                sort_stable_arrays(child);
            }
            break;

        case Value::value_t::array:
            if (has_stable_key(data)) {
                // stable_sort: elements without a common key stay in order
                auto& items = data.get_ref<Value::array_t&>();
                std::stable_sort(items.begin(), items.end(), stable_key_less);
            }
            for (auto& item : data) {
                sort_stable_arrays(item);
            }
            break;

        case Value::value_t::null:
        case Value::value_t::boolean:
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
        case Value::value_t::string:
        case Value::value_t::binary:
        case Value::value_t::discarded:
            break;
    }
}

Value normalize(const Value& value, bool ignore_metadata, bool ignore_order) {
    Value normalized = deep_copy(value);

    if (ignore_metadata) {
        int removed = remove_metadata_fields(normalized);
        logger()->debug("stripped {} metadata field(s)", removed);
    }

    if (ignore_order) {
        sort_stable_arrays(normalized);
    }

    return normalized;
}

} // namespace structdiff
