/**
 * @file TreeDiff.cpp
 * @brief Implementation of the recursive tree comparison
 */

#include "structdiff/TreeDiff.hpp"
#include "structdiff/DotPath.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace structdiff {

namespace {

void diff_into(const std::string& path, const Value& left, const Value& right,
               std::vector<Change>& out);

void diff_mappings(const std::string& path, const Value& left, const Value& right,
                   std::vector<Change>& out) {
    std::set<std::string> keys;
    for (auto it = left.begin(); it != left.end(); ++it) {
        keys.insert(it.key());
    }
    for (auto it = right.begin(); it != right.end(); ++it) {
        keys.insert(it.key());
    }

    for (const auto& key : keys) {
        std::string child = child_key_path(path, key);
        auto l = left.find(key);
        auto r = right.find(key);

        if (l == left.end()) {
            out.push_back(Change::add(std::move(child), *r));
        } else if (r == right.end()) {
            out.push_back(Change::remove(std::move(child), *l));
        } else {
            diff_into(child, *l, *r, out);
        }
    }
}

void diff_sequences(const std::string& path, const Value& left, const Value& right,
                    std::vector<Change>& out) {
    const size_t max_len = std::max(left.size(), right.size());

    for (size_t i = 0; i < max_len; ++i) {
        std::string child = child_index_path(path, i);

        if (i >= left.size()) {
            out.push_back(Change::add(std::move(child), right[i]));
        } else if (i >= right.size()) {
            out.push_back(Change::remove(std::move(child), left[i]));
        } else {
            diff_into(child, left[i], right[i], out);
        }
    }
}

void diff_into(const std::string& path, const Value& left, const Value& right,
               std::vector<Change>& out) {
    if (equivalent(left, right)) {
        return;
    }

    if (left.is_object() && right.is_object()) {
        diff_mappings(path, left, right, out);
        return;
    }

    if (left.is_array() && right.is_array()) {
        diff_sequences(path, left, right, out);
        return;
    }

    out.push_back(Change::replace(path, left, right));
}

} // namespace

std::vector<Change> compute_diff(const std::string& path,
                                 const Value& left, const Value& right) {
    std::vector<Change> changes;
    diff_into(path, left, right, changes);
    return changes;
}

} // namespace structdiff
