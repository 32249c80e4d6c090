/**
 * @file DotPath.cpp
 * @brief Implementation of path utilities
 */

#include "structdiff/DotPath.hpp"
#include <algorithm>

namespace structdiff {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    // Add final segment
    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

bool remove_by_dot(Value& data, const std::string& path) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        return false;
    }

    Value* current = &data;

    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current->is_object()) {
            return false;
        }
        auto it = current->find(segments[i]);
        if (it == current->end()) {
            return false;
        }
        current = &(*it);
    }

    if (!current->is_object()) {
        return false;
    }
    return current->erase(segments.back()) > 0;
}

std::string child_key_path(const std::string& parent, const std::string& key) {
    if (parent.empty()) {
        return key;
    }
    return parent + "." + key;
}

std::string child_index_path(const std::string& parent, std::size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

std::string to_patch_pointer(const std::string& path) {
    std::string pointer = "/" + path;
    std::replace(pointer.begin() + 1, pointer.end(), '.', '/');
    return pointer;
}

} // namespace structdiff
