/**
 * @file Change.cpp
 * @brief Change model helpers
 */

#include "structdiff/Change.hpp"
#include "structdiff/Errors.hpp"

#include <utility>

namespace structdiff {

std::string to_string(ChangeOperation op) {
    switch (op) {
        case ChangeOperation::Add: return "add";
        case ChangeOperation::Remove: return "remove";
        case ChangeOperation::Replace: return "replace";
    }
    return "unknown";
}

std::string to_string(ImpactLevel level) {
    switch (level) {
        case ImpactLevel::Low: return "low";
        case ImpactLevel::Medium: return "medium";
        case ImpactLevel::High: return "high";
        case ImpactLevel::Critical: return "critical";
    }
    return "unknown";
}

ImpactLevel parse_impact(const std::string& name) {
    if (name == "low") return ImpactLevel::Low;
    if (name == "medium") return ImpactLevel::Medium;
    if (name == "high") return ImpactLevel::High;
    if (name == "critical") return ImpactLevel::Critical;
    throw OptionsError("Unknown impact level: '" + name +
                       "' (expected low, medium, high or critical)");
}

Change Change::add(std::string path, Value new_value) {
    Change c;
    c.path = std::move(path);
    c.operation = ChangeOperation::Add;
    c.new_value = std::move(new_value);
    return c;
}

Change Change::remove(std::string path, Value old_value) {
    Change c;
    c.path = std::move(path);
    c.operation = ChangeOperation::Remove;
    c.old_value = std::move(old_value);
    return c;
}

Change Change::replace(std::string path, Value old_value, Value new_value) {
    Change c;
    c.path = std::move(path);
    c.operation = ChangeOperation::Replace;
    c.old_value = std::move(old_value);
    c.new_value = std::move(new_value);
    return c;
}

bool operator==(const Change& a, const Change& b) {
    return a.path == b.path
        && a.operation == b.operation
        && a.old_value == b.old_value
        && a.new_value == b.new_value
        && a.context == b.context;
}

bool operator!=(const Change& a, const Change& b) {
    return !(a == b);
}

} // namespace structdiff
