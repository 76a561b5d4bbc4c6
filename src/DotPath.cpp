/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path access into configuration values
 */

#include "locsync/DotPath.hpp"
#include "locsync/KeyPath.hpp"

namespace locsync {

const Value& get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        if (!current->is_object()) {
            throw TypeError(path, "object", type_name(*current));
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            throw KeyError(path, seg);
        }
        current = &*it;
    }
    return *current;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (const auto& seg : segments) {
        if (!current->is_object()) {
            *current = Value::object();
        }
        current = &(*current)[seg];
    }
    *current = value;
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        if (!current->is_object()) {
            return false;
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            return false;
        }
        current = &*it;
    }
    return true;
}

} // namespace locsync
