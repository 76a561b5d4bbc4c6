/**
 * @file Inject.cpp
 * @brief Implementation of placeholder injection
 */

#include "locsync/Inject.hpp"
#include "locsync/Errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace locsync {

std::string value_text(const Value& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "null";
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        // 3.0 renders as "3"
        if (std::isfinite(d) && std::trunc(d) == d &&
            std::fabs(d) < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return std::to_string(static_cast<std::int64_t>(d));
        }
        return value.dump();
    }
    if (value.is_array()) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& elem : value) {
            if (!first) oss << ',';
            first = false;
            if (!elem.is_null()) {
                oss << value_text(elem);
            }
        }
        return oss.str();
    }
    // booleans, integers, objects nested in arrays
    return value.dump();
}

std::string placeholder_text(const Value& reference_value, const std::string& prefix) {
    return prefix + value_text(reference_value);
}

Node add_missing_keys(Node tree,
                      const std::vector<KeyPath>& missing,
                      const FlatIndex& reference,
                      const std::string& prefix) {
    if (!tree.is_branch()) {
        tree = Node::branch();
    }

    for (const auto& path : missing) {
        if (path.empty()) {
            continue;
        }
        const Value* reference_value = reference.find(path);
        if (!reference_value) {
            throw KeyError(path.str(), "not present in the reference document");
        }

        const auto& segments = path.segments();
        Node* current = &tree;
        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            Node* next = current->find(segments[i]);
            if (!next || !next->is_branch()) {
                // A leaf cannot coexist with a reference branch at this position
                next = &current->set(segments[i], Node::branch());
            }
            current = next;
        }

        // An empty branch carries no keys and counts as absent
        const Node* existing = current->find(path.back());
        if (!existing || existing->empty()) {
            current->set(path.back(), Node::leaf(placeholder_text(*reference_value, prefix)));
        }
    }

    return tree;
}

} // namespace locsync
