/**
 * @file Flatten.cpp
 * @brief Implementation of tree flattening
 */

#include "locsync/Flatten.hpp"

#include <utility>

namespace locsync {

void FlatIndex::insert(KeyPath path, Value value) {
    if (index_.count(path) > 0) {
        return;
    }
    index_.emplace(path, entries_.size());
    entries_.emplace_back(std::move(path), std::move(value));
}

bool FlatIndex::contains(const KeyPath& path) const {
    return index_.count(path) > 0;
}

const Value* FlatIndex::find(const KeyPath& path) const {
    auto it = index_.find(path);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

std::vector<KeyPath> FlatIndex::keys() const {
    std::vector<KeyPath> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

FlatIndex flatten(const Node& tree) {
    FlatIndex out;
    if (!tree.is_branch()) {
        return out;
    }

    std::vector<std::pair<KeyPath, const Node*>> stack;
    stack.emplace_back(KeyPath(), &tree);

    while (!stack.empty()) {
        auto [path, node] = std::move(stack.back());
        stack.pop_back();

        if (node->is_leaf()) {
            out.insert(std::move(path), node->value());
            continue;
        }

        // Reverse push keeps document order on pop
        const auto& members = node->members();
        for (auto it = members.rbegin(); it != members.rend(); ++it) {
            stack.emplace_back(path.child(it->key), &it->node);
        }
    }
    return out;
}

} // namespace locsync
