/**
 * @file Prune.cpp
 * @brief Implementation of extraneous-key removal
 */

#include "locsync/Prune.hpp"

#include <map>
#include <set>
#include <string>

namespace locsync {

namespace {

Node prune_branch(const Node& branch, const std::vector<KeyPath>& paths) {
    // Group the paths by their first segment
    std::set<std::string> dropped;
    std::map<std::string, std::vector<KeyPath>> nested;
    for (const auto& path : paths) {
        if (path.empty()) {
            continue;
        }
        if (path.size() == 1) {
            dropped.insert(path.front());
        } else {
            nested[path.front()].push_back(path.suffix(1));
        }
    }

    // Member keys are unique, so children are appended as-is
    Node result = Node::branch();
    for (const auto& member : branch.members()) {
        if (dropped.count(member.key) > 0) {
            continue;
        }

        auto it = nested.find(member.key);
        if (it != nested.end() && member.node.is_branch()) {
            Node cleaned = prune_branch(member.node, it->second);
            if (!cleaned.empty()) {
                result.append(member.key, std::move(cleaned));
            }
            continue;
        }

        result.append(member.key, member.node);
    }
    return result;
}

Node collapse_branch(const Node& branch) {
    Node result = Node::branch();
    for (const auto& member : branch.members()) {
        if (member.node.is_leaf()) {
            result.append(member.key, member.node);
            continue;
        }
        Node collapsed = collapse_branch(member.node);
        if (!collapsed.empty()) {
            result.append(member.key, std::move(collapsed));
        }
    }
    return result;
}

} // namespace

Node remove_extraneous_keys(const Node& tree, const std::vector<KeyPath>& extraneous) {
    if (!tree.is_branch() || extraneous.empty()) {
        return tree;
    }
    return prune_branch(tree, extraneous);
}

Node collapse_empty_branches(const Node& tree) {
    if (!tree.is_branch()) {
        return tree;
    }
    return collapse_branch(tree);
}

} // namespace locsync
