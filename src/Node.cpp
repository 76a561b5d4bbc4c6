/**
 * @file Node.cpp
 * @brief Implementation of the document tree
 */

#include "locsync/Node.hpp"
#include "locsync/Errors.hpp"

#include <algorithm>
#include <utility>

namespace locsync {

Node::Node() : kind_(Kind::Branch) {}

Node Node::leaf(Value value) {
    Node n;
    n.kind_ = Kind::Leaf;
    n.value_ = std::move(value);
    return n;
}

Node Node::branch() {
    return Node();
}

Node Node::from_value(const Value& value, std::size_t max_depth) {
    if (!value.is_object()) {
        return leaf(value);
    }
    if (max_depth == 0) {
        throw SyncError("document nesting exceeds " + std::to_string(kMaxTreeDepth) + " levels");
    }

    Node n;
    n.members_.reserve(value.size());
    for (auto it = value.begin(); it != value.end(); ++it) {
        n.members_.push_back(Member{it.key(), from_value(it.value(), max_depth - 1)});
    }
    return n;
}

Value Node::to_value() const {
    if (is_leaf()) {
        return value_;
    }
    Value obj = Value::object();
    for (const auto& m : members_) {
        obj[m.key] = m.node.to_value();
    }
    return obj;
}

Node::Kind Node::kind() const noexcept {
    return kind_;
}

bool Node::is_leaf() const noexcept {
    return kind_ == Kind::Leaf;
}

bool Node::is_branch() const noexcept {
    return kind_ == Kind::Branch;
}

const Value& Node::value() const {
    if (!is_leaf()) {
        throw TypeError("", "leaf", "branch");
    }
    return value_;
}

const Node::Members& Node::members() const {
    if (!is_branch()) {
        throw TypeError("", "branch", "leaf");
    }
    return members_;
}

std::size_t Node::size() const noexcept {
    return members_.size();
}

bool Node::empty() const noexcept {
    return is_branch() && members_.empty();
}

const Node* Node::find(const std::string& key) const {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [&](const Member& m) { return m.key == key; });
    return it == members_.end() ? nullptr : &it->node;
}

Node* Node::find(const std::string& key) {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [&](const Member& m) { return m.key == key; });
    return it == members_.end() ? nullptr : &it->node;
}

bool Node::contains(const std::string& key) const {
    return find(key) != nullptr;
}

Node& Node::set(const std::string& key, Node child) {
    if (!is_branch()) {
        throw TypeError(key, "branch", "leaf");
    }
    if (Node* existing = find(key)) {
        *existing = std::move(child);
        return *existing;
    }
    members_.push_back(Member{key, std::move(child)});
    return members_.back().node;
}

void Node::append(std::string key, Node child) {
    if (!is_branch()) {
        throw TypeError(key, "branch", "leaf");
    }
    members_.push_back(Member{std::move(key), std::move(child)});
}

bool Node::erase(const std::string& key) {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [&](const Member& m) { return m.key == key; });
    if (it == members_.end()) {
        return false;
    }
    members_.erase(it);
    return true;
}

bool operator==(const Node& a, const Node& b) {
    if (a.kind_ != b.kind_) {
        return false;
    }
    if (a.is_leaf()) {
        return a.value_ == b.value_;
    }
    if (a.members_.size() != b.members_.size()) {
        return false;
    }
    // Mapping comparison: member order is irrelevant
    for (const auto& m : a.members_) {
        const Node* other = b.find(m.key);
        if (!other || !(m.node == *other)) {
            return false;
        }
    }
    return true;
}

} // namespace locsync
