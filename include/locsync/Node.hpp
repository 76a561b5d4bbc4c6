/**
 * @file Node.hpp
 * @brief Tagged-union document tree
 *
 * A Node is either
 * - a Leaf holding an opaque Value (string, number, boolean, null, or an
 *   array, which is never descended into), or
 * - a Branch holding named children in insertion order.
 *
 * Member order only matters when the tree is written back; equality
 * compares branches as mappings.
 */

#ifndef LOCSYNC_NODE_HPP
#define LOCSYNC_NODE_HPP

#include "locsync/Value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace locsync {

/// Deepest nesting accepted when converting a Value into a Node.
constexpr std::size_t kMaxTreeDepth = 256;

class Node {
public:
    enum class Kind { Leaf, Branch };

    struct Member;
    using Members = std::vector<Member>;

    // Empty branch
    Node();

    static Node leaf(Value value);
    static Node branch();

    /**
     * @brief Convert a parsed value into a tree
     *
     * Objects become branches, everything else (arrays included) becomes
     * a leaf.
     *
     * @throws SyncError if nesting exceeds max_depth
     */
    static Node from_value(const Value& value, std::size_t max_depth = kMaxTreeDepth);

    // Convert back into an ordered value for serialization
    Value to_value() const;

    Kind kind() const noexcept;
    bool is_leaf() const noexcept;
    bool is_branch() const noexcept;

    /**
     * @brief Leaf payload
     * @throws TypeError if this node is a branch
     */
    const Value& value() const;

    /**
     * @brief Branch children in insertion order
     * @throws TypeError if this node is a leaf
     */
    const Members& members() const;

    // Number of direct children (0 for a leaf)
    std::size_t size() const noexcept;
    // True for a branch without children; leaves are never empty
    bool empty() const noexcept;

    const Node* find(const std::string& key) const;
    Node* find(const std::string& key);
    bool contains(const std::string& key) const;

    /**
     * @brief Insert or replace a child
     *
     * A replaced child keeps its position; new children are appended.
     *
     * @return Reference to the stored child
     * @throws TypeError if this node is a leaf
     */
    Node& set(const std::string& key, Node child);

    /**
     * @brief Append a child without looking for an existing key
     *
     * The caller guarantees that key is not present yet.
     *
     * @throws TypeError if this node is a leaf
     */
    void append(std::string key, Node child);

    /**
     * @brief Remove a child
     * @return true if the key was present
     */
    bool erase(const std::string& key);

    friend bool operator==(const Node& a, const Node& b);
    friend bool operator!=(const Node& a, const Node& b) { return !(a == b); }

private:
    Kind kind_;
    Value value_;
    Members members_;
};

struct Node::Member {
    std::string key;
    Node node;
};

} // namespace locsync

#endif // LOCSYNC_NODE_HPP
