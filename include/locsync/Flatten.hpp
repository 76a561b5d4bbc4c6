/**
 * @file Flatten.hpp
 * @brief Flatten a document tree into leaf paths
 */

#ifndef LOCSYNC_FLATTEN_HPP
#define LOCSYNC_FLATTEN_HPP

#include "locsync/KeyPath.hpp"
#include "locsync/Node.hpp"
#include "locsync/Value.hpp"

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace locsync {

/**
 * @brief Mapping from leaf path to leaf value
 *
 * Entries keep document (pre-order) enumeration order; lookups go through
 * a hash index. Only the key set is meaningful for comparison.
 */
class FlatIndex {
public:
    using Entry = std::pair<KeyPath, Value>;

    // Adds an entry; a path that is already present keeps its first value.
    void insert(KeyPath path, Value value);

    bool contains(const KeyPath& path) const;
    const Value* find(const KeyPath& path) const;

    const std::vector<Entry>& entries() const noexcept { return entries_; }
    std::vector<KeyPath> keys() const;

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<KeyPath, std::size_t, KeyPathHash> index_;
};

/**
 * @brief Flatten a tree into {path: leaf}
 *
 * Walks branches with an explicit stack. Arrays are leaves. Empty
 * branches contribute nothing, and a leaf root has no addressable keys.
 *
 * Example:
 * ```cpp
 * // {"a": {"b": "X"}, "c": [1, 2]}  →  a.b = "X", c = [1, 2]
 * ```
 */
FlatIndex flatten(const Node& tree);

} // namespace locsync

#endif // LOCSYNC_FLATTEN_HPP
