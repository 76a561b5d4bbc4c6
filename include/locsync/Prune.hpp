/**
 * @file Prune.hpp
 * @brief Remove extraneous keys and collapse emptied branches
 */

#ifndef LOCSYNC_PRUNE_HPP
#define LOCSYNC_PRUNE_HPP

#include "locsync/KeyPath.hpp"
#include "locsync/Node.hpp"

#include <vector>

namespace locsync {

/**
 * @brief Rebuild a tree without the given paths
 *
 * - A member matching a full path is dropped (with its whole subtree).
 * - A branch with matching descendants is pruned recursively and dropped
 *   if nothing is left in it.
 * - Everything else is copied unchanged.
 *
 * Example:
 * ```cpp
 * // {"a": {"b": 1}, "c": 2} without [a.b] → {"c": 2}
 * ```
 */
Node remove_extraneous_keys(const Node& tree, const std::vector<KeyPath>& extraneous);

/**
 * @brief Drop every empty branch below the root
 *
 * Branches that only become empty because their children were dropped
 * are removed as well. The root itself is always kept.
 */
Node collapse_empty_branches(const Node& tree);

} // namespace locsync

#endif // LOCSYNC_PRUNE_HPP
