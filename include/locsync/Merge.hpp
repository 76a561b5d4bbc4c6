/**
 * @file Merge.hpp
 * @brief Deep merge utilities for configuration layers
 *
 * - Deep merge applies only to object types
 * - Scalars and arrays replace objects entirely
 */

#ifndef LOCSYNC_MERGE_HPP
#define LOCSYNC_MERGE_HPP

#include "locsync/Value.hpp"

#include <vector>

namespace locsync {

/**
 * @brief Deep merge two objects
 *
 * Merging rules:
 * - Both objects: Recursive merge (keys from both are combined)
 * - Otherwise: Override value replaces base entirely
 * - A null override leaves base untouched
 *
 * Examples:
 * ```cpp
 * Value base = {{"output", {{"indent", 2}, {"color", true}}}};
 * Value over = {{"output", {{"indent", 4}}}};
 * auto result = deep_merge(base, over);
 * // Result: {"output": {"indent": 4, "color": true}}
 * ```
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Deep merge layers in order, lowest precedence first
 */
Value deep_merge_all(const std::vector<Value>& sources);

} // namespace locsync

#endif // LOCSYNC_MERGE_HPP
