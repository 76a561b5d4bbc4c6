/**
 * @file Inject.hpp
 * @brief Insert placeholder leaves for missing keys
 */

#ifndef LOCSYNC_INJECT_HPP
#define LOCSYNC_INJECT_HPP

#include "locsync/Flatten.hpp"
#include "locsync/KeyPath.hpp"
#include "locsync/Node.hpp"
#include "locsync/Value.hpp"

#include <string>
#include <vector>

namespace locsync {

/// Marker prepended to the reference text of an injected key.
constexpr const char* kDefaultPlaceholderPrefix = "EN TEXT TO REPLACE: ";

/**
 * @brief Textual form of a reference value
 *
 * Strings render raw, integral numbers without a fraction, null as
 * "null", arrays as their elements joined by "," (null elements empty).
 */
std::string value_text(const Value& value);

/**
 * @brief Placeholder leaf text for a reference value
 *
 * placeholder_text("Open", "EN TEXT TO REPLACE: ") → "EN TEXT TO REPLACE: Open"
 */
std::string placeholder_text(const Value& reference_value, const std::string& prefix);

/**
 * @brief Add placeholder leaves for every missing path
 *
 * Missing intermediate branches are created. An intermediate position
 * that holds a leaf is replaced by an empty branch, discarding the leaf.
 * A terminal position holding an empty branch gets the placeholder; any
 * other occupied terminal is left as it is, so applying the same paths
 * twice changes nothing.
 *
 * @param tree Target tree (taken by value; the result is a new tree)
 * @param missing Paths to add, typically DiffResult::missing_keys
 * @param reference Flattened reference supplying the placeholder text
 * @param prefix Placeholder marker
 * @throws KeyError if a path is not present in the reference
 *
 * Example:
 * ```cpp
 * // tree {"a": "leaf"}, missing [a.b], reference a.b = "X"
 * // → {"a": {"b": "EN TEXT TO REPLACE: X"}}
 * ```
 */
Node add_missing_keys(Node tree,
                      const std::vector<KeyPath>& missing,
                      const FlatIndex& reference,
                      const std::string& prefix = kDefaultPlaceholderPrefix);

} // namespace locsync

#endif // LOCSYNC_INJECT_HPP
