/**
 * @file Parse.hpp
 * @brief String-to-Value type parsing for environment and override input
 *
 * Parsing order (first match wins):
 * - T1: Boolean ("true", "false" - case insensitive)
 * - T2: Null ("null" - case insensitive)
 * - T3: Integer (matches ^-?[0-9]+$)
 * - T4: Float (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - T5: JSON Compound ({...} or [...])
 * - T6: Quoted String ("...")
 * - T7: Raw String (fallback)
 */

#ifndef LOCSYNC_PARSE_HPP
#define LOCSYNC_PARSE_HPP

#include "locsync/Value.hpp"

#include <string>

namespace locsync {

/**
 * @brief Parse string value to appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("FALSE")      // → false (boolean)
 * parse_value("4")          // → 4 (integer)
 * parse_value("[1,2]")      // → [1, 2] (array)
 * parse_value("\"a b\"")    // → "a b" (string, unquoted)
 * parse_value(".json")      // → ".json" (string)
 * ```
 */
Value parse_value(const std::string& str);

} // namespace locsync

#endif // LOCSYNC_PARSE_HPP
