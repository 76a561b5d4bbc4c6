/**
 * @file DotPath.hpp
 * @brief Dot-notation access into configuration values
 *
 * Rules:
 * - get_by_dot() raises KeyError if a segment doesn't exist
 * - get_by_dot() raises TypeError when traversing into a non-object
 * - set_by_dot() creates intermediate objects, overwriting non-objects
 * - contains_dot() returns false for missing or non-traversable segments
 */

#ifndef LOCSYNC_DOTPATH_HPP
#define LOCSYNC_DOTPATH_HPP

#include "locsync/Value.hpp"
#include "locsync/Errors.hpp"

#include <string>

namespace locsync {

/**
 * @brief Get value from nested structure using dot-path
 *
 * @param data Source object
 * @param path Dot-separated path; empty returns the root
 * @return Reference to value at path
 * @throws KeyError if any segment not found
 * @throws TypeError if traversal hits a non-object before the final segment
 *
 * Examples:
 * ```cpp
 * Value cfg = {{"locales", {{"dir", "i18n"}}}};
 * get_by_dot(cfg, "locales.dir");      // "i18n"
 * get_by_dot(cfg, "locales.ext");      // throws KeyError
 * get_by_dot(cfg, "locales.dir.x");    // throws TypeError (dir is string)
 * ```
 */
const Value& get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Set value in nested structure using dot-path
 *
 * Intermediate objects are created as needed; intermediates that are not
 * objects are replaced by objects.
 *
 * Example:
 * ```cpp
 * Value cfg = Value::object();
 * set_by_dot(cfg, "output.indent", 4);
 * // Result: {"output": {"indent": 4}}
 * ```
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

/**
 * @brief Check if dot-path fully resolves
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace locsync

#endif // LOCSYNC_DOTPATH_HPP
