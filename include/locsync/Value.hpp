/**
 * @file Value.hpp
 * @brief Scalar and document value model
 *
 * Uses nlohmann::ordered_json as the underlying value model so that
 * documents keep their member order when written back:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef LOCSYNC_VALUE_HPP
#define LOCSYNC_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace locsync {

/**
 * @brief JSON-like value type for documents and configuration
 *
 * Leaves of a document tree carry a Value. Objects only appear here while
 * a document is being parsed or serialized; inside the synchronization
 * engine they are represented by Node branches.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace locsync

#endif // LOCSYNC_VALUE_HPP
