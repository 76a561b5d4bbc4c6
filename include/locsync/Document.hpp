/**
 * @file Document.hpp
 * @brief Document codec
 *
 * Reads and writes documents as:
 * - JSON (using nlohmann::ordered_json, member order preserved)
 * - TOML (using toml++)
 *
 * The format is picked from the file extension. Serialized text always
 * ends with a newline so rewrites produce minimal diffs.
 */

#ifndef LOCSYNC_DOCUMENT_HPP
#define LOCSYNC_DOCUMENT_HPP

#include "locsync/Node.hpp"
#include "locsync/Value.hpp"

#include <string>

namespace locsync {

enum class DocumentFormat { Json, Toml };

/**
 * @brief Get file extension (lowercase, including the dot)
 *
 * "locales/fr.JSON" → ".json", "README" → ""
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Detect format by extension
 * @throws UnsupportedFormatError for anything but .json / .toml
 */
DocumentFormat format_for_path(const std::string& path);

/**
 * @brief Parse text into a value
 *
 * @param text Document text
 * @param format Input format
 * @param origin Name used in error messages
 * @throws MalformedDocument on syntax errors
 */
Value parse_value_text(const std::string& text, DocumentFormat format, const std::string& origin);

/**
 * @brief Parse text into a document tree
 *
 * @throws MalformedDocument on syntax errors, a non-object root, or
 *         nesting deeper than kMaxTreeDepth
 */
Node parse_document(const std::string& text, DocumentFormat format, const std::string& origin);

/**
 * @brief Serialize a tree
 *
 * JSON output uses `indent` spaces per level. TOML has no null, so null
 * leaves are written as empty strings.
 */
std::string serialize_document(const Node& tree, DocumentFormat format, int indent = 2);

/**
 * @brief Load a configuration file into a value
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError on syntax errors
 * @throws UnsupportedFormatError for unknown extensions
 */
Value load_config_file(const std::string& path);

} // namespace locsync

#endif // LOCSYNC_DOCUMENT_HPP
