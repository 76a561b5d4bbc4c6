/**
 * @file Document.cpp
 * @brief Document codec implementation
 *
 * - JSON files (using nlohmann::ordered_json)
 * - TOML files (using toml++)
 */

#include "locsync/Document.hpp"
#include "locsync/Errors.hpp"
#include "locsync/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace locsync {

// ============================================================================
// TOML <-> Value conversion
// ============================================================================

namespace {

Value toml_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << *node.as_date();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << *node.as_time();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << *node.as_date_time();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

toml::array make_toml_array(const Value& a);
toml::table make_toml_table(const Value& o);

template <typename Sink>
void emit_scalar(const Value& v, Sink&& sink) {
    if (v.is_string()) {
        sink(v.get<std::string>());
    } else if (v.is_boolean()) {
        sink(v.get<bool>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            sink(static_cast<std::int64_t>(u));
        } else {
            // Oversize for a TOML integer
            sink(static_cast<double>(u));
        }
    } else if (v.is_number_integer()) {
        sink(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        sink(v.get<double>());
    } else if (v.is_null()) {
        // No TOML null
        sink(std::string{});
    } else {
        sink(v.dump());
    }
}

toml::array make_toml_array(const Value& a) {
    toml::array out;
    for (const auto& elem : a) {
        if (elem.is_object()) {
            out.push_back(make_toml_table(elem));
        } else if (elem.is_array()) {
            out.push_back(make_toml_array(elem));
        } else {
            emit_scalar(elem, [&](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); });
        }
    }
    return out;
}

toml::table make_toml_table(const Value& o) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const auto& key = it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            tbl.insert(key, make_toml_table(v));
        } else if (v.is_array()) {
            tbl.insert(key, make_toml_array(v));
        } else {
            emit_scalar(v, [&](auto&& x) { tbl.insert(key, std::forward<decltype(x)>(x)); });
        }
    }
    return tbl;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // anonymous namespace

// ============================================================================
// Format detection
// ============================================================================

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

DocumentFormat format_for_path(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return DocumentFormat::Json;
    }
    if (ext == ".toml") {
        return DocumentFormat::Toml;
    }
    throw UnsupportedFormatError(path);
}

// ============================================================================
// Parsing
// ============================================================================

Value parse_value_text(const std::string& text, DocumentFormat format, const std::string& origin) {
    if (format == DocumentFormat::Json) {
        try {
            return Value::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw MalformedDocument(origin, e.what());
        }
    }

    try {
        toml::table table = toml::parse(text, origin);
        return toml_to_value(table);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw MalformedDocument(origin, details.str());
    }
}

Node parse_document(const std::string& text, DocumentFormat format, const std::string& origin) {
    const Value value = parse_value_text(text, format, origin);
    if (!value.is_object()) {
        throw MalformedDocument(origin, "root must be an object, found " + type_name(value));
    }
    try {
        return Node::from_value(value);
    } catch (const SyncError& e) {
        throw MalformedDocument(origin, e.what());
    }
}

// ============================================================================
// Serialization
// ============================================================================

std::string serialize_document(const Node& tree, DocumentFormat format, int indent) {
    const Value value = tree.to_value();

    if (format == DocumentFormat::Json) {
        return value.dump(indent) + "\n";
    }

    std::ostringstream oss;
    oss << make_toml_table(value.is_object() ? value : Value::object());
    std::string text = oss.str();
    if (text.empty() || text.back() != '\n') {
        text += '\n';
    }
    return text;
}

// ============================================================================
// Configuration files
// ============================================================================

Value load_config_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    const DocumentFormat format = format_for_path(path);
    const std::string content = read_file(path);
    try {
        return parse_value_text(content, format, path);
    } catch (const MalformedDocument& e) {
        throw ConfigParseError(path, e.details());
    }
}

} // namespace locsync
