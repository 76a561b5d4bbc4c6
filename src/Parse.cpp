/**
 * @file Parse.cpp
 * @brief Implementation of type parsing
 */

#include "locsync/Parse.hpp"
#include "locsync/Util.hpp"

#include <cstdint>
#include <regex>
#include <stdexcept>

namespace locsync {

namespace {

const std::regex& integer_pattern() {
    static const std::regex re("^-?[0-9]+$");
    return re;
}

const std::regex& float_pattern() {
    static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
    return re;
}

} // namespace

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    // T1: Boolean
    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    // T2: Null
    if (lower == "null") {
        return nullptr;
    }

    // T3: Integer; out-of-range values fall through to a raw string
    if (std::regex_match(str, integer_pattern())) {
        try {
            return static_cast<std::int64_t>(std::stoll(str));
        } catch (const std::out_of_range&) {
            return str;
        }
    }

    // T4: Float
    if (std::regex_match(str, float_pattern())) {
        try {
            return std::stod(str);
        } catch (const std::out_of_range&) {
            return str;
        }
    }

    // T5: JSON Compound (objects and arrays)
    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    // T6: Quoted String
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (parsed.is_string()) {
            return parsed;
        }
    }

    // T7: Raw String (fallback)
    return str;
}

} // namespace locsync
