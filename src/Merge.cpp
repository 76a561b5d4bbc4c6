/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "locsync/Merge.hpp"

namespace locsync {

Value deep_merge(const Value& base, const Value& override_val) {
    // A null layer leaves the lower layer in place
    if (override_val.is_null()) {
        return base;
    }

    if (!base.is_object() || !override_val.is_object()) {
        return override_val;
    }

    Value result = base;
    for (auto it = override_val.begin(); it != override_val.end(); ++it) {
        const auto& key = it.key();
        auto existing = result.find(key);
        if (existing != result.end()) {
            *existing = deep_merge(*existing, it.value());
        } else {
            result[key] = it.value();
        }
    }
    return result;
}

Value deep_merge_all(const std::vector<Value>& sources) {
    Value result = Value::object();
    for (const auto& source : sources) {
        result = deep_merge(result, source);
    }
    return result;
}

} // namespace locsync
