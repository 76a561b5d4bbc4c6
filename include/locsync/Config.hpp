#ifndef LOCSYNC_CONFIG_HPP
#define LOCSYNC_CONFIG_HPP

#include "locsync/Value.hpp"
#include "locsync/DotPath.hpp"
#include "locsync/Errors.hpp"

#include <map>
#include <optional>
#include <string>
#include <type_traits>

namespace locsync {

/// Default environment variable prefix (LOCSYNC_LOCALES_DIR → locales.dir)
constexpr const char* kDefaultEnvPrefix = "LOCSYNC";

/**
 * @brief Built-in defaults, the lowest configuration layer.
 */
Value default_config();

/**
 * @brief Options for constructing a Config from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix; // Environment variable prefix, e.g. "LOCSYNC"
    std::map<std::string, Value> overrides; // final precedence
    Value defaults = default_config();
};

/**
 * @brief Typed view of the settings the tool runs with.
 */
struct Settings {
    std::string locales_dir;
    std::string reference;
    std::string extension;
    std::string placeholder_prefix;
    int indent = 2;
    bool color = true;
};

/**
 * @brief Layered configuration tree with dot-notation helpers.
 *
 * Keys:
 *   locales.dir, locales.reference, locales.extension,
 *   placeholder.prefix, output.indent, output.color
 */
class Config {
public:
    Config() = default;
    explicit Config(Value data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Config load(const LoadOptions& opts);

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }

    // Dot helpers
    const Value& at(const std::string& path) const { return get_by_dot(data_, path); }
    bool contains(const std::string& path) const { return contains_dot(data_, path); }
    void set(const std::string& path, const Value& v) { set_by_dot(data_, path, v); }

    /**
     * @brief Typed read
     * @throws KeyError if the path is missing
     * @throws TypeError if the value cannot be converted to T
     */
    template <typename T>
    T get(const std::string& path) const {
        const Value& v = at(path);
        try {
            return v.get<T>();
        } catch (const nlohmann::json::type_error&) {
            throw TypeError(path, expected_type_name<T>(), type_name(v));
        }
    }

    // Typed settings snapshot
    Settings settings() const;

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

private:
    template <typename T>
    static std::string expected_type_name() {
        if (std::is_same<T, bool>::value) return "boolean";
        if (std::is_integral<T>::value) return "integer";
        if (std::is_floating_point<T>::value) return "float";
        if (std::is_same<T, std::string>::value) return "string";
        return "value";
    }

    Value data_ = Value::object();
};

} // namespace locsync

#endif // LOCSYNC_CONFIG_HPP
