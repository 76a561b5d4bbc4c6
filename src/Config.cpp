#include "locsync/Config.hpp"
#include "locsync/Document.hpp"
#include "locsync/Inject.hpp"
#include "locsync/Merge.hpp"
#include "locsync/Parse.hpp"
#include "locsync/Util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace locsync {

Value default_config() {
    return Value{
        {"locales", {
            {"dir", "i18n/locales"},
            {"reference", "en.json"},
            {"extension", ".json"}
        }},
        {"placeholder", {
            {"prefix", kDefaultPlaceholderPrefix}
        }},
        {"output", {
            {"indent", 2},
            {"color", true}
        }}
    };
}

Config Config::load(const LoadOptions& opts) {
    // 1) defaults, 2) file
    std::vector<Value> layers;
    layers.push_back(opts.defaults);
    if (opts.file_path.has_value()) {
        spdlog::debug("reading configuration from {}", *opts.file_path);
        layers.push_back(load_config_file(*opts.file_path));
    }

    Config cfg(deep_merge_all(layers));

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    cfg.apply_overrides(opts.overrides);

    return cfg;
}

Settings Config::settings() const {
    Settings s;
    s.locales_dir = get<std::string>("locales.dir");
    s.reference = get<std::string>("locales.reference");
    s.extension = get<std::string>("locales.extension");
    s.placeholder_prefix = get<std::string>("placeholder.prefix");
    s.indent = get<int>("output.indent");
    s.color = get<bool>("output.color");
    return s;
}

void Config::apply_env_prefix(const std::string& prefix) {
    // Prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.rfind(normalized, 0) != 0) {
            continue;
        }
        // remainder -> lower, underscores become dots
        std::string key = to_lower(name.substr(normalized.size()));
        std::replace(key.begin(), key.end(), '_', '.');
        if (key.empty()) continue;

        spdlog::debug("environment {} -> {}", name, key);
        set_by_dot(data_, key, parse_value(value));
    }
}

void Config::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

} // namespace locsync
