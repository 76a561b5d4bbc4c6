#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>
#include <vector>

#include "locsync/Config.hpp"
#include "locsync/DocumentStore.hpp"
#include "locsync/Report.hpp"
#include "locsync/Synchronizer.hpp"
#include "locsync/Util.hpp"

using namespace locsync;

int main(int argc, char** argv) {
    auto logger = spdlog::stderr_color_mt("locsync");
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);

    try {
        cxxopts::Options options("locsync", "Keep locale documents in sync with the reference document");
        options.positional_help("[LOCALE]");

        options.add_options()
            ("fix", "Add missing keys with a placeholder of the reference text")
            ("c,config", "Path to a JSON/TOML settings file", cxxopts::value<std::string>())
            ("d,dir", "Directory holding the locale documents", cxxopts::value<std::string>())
            ("r,reference", "Reference document name", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for settings", cxxopts::value<std::string>()->default_value(kDefaultEnvPrefix))
            ("overrides", "Comma-separated dot.key:value pairs", cxxopts::value<std::string>()->default_value(""))
            ("no-color", "Disable colored output")
            ("v,verbose", "Log every load, prune, inject and write")
            ("h,help", "Show help");

        options.add_options()
            ("locale", "Locale to check (all locales when omitted)", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"locale"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        if (result.count("verbose")) {
            spdlog::set_level(spdlog::level::debug);
        }

        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());
        if (result.count("dir")) load.overrides["locales.dir"] = result["dir"].as<std::string>();
        if (result.count("reference")) load.overrides["locales.reference"] = result["reference"].as<std::string>();
        if (result.count("no-color")) load.overrides["output.color"] = false;

        const Settings settings = Config::load(load).settings();
        spdlog::debug("locales directory: {}", settings.locales_dir);

        SyncOptions sync;
        sync.reference_name = settings.reference;
        sync.extension = settings.extension;
        sync.placeholder_prefix = settings.placeholder_prefix;

        DirectoryStore store(settings.locales_dir, settings.indent);
        Synchronizer synchronizer(store, sync);
        ConsoleReporter reporter(std::cout, settings.color);

        const bool fix = result.count("fix") > 0;
        if (result.count("locale")) {
            const auto locales = result["locale"].as<std::vector<std::string>>();
            if (locales.size() > 1) {
                spdlog::warn("only the first locale is checked, ignoring {} more", locales.size() - 1);
            }
            reporter.single(synchronizer.sync_single(locales.front(), fix), settings.reference, fix);
        } else {
            reporter.audit(synchronizer.sync_all(fix), fix);
        }
        return 0;

    } catch (const std::exception& ex) {
        spdlog::error("{}", ex.what());
        return 1;
    }
}
