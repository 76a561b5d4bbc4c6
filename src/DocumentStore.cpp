/**
 * @file DocumentStore.cpp
 * @brief Directory-backed document storage
 */

#include "locsync/DocumentStore.hpp"
#include "locsync/Document.hpp"
#include "locsync/Errors.hpp"
#include "locsync/Util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace locsync {

DirectoryStore::DirectoryStore(std::string directory, int indent)
    : directory_(std::move(directory)), indent_(indent) {}

std::string DirectoryStore::path_of(const std::string& name) const {
    return (fs::path(directory_) / name).string();
}

bool DirectoryStore::exists(const std::string& name) const {
    std::error_code ec;
    return fs::is_regular_file(path_of(name), ec);
}

Node DirectoryStore::load(const std::string& name) const {
    const std::string path = path_of(name);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw MalformedDocument(name, "cannot open " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    spdlog::debug("loading {}", path);
    return parse_document(ss.str(), format_for_path(name), name);
}

void DirectoryStore::persist(const std::string& name, const Node& tree) {
    const fs::path target = path_of(name);
    const fs::path staging = target.string() + ".tmp";

    std::string text;
    try {
        text = serialize_document(tree, format_for_path(name), indent_);
    } catch (const nlohmann::json::exception& e) {
        throw PersistFailure(name, e.what());
    }

    {
        std::ofstream ofs(staging, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw PersistFailure(name, "cannot open " + staging.string() + " for writing");
        }
        ofs << text;
        ofs.flush();
        if (!ofs) {
            throw PersistFailure(name, "short write to " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(staging, ec);
        throw PersistFailure(name, "cannot replace " + target.string() + ": " + reason);
    }
    spdlog::debug("wrote {} ({} bytes)", target.string(), text.size());
}

std::vector<std::string> DirectoryStore::list(const std::string& extension) const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        throw SyncError("cannot list " + directory_ + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        std::string name = entry.path().filename().string();
        if (ends_with(name, extension)) {
            names.push_back(std::move(name));
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace locsync
