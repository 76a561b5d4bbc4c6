/**
 * @file KeyPath.cpp
 * @brief Implementation of key paths
 */

#include "locsync/KeyPath.hpp"

#include <functional>
#include <sstream>

namespace locsync {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

KeyPath KeyPath::parse(const std::string& dotted) {
    return KeyPath(split_dot_path(dotted));
}

KeyPath KeyPath::child(const std::string& segment) const {
    std::vector<std::string> segments(segments_);
    segments.push_back(segment);
    return KeyPath(std::move(segments));
}

KeyPath KeyPath::suffix(std::size_t count) const {
    if (count >= segments_.size()) {
        return KeyPath();
    }
    return KeyPath(std::vector<std::string>(segments_.begin() + count, segments_.end()));
}

std::size_t KeyPathHash::operator()(const KeyPath& path) const noexcept {
    // boost::hash_combine mixing over the segments
    std::size_t seed = path.size();
    std::hash<std::string> hasher;
    for (const auto& segment : path.segments()) {
        seed ^= hasher(segment) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
}

std::vector<std::string> to_strings(const std::vector<KeyPath>& paths) {
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& path : paths) {
        out.push_back(path.str());
    }
    return out;
}

} // namespace locsync
