/**
 * @file KeyPath.hpp
 * @brief Segment paths addressing leaves of a document tree
 *
 * A KeyPath is an ordered sequence of segments. Its canonical textual form
 * joins the segments with dots ("menu.file.open"), but equality, ordering
 * and prefix tests are always done on the segments themselves, so a member
 * literally named "a.b" never aliases the nested path a -> b.
 */

#ifndef LOCSYNC_KEYPATH_HPP
#define LOCSYNC_KEYPATH_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace locsync {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped.
 *
 * Examples:
 * - "menu.file" → ["menu", "file"]
 * - "" → []
 * - "single" → ["single"]
 * - "a..b" → ["a", "b"]
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

class KeyPath {
public:
    KeyPath() = default;
    explicit KeyPath(std::vector<std::string> segments)
        : segments_(std::move(segments)) {}

    /**
     * @brief Build a path from its dotted form
     *
     * Convenience for tests and command-line input; document traversal
     * builds paths segment by segment with child().
     */
    static KeyPath parse(const std::string& dotted);

    const std::vector<std::string>& segments() const noexcept { return segments_; }
    std::size_t size() const noexcept { return segments_.size(); }
    bool empty() const noexcept { return segments_.empty(); }

    const std::string& front() const { return segments_.front(); }
    const std::string& back() const { return segments_.back(); }

    // New path with one more trailing segment
    KeyPath child(const std::string& segment) const;

    // New path without the first `count` segments
    KeyPath suffix(std::size_t count) const;

    // Canonical dot-joined form
    std::string str() const { return join_dot_path(segments_); }

    friend bool operator==(const KeyPath& a, const KeyPath& b) { return a.segments_ == b.segments_; }
    friend bool operator!=(const KeyPath& a, const KeyPath& b) { return !(a == b); }
    friend bool operator<(const KeyPath& a, const KeyPath& b) { return a.segments_ < b.segments_; }

private:
    std::vector<std::string> segments_;
};

struct KeyPathHash {
    std::size_t operator()(const KeyPath& path) const noexcept;
};

/**
 * @brief Render a list of paths in canonical form
 */
std::vector<std::string> to_strings(const std::vector<KeyPath>& paths);

} // namespace locsync

#endif // LOCSYNC_KEYPATH_HPP
