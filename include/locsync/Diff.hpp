/**
 * @file Diff.hpp
 * @brief Key-set comparison between a reference and a target
 */

#ifndef LOCSYNC_DIFF_HPP
#define LOCSYNC_DIFF_HPP

#include "locsync/Flatten.hpp"
#include "locsync/KeyPath.hpp"

#include <vector>

namespace locsync {

struct DiffResult {
    // Reference keys absent from the target, in reference order
    std::vector<KeyPath> missing_keys;
    // Target keys absent from the reference, in target order
    std::vector<KeyPath> extraneous_keys;

    bool empty() const noexcept { return missing_keys.empty() && extraneous_keys.empty(); }
};

/**
 * @brief Classify keys as missing or extraneous
 *
 * Exact full-path matches only; "a" in the target does not satisfy
 * "a.b" in the reference.
 */
DiffResult diff(const FlatIndex& reference, const FlatIndex& target);

} // namespace locsync

#endif // LOCSYNC_DIFF_HPP
