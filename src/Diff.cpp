/**
 * @file Diff.cpp
 * @brief Implementation of key-set diffing
 */

#include "locsync/Diff.hpp"

namespace locsync {

DiffResult diff(const FlatIndex& reference, const FlatIndex& target) {
    DiffResult result;

    for (const auto& [path, value] : reference.entries()) {
        if (!target.contains(path)) {
            result.missing_keys.push_back(path);
        }
    }

    for (const auto& [path, value] : target.entries()) {
        if (!reference.contains(path)) {
            result.extraneous_keys.push_back(path);
        }
    }

    return result;
}

} // namespace locsync
