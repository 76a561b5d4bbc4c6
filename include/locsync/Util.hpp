#ifndef LOCSYNC_UTIL_HPP
#define LOCSYNC_UTIL_HPP

#include "locsync/Value.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace locsync {

std::string to_lower(std::string s);
std::string trim(const std::string& s);
bool ends_with(const std::string& s, const std::string& suffix);

// Parse an --overrides string: "k1:value, k2:value, ..."
// Commas inside quotes, braces or brackets do not split.
std::map<std::string, Value> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

} // namespace locsync

#endif // LOCSYNC_UTIL_HPP
