/**
 * @file Util.hpp
 * @brief Small string and environment helpers
 */

#ifndef ROUTERKIT_UTIL_HPP
#define ROUTERKIT_UTIL_HPP

#include <string>
#include <utility>
#include <vector>

namespace routerkit {

std::string to_lower(std::string s);

// Split on delim, dropping empty tokens
std::vector<std::string> split(const std::string& s, char delim);

std::string trim(const std::string& s);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool contains(const std::string& haystack, const std::string& needle);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

} // namespace routerkit

#endif // ROUTERKIT_UTIL_HPP
