#ifndef STRATA_UTIL_HPP
#define STRATA_UTIL_HPP

#include "strata/Value.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace strata {

std::string to_lower(std::string s);

// Split on delim, dropping empty tokens.
std::vector<std::string> split(const std::string& s, char delim);

std::string trim(const std::string& s);

// Parse an --overrides string: "k1:json, k2:json, ...".
// Commas inside brackets, braces or quotes do not split.
std::map<std::string, Value> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

} // namespace strata

#endif // STRATA_UTIL_HPP
