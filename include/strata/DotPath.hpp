/**
 * @file DotPath.hpp
 * @brief Dot-notation access into settings and composed artifacts
 *
 * Paths look like "cache.dir" or "providers.list.0". Numeric segments
 * index into arrays.
 *
 * - get_by_dot() without default throws KeyError for a missing segment
 * - get_by_dot() with default returns the default for a missing segment
 * - both throw TypeError when a scalar is traversed
 * - set_by_dot() creates intermediate objects when create_missing is set
 * - contains_dot() returns false for a missing segment
 */

#ifndef STRATA_DOTPATH_HPP
#define STRATA_DOTPATH_HPP

#include "strata/Errors.hpp"
#include "strata/Value.hpp"

#include <string>
#include <vector>

namespace strata {

/**
 * @brief Split a dot-path into segments, dropping empty ones
 *
 * - "cache.dir" → ["cache", "dir"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/// Join segments with dots.
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Get value at dot-path (strict)
 * @throws KeyError if any segment not found
 * @throws TypeError if traversal hits a scalar
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Get value at dot-path, or @p default_val when a segment is missing
 * @throws TypeError if traversal hits a scalar
 */
const Value* get_by_dot(const Value& data, const std::string& path,
                        const Value& default_val);

/**
 * @brief Set value at dot-path
 *
 * @param create_missing Create missing objects and overwrite scalars on
 *                       the way; otherwise raise
 * @throws KeyError if create_missing=false and a segment is missing
 * @throws TypeError if create_missing=false and a scalar is in the way
 */
void set_by_dot(Value& data, const std::string& path,
                const Value& value, bool create_missing = true);

/**
 * @brief Check if dot-path resolves
 * @throws TypeError if traversal hits a scalar before the last segment
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace strata

#endif // STRATA_DOTPATH_HPP
