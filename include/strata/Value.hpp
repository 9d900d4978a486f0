/**
 * @file Value.hpp
 * @brief Value type for layer payloads and composition results
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, key-ordered)
 *
 * Objects are ordered by key, so dumping the same tree always yields the
 * same bytes.
 */

#ifndef STRATA_VALUE_HPP
#define STRATA_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace strata {

/**
 * @brief JSON-like value type for layer payloads
 *
 * A ConfigNode, a RouteTable and a ServiceRegistry are all Values whose
 * top level is an object.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object", "binary")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    if (val.is_binary()) return "binary";
    if (val.is_discarded()) return "discarded";
    return "unknown";
}

/**
 * @brief Check if value is inert declarative data
 *
 * Scalars, arrays and objects are declarative. Binary blobs and discarded
 * values are opaque and never allowed in a layer.
 */
inline bool is_declarative(const Value& val) {
    return !val.is_binary() && !val.is_discarded();
}

} // namespace strata

#endif // STRATA_VALUE_HPP
