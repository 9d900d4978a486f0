/**
 * @file Merge.hpp
 * @brief Deep merge of tree-shaped layers (config compositor)
 *
 * Merge rules (last wins):
 * - Both mappings: recursive merge, keys from both are combined
 * - Incoming empty mapping: replaces the existing value (clears the subtree)
 * - Incoming list: replaces the existing value wholesale, never concatenates
 * - Incoming scalar (null included): overwrites
 */

#ifndef STRATA_MERGE_HPP
#define STRATA_MERGE_HPP

#include "strata/Types.hpp"
#include "strata/Value.hpp"

#include <vector>

namespace strata {

/**
 * @brief Deep merge @p incoming into @p acc in place
 *
 * Examples:
 * ```cpp
 * Value acc = {{"a", {{"x", 1}, {"y", 2}}}};
 * deep_merge_into(acc, {{"a", {{"y", 3}, {"z", 4}}}});
 * // acc: {"a": {"x": 1, "y": 3, "z": 4}}
 *
 * Value acc2 = {{"a", {1, 2, 3}}};
 * deep_merge_into(acc2, {{"a", {9}}});
 * // acc2: {"a": [9]}
 * ```
 */
void deep_merge_into(Value& acc, const Value& incoming);

/**
 * @brief Deep merge two values, returning the result
 * @param base Lower precedence
 * @param override_val Higher precedence
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Merge configuration layers in order (mergeConfig)
 *
 * Starts from an empty mapping and deep merges each layer into it.
 *
 * @param layers Payloads in layer order (baseline first)
 * @param origins If given, receives for each top-level key the index of
 *                the last layer that set it
 * @return Merged configuration tree
 * @throws MalformedPayloadError if a layer is not a mapping
 */
Value merge_config(const std::vector<Value>& layers, Provenance* origins = nullptr);

} // namespace strata

#endif // STRATA_MERGE_HPP
