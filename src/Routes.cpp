/**
 * @file Routes.cpp
 * @brief Route table compositor
 */

#include "strata/Routes.hpp"
#include "strata/Errors.hpp"
#include "strata/Merge.hpp"

namespace strata {

bool is_pattern_routes_key(const std::string& key) {
    return key == kPatternRoutesKey;
}

Value merge_routes(const std::vector<Value>& layers, Provenance* origins) {
    Value table = Value::object();

    for (std::size_t i = 0; i < layers.size(); ++i) {
        const Value& layer = layers[i];
        if (!layer.is_object()) {
            throw MalformedPayloadError(ArtifactKind::Routes, i, "", "",
                                        "route table must be an object, got " +
                                        type_name(layer));
        }

        for (auto it = layer.begin(); it != layer.end(); ++it) {
            const std::string& path = it.key();
            auto existing = table.find(path);
            if (existing == table.end()) {
                table[path] = it.value();
            } else {
                // Same algebra as config: entries merge field by field and
                // the pattern list, being a list, is replaced as a whole.
                deep_merge_into(*existing, it.value());
            }
            if (origins != nullptr) {
                (*origins)[path] = i;
            }
        }
    }

    return table;
}

} // namespace strata
