/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "strata/Merge.hpp"
#include "strata/Errors.hpp"

namespace strata {

namespace {

// Merge each member of incoming into the object acc.
void merge_members(Value& acc, const Value& incoming) {
    for (auto it = incoming.begin(); it != incoming.end(); ++it) {
        auto existing = acc.find(it.key());
        if (existing == acc.end()) {
            acc[it.key()] = it.value();
        } else {
            deep_merge_into(*existing, it.value());
        }
    }
}

} // anonymous namespace

void deep_merge_into(Value& acc, const Value& incoming) {
    // Anything but a non-empty mapping onto a mapping replaces wholesale:
    // lists, scalars, null, and an explicit empty mapping.
    if (!acc.is_object() || !incoming.is_object() || incoming.empty()) {
        acc = incoming;
        return;
    }
    merge_members(acc, incoming);
}

Value deep_merge(const Value& base, const Value& override_val) {
    Value result = base;
    deep_merge_into(result, override_val);
    return result;
}

Value merge_config(const std::vector<Value>& layers, Provenance* origins) {
    Value result = Value::object();

    for (std::size_t i = 0; i < layers.size(); ++i) {
        const Value& layer = layers[i];
        if (!layer.is_object()) {
            throw MalformedPayloadError(ArtifactKind::Config, i, "", "",
                                        "expected object, got " + type_name(layer));
        }
        // A layer that is itself empty contributes nothing; only nested
        // empty mappings clear a subtree.
        merge_members(result, layer);
        if (origins != nullptr) {
            for (auto it = layer.begin(); it != layer.end(); ++it) {
                (*origins)[it.key()] = i;
            }
        }
    }

    return result;
}

} // namespace strata
