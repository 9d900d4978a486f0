/**
 * @file Services.cpp
 * @brief Service registry compositor (left-wins union chain)
 */

#include "strata/Services.hpp"
#include "strata/Errors.hpp"

namespace strata {

namespace {

void require_registry(const Value& registry, std::size_t index) {
    if (!registry.is_object()) {
        throw MalformedPayloadError(ArtifactKind::Services, index, "", "",
                                    "service registry must be an object, got " +
                                    type_name(registry));
    }
}

// acc = step ∪ acc, recording which identifiers the step won.
void union_step(Value& acc, const Value& step, std::size_t index, Provenance* origins) {
    require_registry(step, index);
    acc = left_union(step, acc);
    if (origins != nullptr) {
        for (auto it = step.begin(); it != step.end(); ++it) {
            (*origins)[it.key()] = index;
        }
    }
}

} // anonymous namespace

Value left_union(const Value& left, const Value& right) {
    require_registry(left, 0);
    require_registry(right, 1);

    // Whole definitions from the left replace the right's; options are
    // never merged.
    Value result = right;
    for (auto it = left.begin(); it != left.end(); ++it) {
        result[it.key()] = it.value();
    }
    return result;
}

Value merge_services(const Value& baseline, const std::vector<Value>& providers,
                     const Value& app, Provenance* origins) {
    Value acc = Value::object();
    union_step(acc, baseline, 0, origins);

    for (std::size_t i = 0; i < providers.size(); ++i) {
        union_step(acc, providers[i], i + 1, origins);
    }

    union_step(acc, app, providers.size() + 1, origins);
    return acc;
}

Value merge_services(const std::vector<Layer>& layers, Provenance* origins) {
    Value acc = Value::object();
    for (std::size_t i = 0; i < layers.size(); ++i) {
        if (layers[i].kind == LayerKind::Baseline && i != 0) {
            throw MalformedPayloadError(ArtifactKind::Services, i, layers[i].identity, "",
                                        "baseline registry must be the first layer");
        }
        union_step(acc, layers[i].payload, i, origins);
    }
    return acc;
}

} // namespace strata
