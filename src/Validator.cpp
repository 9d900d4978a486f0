/**
 * @file Validator.cpp
 * @brief Structural validation of composed artifacts
 */

#include "strata/Validator.hpp"
#include "strata/Log.hpp"
#include "strata/Routes.hpp"

#include <set>

namespace strata {

namespace {

/**
 * @brief Collects violations for one artifact, attaching layer origin
 */
class Collector {
public:
    Collector(ArtifactKind kind, const Provenance* origins, const std::vector<Layer>* layers)
        : kind_(kind), origins_(origins), layers_(layers) {}

    void add(const std::string& top_key, const std::string& location,
             const std::string& message) {
        Violation v;
        v.kind = kind_;
        v.location = location;
        v.message = message;
        if (origins_ != nullptr) {
            auto it = origins_->find(top_key);
            if (it != origins_->end()) {
                attach_origin(v, it->second);
            }
        }
        violations_.push_back(std::move(v));
    }

    std::vector<Violation> take() { return std::move(violations_); }

private:
    ArtifactKind kind_;
    const Provenance* origins_;
    const std::vector<Layer>* layers_;
    std::vector<Violation> violations_;

    void attach_origin(Violation& v, std::size_t index) const {
        if (layers_ != nullptr && index < layers_->size()) {
            v.layer_index = (*layers_)[index].order;
            v.layer_identity = (*layers_)[index].identity;
        } else {
            v.layer_index = index;
        }
    }
};

// Well-formed UTF-8: no overlong forms, surrogates or code points above
// U+10FFFF.
bool is_valid_utf8(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<unsigned char>(s[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t trail = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            trail = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            trail = 2;
            if (lead == 0xE0) lo = 0xA0;
            if (lead == 0xED) hi = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            trail = 3;
            if (lead == 0xF0) lo = 0x90;
            if (lead == 0xF4) hi = 0x8F;
        } else {
            return false;
        }

        if (i + trail >= s.size()) return false;
        for (std::size_t k = 1; k <= trail; ++k) {
            const auto byte = static_cast<unsigned char>(s[i + k]);
            if (byte < (k == 1 ? lo : 0x80) || byte > (k == 1 ? hi : 0xBF)) return false;
        }
        i += trail + 1;
    }
    return true;
}

// Report every string and key below node that is not valid UTF-8.
void check_encoding(Collector& out, const std::string& top_key,
                    const std::string& location, const Value& node) {
    if (node.is_string()) {
        if (!is_valid_utf8(node.get_ref<const std::string&>())) {
            out.add(top_key, location, "string is not valid UTF-8");
        }
    } else if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!is_valid_utf8(it.key())) {
                out.add(top_key, location, "key is not valid UTF-8");
                continue;
            }
            check_encoding(out, top_key, location + "." + it.key(), it.value());
        }
    } else if (node.is_array()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            check_encoding(out, top_key, location + "[" + std::to_string(i) + "]", node[i]);
        }
    }
}

// Report every opaque value below node.
void check_declarative(Collector& out, const std::string& top_key,
                       const std::string& location, const Value& node) {
    if (!is_declarative(node)) {
        out.add(top_key, location, "opaque " + type_name(node) + " value is not allowed");
        return;
    }
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            check_declarative(out, top_key, location + "." + it.key(), it.value());
        }
    } else if (node.is_array()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            check_declarative(out, top_key, location + "[" + std::to_string(i) + "]", node[i]);
        }
    }
}

bool is_non_empty_string(const Value& v) {
    return v.is_string() && !v.get_ref<const std::string&>().empty();
}

void check_route_entry(Collector& out, const std::string& top_key,
                       const std::string& location, const Value& entry, bool is_pattern) {
    if (!entry.is_object()) {
        out.add(top_key, location, "route entry must be an object, got " + type_name(entry));
        return;
    }

    if (is_pattern) {
        auto pattern = entry.find("pattern");
        if (pattern == entry.end() || !is_non_empty_string(*pattern)) {
            out.add(top_key, location, "missing or empty 'pattern'");
        }
    }

    for (const char* field : {"controller", "action"}) {
        auto it = entry.find(field);
        if (it == entry.end()) {
            out.add(top_key, location, std::string("missing '") + field + "'");
        } else if (!is_non_empty_string(*it)) {
            out.add(top_key, location, std::string("'") + field +
                    "' must be a non-empty string, got " + type_name(*it));
        }
    }

    auto methods = entry.find("methods");
    if (methods == entry.end()) {
        out.add(top_key, location, "missing 'methods'");
    } else if (!methods->is_array() || methods->empty()) {
        out.add(top_key, location, "'methods' must be a non-empty list");
    } else {
        for (std::size_t i = 0; i < methods->size(); ++i) {
            if (!is_non_empty_string((*methods)[i])) {
                out.add(top_key, location, "'methods[" + std::to_string(i) +
                        "]' must be a non-empty string");
            }
        }
    }

    auto metadata = entry.find("metadata");
    if (metadata != entry.end() && !metadata->is_object()) {
        out.add(top_key, location, "'metadata' must be an object, got " + type_name(*metadata));
    }

    check_declarative(out, top_key, location, entry);
}

void validate_routes(Collector& out, const Value& table) {
    for (auto it = table.begin(); it != table.end(); ++it) {
        const std::string& key = it.key();
        const Value& value = it.value();

        if (!is_pattern_routes_key(key)) {
            check_route_entry(out, key, key, value, false);
            continue;
        }

        if (!value.is_array()) {
            out.add(key, key, "pattern routes must be a list, got " + type_name(value));
            continue;
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            check_route_entry(out, key, key + "[" + std::to_string(i) + "]", value[i], true);
        }
    }
}

void validate_services(Collector& out, const Value& registry) {
    static const std::set<std::string> kAllowedFields = {"class", "options"};

    for (auto it = registry.begin(); it != registry.end(); ++it) {
        const std::string& id = it.key();
        const Value& def = it.value();

        if (def.is_string()) {
            if (def.get_ref<const std::string&>().empty()) {
                out.add(id, id, "empty class reference");
            }
            continue;
        }
        if (!def.is_object()) {
            out.add(id, id, "definition must be a class name or an object, got " +
                    type_name(def));
            continue;
        }

        auto cls = def.find("class");
        if (cls == def.end()) {
            out.add(id, id, "missing 'class'");
        } else if (!is_non_empty_string(*cls)) {
            out.add(id, id, "'class' must be a non-empty string, got " + type_name(*cls));
        }

        for (auto field = def.begin(); field != def.end(); ++field) {
            if (kAllowedFields.count(field.key()) == 0) {
                out.add(id, id, "unknown field '" + field.key() + "'");
            }
        }

        auto options = def.find("options");
        if (options != def.end()) {
            if (!options->is_object()) {
                out.add(id, id + ".options", "'options' must be an object, got " +
                        type_name(*options));
            } else {
                check_declarative(out, id, id + ".options", *options);
            }
        }
    }
}

} // anonymous namespace

std::vector<Violation> validate(ArtifactKind kind, const Value& result,
                                const Provenance* origins,
                                const std::vector<Layer>* layers) {
    Collector out(kind, origins, layers);

    if (!result.is_object()) {
        out.add("", "", "top-level value must be an object, got " + type_name(result));
        return out.take();
    }

    for (auto it = result.begin(); it != result.end(); ++it) {
        if (!is_valid_utf8(it.key())) {
            out.add(it.key(), "", "top-level key is not valid UTF-8");
            continue;
        }
        check_encoding(out, it.key(), it.key(), it.value());
    }

    switch (kind) {
        case ArtifactKind::Config:
            for (auto it = result.begin(); it != result.end(); ++it) {
                check_declarative(out, it.key(), it.key(), it.value());
            }
            break;
        case ArtifactKind::Routes:
            validate_routes(out, result);
            break;
        case ArtifactKind::Services:
            validate_services(out, result);
            break;
    }

    return out.take();
}

void ensure_valid(ArtifactKind kind, const Value& result,
                  const Provenance* origins, const std::vector<Layer>* layers) {
    auto violations = validate(kind, result, origins, layers);
    if (violations.empty()) {
        return;
    }

    for (const auto& v : violations) {
        logger()->error("{}", v.to_string());
    }

    switch (kind) {
        case ArtifactKind::Routes:
            throw MissingRouteFieldError(std::move(violations));
        case ArtifactKind::Services:
            throw UnresolvableServiceDefinitionError(std::move(violations));
        case ArtifactKind::Config:
            break;
    }
    throw ValidationError(kind, std::move(violations));
}

void check_payload_shapes(ArtifactKind kind, const std::vector<Layer>& layers) {
    for (const auto& layer : layers) {
        if (!layer.payload.is_object()) {
            throw MalformedPayloadError(kind, layer.order, layer.identity, "",
                                        "expected object, got " + type_name(layer.payload));
        }
        if (kind == ArtifactKind::Routes) {
            auto patterns = layer.payload.find(kPatternRoutesKey);
            if (patterns != layer.payload.end() && !patterns->is_array()) {
                throw MalformedPayloadError(kind, layer.order, layer.identity,
                                            kPatternRoutesKey,
                                            "pattern routes must be a list, got " +
                                            type_name(*patterns));
            }
        }
    }
}

} // namespace strata
