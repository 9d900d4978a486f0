#include "strata/Settings.hpp"
#include "strata/DotPath.hpp"
#include "strata/Loader.hpp"
#include "strata/Log.hpp"
#include "strata/Merge.hpp"
#include "strata/Parse.hpp"
#include "strata/Util.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace strata {

Value default_settings() {
    return Value{
        {"project", {{"root", "."}}},
        {"baseline", {{"dir", "vendor/baseline"}}},
        {"providers", {{"root", ""}, {"list", Value::array()}}},
        {"app", {{"dir", "config"}, {"environment", ""}}},
        {"cache", {{"dir", "var/cache"}}},
        {"log", {{"level", "warn"}}},
    };
}

Settings Settings::load(const LoadOptions& opts) {
    // 1) defaults
    Value merged = default_settings();
    deep_merge_into(merged, opts.defaults);

    // 2) file; relative directories are taken from the file's location
    if (opts.file_path.has_value()) {
        Value filej = load_payload_file(*opts.file_path);
        if (!filej.is_object()) {
            throw ParseError(*opts.file_path, "settings file must hold an object");
        }
        if (!contains_dot(filej, "project.root")) {
            fs::path parent = fs::absolute(*opts.file_path).parent_path();
            set_by_dot(filej, "project.root", parent.string());
        }
        deep_merge_into(merged, filej);
    }

    Settings settings(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        settings.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    settings.apply_overrides(opts.overrides);

    // 5) mandatory
    settings.enforce_mandatory(opts.mandatory);

    return settings;
}

const Value& Settings::at(const std::string& path) const {
    return *get_by_dot(data_, path);
}

bool Settings::contains(const std::string& path) const {
    return contains_dot(data_, path);
}

void Settings::set(const std::string& path, const Value& v) {
    set_by_dot(data_, path, v);
}

void Settings::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

void Settings::apply_env_prefix(const std::string& prefix) {
    // Prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.rfind(normalized, 0) != 0) continue;

        // remainder -> lower, underscores become dots
        std::string key = to_lower(name.substr(normalized.size()));
        std::replace(key.begin(), key.end(), '_', '.');
        if (key.empty()) continue;

        // Only known keys: stray variables sharing the prefix are ignored.
        bool known = false;
        try {
            known = contains(key) && !at(key).is_object();
        } catch (const TypeError&) {
            known = false;
        }
        if (!known) {
            logger()->debug("ignoring {}: no settings key '{}'", name, key);
            continue;
        }
        set_by_dot(data_, key, parse_value(value));
    }
}

void Settings::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

namespace {

std::string string_at(const Value& data, const std::string& path) {
    const Value* v = get_by_dot(data, path);
    if (!v->is_string()) {
        throw TypeError(path, "string", type_name(*v));
    }
    return v->get<std::string>();
}

std::string resolve(const std::string& root, const std::string& dir) {
    if (dir.empty()) return dir;
    fs::path p(dir);
    if (p.is_relative()) {
        p = fs::path(root) / p;
    }
    return p.lexically_normal().string();
}

} // anonymous namespace

DirectoryLayout Settings::layout() const {
    const std::string root = string_at(data_, "project.root");

    DirectoryLayout layout;
    layout.baseline_dir = resolve(root, string_at(data_, "baseline.dir"));
    layout.providers_root = resolve(root, string_at(data_, "providers.root"));
    layout.app_dir = resolve(root, string_at(data_, "app.dir"));

    const Value& env = at("app.environment");
    if (!env.is_null()) {
        layout.environment = env.is_string() ? env.get<std::string>() : env.dump();
    }

    const Value& list = at("providers.list");
    if (list.is_string()) {
        // From the environment: "a,b,c"
        for (const auto& ref : split(list.get<std::string>(), ',')) {
            layout.providers.push_back(trim(ref));
        }
    } else if (list.is_array()) {
        for (const auto& ref : list) {
            if (!ref.is_string()) {
                throw TypeError("providers.list", "string", type_name(ref));
            }
            layout.providers.push_back(ref.get<std::string>());
        }
    } else {
        throw TypeError("providers.list", "array", type_name(list));
    }

    // Relative providers resolve against providers.root, or the project
    // root when no providers.root is set.
    if (layout.providers_root.empty()) {
        layout.providers_root = fs::path(root).lexically_normal().string();
    }
    return layout;
}

std::string Settings::cache_dir() const {
    return resolve(string_at(data_, "project.root"), string_at(data_, "cache.dir"));
}

std::string Settings::log_level() const {
    return string_at(data_, "log.level");
}

} // namespace strata
