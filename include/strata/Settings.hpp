#ifndef STRATA_SETTINGS_HPP
#define STRATA_SETTINGS_HPP

#include "strata/Errors.hpp"
#include "strata/LayerSource.hpp"
#include "strata/Value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Options for loading the tool's project settings.
 */
struct LoadOptions {
    std::optional<std::string> file_path;           // strata.json / strata.toml
    std::optional<std::string> prefix = "STRATA";   // environment variable prefix
    std::map<std::string, Value> overrides;         // final precedence
    Value defaults = Value::object();
    std::vector<std::string> mandatory;
};

/// Built-in defaults for every settings key.
Value default_settings();

/**
 * @brief Project settings: where the layers and the cache live.
 *
 * Keys: baseline.dir, providers.root, providers.list, app.dir,
 * app.environment, cache.dir, log.level.
 */
class Settings {
public:
    Settings() = default;
    explicit Settings(Value data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Settings load(const LoadOptions& opts);

    const Value& data() const noexcept { return data_; }

    // Dot helpers
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Value& v);

    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        try {
            return at(path).get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

    void enforce_mandatory(const std::vector<std::string>& keys) const;

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

    // Typed views
    DirectoryLayout layout() const;
    std::string cache_dir() const;
    std::string log_level() const;

private:
    Value data_ = Value::object();
};

} // namespace strata

#endif // STRATA_SETTINGS_HPP
