/**
 * @file Loader.cpp
 * @brief Payload file loading implementation
 *
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 */

#include "strata/Loader.hpp"
#include "strata/Errors.hpp"
#include "strata/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace strata {

namespace {

/**
 * @brief Convert a toml++ node to a Value.
 *
 * Dates and times have no JSON counterpart and become their TOML text.
 */
Value toml_node_to_value(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using node_t = std::decay_t<decltype(n)>;
        if constexpr (toml::is_table<node_t>) {
            Value obj = Value::object();
            for (const auto& [key, child] : n) {
                obj[std::string(key.str())] = toml_node_to_value(child);
            }
            return obj;
        } else if constexpr (toml::is_array<node_t>) {
            Value arr = Value::array();
            for (const auto& child : n) {
                arr.push_back(toml_node_to_value(child));
            }
            return arr;
        } else if constexpr (toml::is_date<node_t> || toml::is_time<node_t> ||
                             toml::is_date_time<node_t>) {
            std::ostringstream ss;
            ss << n.get();
            return Value(ss.str());
        } else {
            return Value(n.get());
        }
    });
}

} // anonymous namespace

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(path, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << "line " << e.source().begin.line
                << ", column " << e.source().begin.column
                << ": " << e.description();
        throw ParseError(path, details.str());
    }

    return toml_node_to_value(table);
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_payload_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw std::runtime_error(
        "Unsupported payload file type: " + ext + " (expected .json or .toml)"
    );
}

} // namespace strata
