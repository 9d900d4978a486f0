/**
 * @file Loader.hpp
 * @brief Payload file loading
 *
 * Implements loading of layer payloads and settings from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * TOML tables become objects; dates and times become strings.
 */

#ifndef STRATA_LOADER_HPP
#define STRATA_LOADER_HPP

#include "strata/Value.hpp"

#include <string>

namespace strata {

/**
 * @brief Load a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file.
 *
 * @param path Path to the TOML file
 * @return Parsed Value (always an object)
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a file, detecting the format by extension.
 *
 * @param path Path ending in .json or .toml
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if the file has syntax errors
 * @throws std::runtime_error if extension is not .json or .toml
 */
Value load_payload_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Read entire file into a string.
 * @throws FileNotFoundError if the file cannot be opened
 */
std::string read_file(const std::string& path);

/// True if path names an existing regular file.
bool file_exists(const std::string& path);

} // namespace strata

#endif // STRATA_LOADER_HPP
