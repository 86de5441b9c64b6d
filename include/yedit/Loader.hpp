/**
 * @file Loader.hpp
 * @brief File reading and structured file loading
 *
 * Implements loading of:
 * - document text for the engine (read_text_file)
 * - parameter and edit files, by extension:
 *   - .json (nlohmann::json)
 *   - .toml (toml++)
 *   - .yaml / .yml (yaml-cpp via Codec)
 */

#ifndef YEDIT_LOADER_HPP
#define YEDIT_LOADER_HPP

#include "yedit/Value.hpp"
#include <string>

namespace yedit {

/**
 * @brief Check whether a path names an existing regular file
 */
bool file_exists(const std::string& path);

/**
 * @brief Read an entire file into a string
 *
 * @param path File to read
 * @return File contents (binary-safe)
 * @throws FileNotFoundError if the file does not exist
 * @throws IoError if the file exists but cannot be read
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Load a JSON file, keeping key order.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file.
 *
 * Tables map to mappings, arrays (including arrays of tables) to
 * sequences. Dates and times become their TOML text.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a YAML file.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if YAML syntax is invalid
 */
Value load_yaml_file(const std::string& path);

/**
 * @brief Load a structured file, auto-detecting format by extension.
 *
 * .json -> JSON, .toml -> TOML, .yaml/.yml -> YAML.
 *
 * @param path Path to the file
 * @return Parsed Value (an empty file yields an empty mapping)
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the file has syntax errors
 * @throws ParameterError if the extension is not supported
 */
Value load_structured_file(const std::string& path);

} // namespace yedit

#endif // YEDIT_LOADER_HPP
