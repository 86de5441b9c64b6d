/**
 * @file Value.hpp
 * @brief Value type for document trees
 *
 * Uses nlohmann::ordered_json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...}, insertion order preserved)
 */

#ifndef YEDIT_VALUE_HPP
#define YEDIT_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace yedit {

/**
 * @brief Document tree value
 *
 * Alias for nlohmann::ordered_json. The ordered specialisation keeps
 * mapping keys in insertion order so a YAML document can be written back
 * with its keys where the author put them.
 *
 * Note that operator== on ordered_json compares mappings key order
 * sensitively. Use deep_equal() (Util.hpp) for document comparisons.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "float",
 *         "string", "sequence", "mapping")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "sequence";
    if (val.is_object()) return "mapping";
    return "unknown";
}

/**
 * @brief Check if value is a container (sequence or mapping)
 * @param val The value to check
 * @return true if val is sequence or mapping, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace yedit

#endif // YEDIT_VALUE_HPP
