/**
 * @file Parse.hpp
 * @brief Plain scalar resolution (YAML 1.2 core schema)
 *
 * Converts the text of an untagged, unquoted scalar into a typed Value.
 *
 * Resolution order (first match wins):
 * - S1: Null ("", "~", "null", "Null", "NULL")
 * - S2: Boolean ("true", "True", "TRUE", "false", "False", "FALSE")
 * - S3: Integer (^[-+]?[0-9]+$, ^0o[0-7]+$, ^0x[0-9a-fA-F]+$)
 * - S4: Float (^[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?$,
 *       ".inf" / "-.inf" / ".nan" in their three spellings)
 * - S5: String (fallback)
 */

#ifndef YEDIT_PARSE_HPP
#define YEDIT_PARSE_HPP

#include "yedit/Value.hpp"
#include <string>

namespace yedit {

/**
 * @brief Resolve plain scalar text to a typed Value
 *
 * @param str Scalar text exactly as written (no surrounding quotes)
 * @return Typed Value
 *
 * Examples:
 * ```cpp
 * parse_scalar("true")      // → true (boolean)
 * parse_scalar("yes")       // → "yes" (string; YAML 1.2 has no yes/no)
 * parse_scalar("~")         // → null
 * parse_scalar("42")        // → 42 (integer)
 * parse_scalar("0x1F")      // → 31 (integer)
 * parse_scalar("-2.5e3")    // → -2500.0 (float)
 * parse_scalar("1.")        // → 1.0 (float)
 * parse_scalar(".inf")      // → +infinity (float)
 * parse_scalar("hello")     // → "hello" (string)
 * ```
 */
Value parse_scalar(const std::string& str);

/**
 * @brief Check whether plain text would resolve to a string
 *
 * Serializers use this to decide when a string value needs quotes so
 * that it reads back as a string ("true", "1.5", "null", "").
 */
bool resolves_to_string(const std::string& str);

} // namespace yedit

#endif // YEDIT_PARSE_HPP
