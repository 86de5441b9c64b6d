/**
 * @file Coerce.hpp
 * @brief Typing of incoming edit values and "current value" comparators
 *
 * Values usually arrive as untyped text (command line, environment).
 * coerce_value() gives them their natural type, honoring an optional
 * declared type; coerce_current_value() parses the comparator used to
 * locate a sequence element for a conditional update.
 */

#ifndef YEDIT_COERCE_HPP
#define YEDIT_COERCE_HPP

#include "yedit/Value.hpp"
#include "yedit/Codec.hpp"
#include <optional>
#include <string>
#include <vector>

namespace yedit {

/**
 * @brief Format of a "current value" comparator
 */
enum class ValueFormat {
    Yaml,
    Json,
    PlainString
};

/**
 * @brief Parse a comparator format name
 *
 * Accepts "yaml", "json", "plain-string" and its short alias "str".
 *
 * @throws ParameterError for anything else
 */
ValueFormat parse_value_format(const std::string& name);

/// Truthy tokens accepted when a boolean is declared
extern const std::vector<std::string> TRUE_TOKENS;
/// Falsy tokens accepted when a boolean is declared
extern const std::vector<std::string> FALSE_TOKENS;

/**
 * @brief Give an incoming value its type
 *
 * Rules, in order:
 * - declared type mentions "bool" and raw is text: the text must be one of
 *   TRUE_TOKENS / FALSE_TOKENS and becomes true / false
 * - declared type mentions "str" and raw is a boolean: becomes "True" /
 *   "False"
 * - empty text is returned unchanged
 * - text with a declared type that does not mention "str" is parsed as a
 *   YAML fragment ("5" → 5, "[1, 2]" → sequence, "{a: 1}" → mapping)
 * - anything else is returned unchanged
 *
 * @param raw Incoming value (text or already typed)
 * @param declared_type Free-form type hint ("", "bool", "str", "int", ...)
 * @param codec Parser used for YAML fragments
 * @throws TypeMismatchError if a boolean was declared but the text is not
 *         a boolean token, or the YAML fragment does not parse
 */
Value coerce_value(const Value& raw, const std::string& declared_type = "",
                   const Codec& codec = Codec());

/**
 * @brief Parse the comparator for a conditional sequence update
 *
 * @param raw Comparator as supplied; nullopt stays nullopt
 * @param format yaml / json parse text; plain-string keeps it verbatim
 * @param codec Parser used for YAML and JSON text
 * @throws TypeMismatchError if the text does not parse in `format`
 */
std::optional<Value> coerce_current_value(const std::optional<Value>& raw,
                                          ValueFormat format,
                                          const Codec& codec = Codec());

/**
 * @brief Read a parameter as a boolean
 *
 * Accepts a boolean, or text from TRUE_TOKENS / FALSE_TOKENS.
 *
 * @return The boolean, or nullopt if `v` is neither
 */
std::optional<bool> as_bool(const Value& v);

/**
 * @brief Read a parameter as an integer
 *
 * Accepts a signed or unsigned integer within range, or text that
 * parse_scalar() resolves to one ("5", "-2", "0x10").
 *
 * @return The integer, or nullopt if `v` is neither
 */
std::optional<long long> as_integer(const Value& v);

} // namespace yedit

#endif // YEDIT_COERCE_HPP
