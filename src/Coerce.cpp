/**
 * @file Coerce.cpp
 * @brief Implementation of value coercion
 */

#include "yedit/Coerce.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Parse.hpp"
#include "yedit/Util.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace yedit {

const std::vector<std::string> TRUE_TOKENS = {
    "y", "Y", "yes", "Yes", "YES", "true", "True", "TRUE", "on", "On", "ON"
};

const std::vector<std::string> FALSE_TOKENS = {
    "n", "N", "no", "No", "NO", "false", "False", "FALSE", "off", "Off", "OFF"
};

namespace {
    bool in_list(const std::vector<std::string>& list, const std::string& s) {
        return std::find(list.begin(), list.end(), s) != list.end();
    }
}

ValueFormat parse_value_format(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "yaml") return ValueFormat::Yaml;
    if (lower == "json") return ValueFormat::Json;
    if (lower == "plain-string" || lower == "str") return ValueFormat::PlainString;
    throw ParameterError("Unsupported curr_value_format: " + name +
                         " (expected yaml, json or plain-string)");
}

Value coerce_value(const Value& raw, const std::string& declared_type, const Codec& codec) {
    const bool wants_bool = contains_ci(declared_type, "bool");
    const bool wants_str = contains_ci(declared_type, "str");

    if (raw.is_string() && wants_bool) {
        const auto& text = raw.get_ref<const std::string&>();
        if (in_list(TRUE_TOKENS, text)) return true;
        if (in_list(FALSE_TOKENS, text)) return false;
        throw TypeMismatchError("Not a boolean type. str=[" + text +
                                "] vtype=[" + declared_type + "]");
    }

    if (raw.is_boolean() && wants_str) {
        return raw.get<bool>() ? "True" : "False";
    }

    if (!raw.is_string() || wants_str) {
        return raw;
    }

    const auto& text = raw.get_ref<const std::string&>();
    // '' would load as null
    if (text.empty()) {
        return raw;
    }

    try {
        return codec.parse(text, ContentType::Yaml, "<value>");
    } catch (const DocumentParseError& e) {
        throw TypeMismatchError("Could not determine type of incoming value. value=[" +
                                text + "] vtype=[" + declared_type + "]: " + e.details());
    }
}

std::optional<Value> coerce_current_value(const std::optional<Value>& raw,
                                          ValueFormat format,
                                          const Codec& codec) {
    if (!raw) {
        return std::nullopt;
    }
    if (!raw->is_string() || format == ValueFormat::PlainString) {
        return raw;
    }

    const auto& text = raw->get_ref<const std::string&>();
    try {
        return codec.parse(text, format == ValueFormat::Json ? ContentType::Json
                                                            : ContentType::Yaml,
                           "<curr_value>");
    } catch (const DocumentParseError& e) {
        throw TypeMismatchError("Could not parse current value [" + text + "] as " +
                                (format == ValueFormat::Json ? "json" : "yaml") +
                                ": " + e.details());
    }
}

std::optional<bool> as_bool(const Value& v) {
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    if (v.is_string()) {
        const auto& text = v.get_ref<const std::string&>();
        if (in_list(TRUE_TOKENS, text)) return true;
        if (in_list(FALSE_TOKENS, text)) return false;
    }
    return std::nullopt;
}

std::optional<long long> as_integer(const Value& v) {
    if (v.is_number_integer() && !v.is_number_unsigned()) {
        return v.get<std::int64_t>();
    }
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) {
            return std::nullopt;
        }
        return static_cast<long long>(u);
    }
    if (v.is_string()) {
        const Value parsed = parse_scalar(trim(v.get<std::string>()));
        if (parsed.is_number_integer()) {
            return as_integer(parsed);
        }
    }
    return std::nullopt;
}

} // namespace yedit
