/**
 * @file Parse.cpp
 * @brief Implementation of plain scalar resolution
 */

#include "yedit/Parse.hpp"
#include <cstdint>
#include <limits>
#include <regex>
#include <stdexcept>

namespace yedit {

namespace {
    const std::regex& decimal_int_re() {
        static const std::regex re("^[-+]?[0-9]+$");
        return re;
    }

    const std::regex& octal_int_re() {
        static const std::regex re("^0o[0-7]+$");
        return re;
    }

    const std::regex& hex_int_re() {
        static const std::regex re("^0x[0-9a-fA-F]+$");
        return re;
    }

    const std::regex& float_re() {
        static const std::regex re("^[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?$");
        return re;
    }

    const std::regex& inf_re() {
        static const std::regex re("^[-+]?\\.(inf|Inf|INF)$");
        return re;
    }

    const std::regex& nan_re() {
        static const std::regex re("^\\.(nan|NaN|NAN)$");
        return re;
    }

    int digit_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return c - 'A' + 10;
    }

    /**
     * @brief Parse unsigned digits in `base`, widening to uint64 and
     *        finally double when the value does not fit
     */
    Value parse_integer(const std::string& digits, int base, bool negative) {
        try {
            size_t pos = 0;
            unsigned long long val = std::stoull(digits, &pos, base);
            if (!negative) {
                if (val <= static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max())) {
                    return static_cast<std::int64_t>(val);
                }
                return static_cast<std::uint64_t>(val);
            }
            const auto min_magnitude =
                static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max()) + 1ULL;
            if (val < min_magnitude) {
                return -static_cast<std::int64_t>(val);
            }
            if (val == min_magnitude) {
                return std::numeric_limits<std::int64_t>::min();
            }
        } catch (const std::out_of_range&) {
            // Fall through to double
        }

        double d = 0.0;
        for (char c : digits) {
            d = d * base + digit_value(c);
        }
        return negative ? -d : d;
    }
}

Value parse_scalar(const std::string& str) {
    // S1: Null
    if (str.empty() || str == "~" || str == "null" || str == "Null" || str == "NULL") {
        return nullptr;
    }

    // S2: Boolean
    if (str == "true" || str == "True" || str == "TRUE") {
        return true;
    }
    if (str == "false" || str == "False" || str == "FALSE") {
        return false;
    }

    // S3: Integer
    if (std::regex_match(str, decimal_int_re())) {
        const bool negative = str[0] == '-';
        const bool signed_text = str[0] == '-' || str[0] == '+';
        return parse_integer(signed_text ? str.substr(1) : str, 10, negative);
    }
    if (std::regex_match(str, octal_int_re())) {
        return parse_integer(str.substr(2), 8, false);
    }
    if (std::regex_match(str, hex_int_re())) {
        return parse_integer(str.substr(2), 16, false);
    }

    // S4: Float
    if (std::regex_match(str, float_re())) {
        try {
            return std::stod(str);
        } catch (const std::out_of_range&) {
            return str[0] == '-' ? -std::numeric_limits<double>::infinity()
                                 : std::numeric_limits<double>::infinity();
        }
    }
    if (std::regex_match(str, inf_re())) {
        return str[0] == '-' ? -std::numeric_limits<double>::infinity()
                             : std::numeric_limits<double>::infinity();
    }
    if (std::regex_match(str, nan_re())) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // S5: String
    return str;
}

bool resolves_to_string(const std::string& str) {
    return parse_scalar(str).is_string();
}

} // namespace yedit
