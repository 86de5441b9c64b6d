#ifndef YEDIT_UTIL_HPP
#define YEDIT_UTIL_HPP

#include "yedit/Value.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <utility>

namespace yedit {

// Structural equality: mappings compare key-order independently, sequences
// element-wise, numbers by value. A boolean never equals a number.
bool deep_equal(const Value& a, const Value& b);

// Position of the first element of `seq` deep-equal to `item`, or nullopt.
std::optional<std::size_t> find_equal(const Value& seq, const Value& item);

// Map a possibly negative index onto [0, size). nullopt if out of range.
std::optional<std::size_t> normalize_index(long long index, std::size_t size);

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);
bool contains_ci(const std::string& haystack, const std::string& needle);

// "." + local time formatted %Y%m%dT%H%M%S, fixed at first call.
const std::string& process_start_suffix();

// (NAME, VALUE) pairs of the process environment.
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Compact one-line rendering of a value for log and error messages.
std::string describe(const Value& v);

} // namespace yedit

#endif // YEDIT_UTIL_HPP
