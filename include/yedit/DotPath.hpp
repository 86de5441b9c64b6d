/**
 * @file DotPath.hpp
 * @brief Path grammar for addressing nodes inside a document tree
 *
 * A path is a sequence of steps separated by a configurable separator
 * (default '.'). Each step is either a mapping key or a bracketed
 * sequence index, e.g. "a.b[2].c" or "servers[-1].name".
 *
 * Grammar rules:
 * - Key names consist of [0-9a-zA-Z%/_-]
 * - Index steps are "[N]" where N may be negative (counted from the end)
 * - The well-known separators {'.', '#', '|', ':'} other than the active
 *   one are ordinary key characters
 * - The empty string addresses the document root and has no steps
 */

#ifndef YEDIT_DOTPATH_HPP
#define YEDIT_DOTPATH_HPP

#include "yedit/Errors.hpp"
#include <string>
#include <vector>

namespace yedit {

constexpr char DEFAULT_SEPARATOR = '.';

/**
 * @brief One step of a parsed path: a mapping key or a sequence index
 */
struct PathStep {
    enum class Kind { Key, Index };

    Kind kind = Kind::Key;
    std::string key;
    long long index = 0;

    static PathStep make_key(std::string k) {
        PathStep s;
        s.kind = Kind::Key;
        s.key = std::move(k);
        return s;
    }

    static PathStep make_index(long long i) {
        PathStep s;
        s.kind = Kind::Index;
        s.index = i;
        return s;
    }

    bool is_key() const noexcept { return kind == Kind::Key; }
    bool is_index() const noexcept { return kind == Kind::Index; }

    bool operator==(const PathStep& other) const {
        return kind == other.kind && key == other.key && index == other.index;
    }
};

using ParsedPath = std::vector<PathStep>;

/**
 * @brief Check a path string against the path grammar
 *
 * A non-empty string is valid iff it splits into segments, each either
 * "[N]" or a run of key characters, and each optionally followed by a
 * single arbitrary character (the separator). Two separators in a row,
 * a leading separator or characters outside the key set are rejected.
 *
 * @param path Path string
 * @return true if the grammar accepts the string; false for "" as well
 *
 * Examples:
 * - "a.b.c"      → true
 * - "a[0].b"     → true
 * - "a[-1]"      → true
 * - "a..b"       → false
 * - ".a"         → false
 * - "a b"        → true (the space acts as a separator)
 */
bool is_valid_path(const std::string& path);

/**
 * @brief Tokenize a path string into steps
 *
 * @param path Path string ("" for the root)
 * @param separator Active separator character
 * @return Ordered steps; empty for the root path
 * @throws InvalidPathError if the path fails is_valid_path() or an index
 *         does not fit a 64-bit integer
 *
 * Examples:
 * ```cpp
 * parse_path("a.b[2].c");       // key a, key b, index 2, key c
 * parse_path("a#b");            // single key "a#b" ('#' is not active)
 * parse_path("a#b", '#');       // key a, key b
 * parse_path("");               // no steps (root)
 * ```
 */
ParsedPath parse_path(const std::string& path, char separator = DEFAULT_SEPARATOR);

/**
 * @brief Render steps back into path text
 *
 * @param steps Steps to render
 * @param separator Separator placed between key steps
 * @return Path string, e.g. "a.b[2].c"
 */
std::string format_path(const ParsedPath& steps, char separator = DEFAULT_SEPARATOR);

/**
 * @brief Validate a separator given as text
 *
 * @param separator Separator string from parameters
 * @return The separator character
 * @throws InvalidPathError if the string is not exactly one character
 */
char separator_from_string(const std::string& separator);

} // namespace yedit

#endif // YEDIT_DOTPATH_HPP
