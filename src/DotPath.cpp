/**
 * @file DotPath.cpp
 * @brief Implementation of the path grammar
 */

#include "yedit/DotPath.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace yedit {

namespace {
    const char COMMON_SEPARATORS[] = {'.', '#', '|', ':'};

    bool is_key_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) ||
               c == '%' || c == '/' || c == '_' || c == '-';
    }

    /**
     * @brief Key characters while tokenizing: the base set plus the
     *        common separators that are not the active one
     */
    bool is_token_key_char(char c, char separator) {
        if (is_key_char(c)) return true;
        for (char common : COMMON_SEPARATORS) {
            if (c == common && c != separator) return true;
        }
        return false;
    }

    /**
     * @brief Match "[N]" or "[-N]" at `pos`
     * @return Position just past ']' or std::string::npos
     */
    size_t match_index(const std::string& path, size_t pos) {
        const size_t n = path.size();
        if (pos >= n || path[pos] != '[') return std::string::npos;
        size_t q = pos + 1;
        if (q < n && path[q] == '-') ++q;
        const size_t digits = q;
        while (q < n && std::isdigit(static_cast<unsigned char>(path[q]))) ++q;
        if (q == digits || q >= n || path[q] != ']') return std::string::npos;
        return q + 1;
    }
}

bool is_valid_path(const std::string& path) {
    const size_t n = path.size();
    if (n == 0) {
        return false;
    }

    // reach[i]: path[0, i) is a run of complete segments, each with at
    // most one trailing character.
    std::vector<char> reach(n + 1, 0);
    reach[0] = 1;

    auto mark_segment_end = [&](size_t end) {
        reach[end] = 1;
        if (end < n) reach[end + 1] = 1;
    };

    size_t scanned_until = 0;
    for (size_t p = 0; p < n; ++p) {
        if (!reach[p]) continue;

        const size_t idx_end = match_index(path, p);
        if (idx_end != std::string::npos) {
            mark_segment_end(idx_end);
        }

        // Every end inside a key run is a segment end. Starting points
        // inside an already scanned run add nothing new.
        if (p >= scanned_until) {
            size_t q = p;
            while (q < n && is_key_char(path[q])) {
                ++q;
                mark_segment_end(q);
            }
            scanned_until = q;
        }
    }

    return reach[n] != 0;
}

ParsedPath parse_path(const std::string& path, char separator) {
    if (path.empty()) {
        return {};
    }

    if (!is_valid_path(path)) {
        throw InvalidPathError(path, std::string(1, separator));
    }

    ParsedPath steps;
    const size_t n = path.size();
    size_t pos = 0;

    while (pos < n) {
        const size_t idx_end = match_index(path, pos);
        if (idx_end != std::string::npos) {
            try {
                steps.push_back(PathStep::make_index(
                    std::stoll(path.substr(pos + 1, idx_end - pos - 2))));
            } catch (const std::out_of_range&) {
                throw InvalidPathError(path, std::string(1, separator));
            }
            pos = idx_end;
            continue;
        }

        if (is_token_key_char(path[pos], separator)) {
            size_t end = pos;
            while (end < n && is_token_key_char(path[end], separator)) ++end;
            steps.push_back(PathStep::make_key(path.substr(pos, end - pos)));
            pos = end;
            continue;
        }

        // Separators and anything the grammar tolerated between segments
        ++pos;
    }

    return steps;
}

std::string format_path(const ParsedPath& steps, char separator) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& step : steps) {
        if (step.is_index()) {
            oss << '[' << step.index << ']';
        } else {
            if (!first) oss << separator;
            oss << step.key;
        }
        first = false;
    }
    return oss.str();
}

char separator_from_string(const std::string& separator) {
    if (separator.size() != 1) {
        throw InvalidPathError("", separator);
    }
    return separator[0];
}

} // namespace yedit
