#include "yedit/Util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>

extern char **environ;

namespace yedit {

namespace {
    bool numbers_equal(const Value& a, const Value& b) {
        if (a.is_number_float() || b.is_number_float()) {
            return a.get<double>() == b.get<double>();
        }
        if (a.is_number_unsigned() && b.is_number_unsigned()) {
            return a.get<std::uint64_t>() == b.get<std::uint64_t>();
        }
        if (a.is_number_unsigned() || b.is_number_unsigned()) {
            // One side is a signed integer: equal only if it is non-negative.
            const Value& s = a.is_number_unsigned() ? b : a;
            const Value& u = a.is_number_unsigned() ? a : b;
            const auto sv = s.get<std::int64_t>();
            return sv >= 0 && static_cast<std::uint64_t>(sv) == u.get<std::uint64_t>();
        }
        return a.get<std::int64_t>() == b.get<std::int64_t>();
    }
}

bool deep_equal(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        return numbers_equal(a, b);
    }
    if (a.type() != b.type()) {
        return false;
    }
    if (a.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !deep_equal(it.value(), *other)) {
                return false;
            }
        }
        return true;
    }
    if (a.is_array()) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!deep_equal(a[i], b[i])) return false;
        }
        return true;
    }
    return a == b;
}

std::optional<std::size_t> find_equal(const Value& seq, const Value& item) {
    if (!seq.is_array()) return std::nullopt;
    for (std::size_t i = 0; i < seq.size(); ++i) {
        if (deep_equal(seq[i], item)) return i;
    }
    return std::nullopt;
}

std::optional<std::size_t> normalize_index(long long index, std::size_t size) {
    const auto n = static_cast<long long>(size);
    if (index < 0) index += n;
    if (index < 0 || index >= n) return std::nullopt;
    return static_cast<std::size_t>(index);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

const std::string& process_start_suffix() {
    static const std::string suffix = [] {
        std::time_t now = std::time(nullptr);
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &tm_buf);
        return "." + std::string(stamp);
    }();
    return suffix;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
        }
    }
    return envs;
}

std::string describe(const Value& v) {
    return v.dump(-1, ' ', false, Value::error_handler_t::replace);
}

} // namespace yedit
