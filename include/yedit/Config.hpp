#ifndef YEDIT_CONFIG_HPP
#define YEDIT_CONFIG_HPP

#include "yedit/Value.hpp"
#include <string>
#include <map>
#include <optional>

namespace yedit {

/**
 * @brief Options for assembling run parameters from several sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;  // Parameter file (.json, .toml, .yaml, .yml)
    std::optional<std::string> prefix;     // Environment variable prefix, e.g. "YEDIT"
    std::map<std::string, Value> overrides; // final precedence
    Value defaults = default_parameters();

    static Value default_parameters();
};

/**
 * @brief Layered run parameters.
 *
 * Holds a flat mapping of parameter name to value, built with the
 * precedence defaults -> file -> env (prefix) -> overrides.
 */
class Config {
public:
    Config() = default;
    explicit Config(Value data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Config load(const LoadOptions& opts);

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }
    Value& data() noexcept { return data_; }

    bool contains(const std::string& name) const;
    void set(const std::string& name, const Value& v);

    /**
     * @brief Lay a parameter mapping over the current one
     *
     * Parameters replace whole: a `value` or `content` mapping in the
     * layer is taken as is, never merged into the earlier one. Null
     * entries leave the earlier value in place.
     */
    void apply_layer(const Value& layer);

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

    // File IO
    static Value read_file_any(const std::string& file);

private:
    Value data_ = Value::object();
};

} // namespace yedit

#endif // YEDIT_CONFIG_HPP
