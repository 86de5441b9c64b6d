#include "yedit/Config.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Loader.hpp"
#include "yedit/Logger.hpp"
#include "yedit/Util.hpp"

namespace yedit {

Value LoadOptions::default_parameters() {
    Value d = Value::object();
    d["state"] = "present";
    d["debug"] = false;
    d["src"] = nullptr;
    d["content"] = nullptr;
    d["content_type"] = "yaml";
    d["key"] = "";
    d["value"] = nullptr;
    d["value_type"] = "";
    d["update"] = false;
    d["append"] = false;
    d["insert"] = false;
    d["index"] = nullptr;
    d["curr_value"] = nullptr;
    d["curr_value_format"] = "yaml";
    d["backup"] = false;
    d["backup_ext"] = process_start_suffix();
    d["separator"] = ".";
    d["edits"] = nullptr;
    return d;
}

Config Config::load(const LoadOptions& opts) {
    // 1) defaults
    Config cfg(opts.defaults.is_object() ? opts.defaults : Value::object());

    // 2) file
    if (opts.file_path.has_value()) {
        Value filej = read_file_any(*opts.file_path);
        if (!filej.is_object()) {
            throw ParameterError("Parameter file " + *opts.file_path +
                                 " must hold a mapping of parameters");
        }
        cfg.apply_layer(filej);
    }

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    cfg.apply_overrides(opts.overrides);

    return cfg;
}

bool Config::contains(const std::string& name) const {
    return data_.contains(name);
}

void Config::set(const std::string& name, const Value& v) {
    data_[name] = v;
}

Value Config::read_file_any(const std::string& file) {
    return load_structured_file(file);
}

void Config::apply_env_prefix(const std::string& prefix) {
    // prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.rfind(normalized, 0) != 0) {
            continue;
        }

        const std::string key = to_lower(name.substr(normalized.size()));
        if (key.empty()) continue;

        // Only known parameters; the prefix is shared with unrelated variables.
        if (!data_.contains(key)) {
            YEDIT_LOG_DEBUG("Ignoring environment variable %s", name.c_str());
            continue;
        }
        YEDIT_LOG_DEBUG("Parameter %s taken from %s", key.c_str(), name.c_str());
        data_[key] = value;
    }
}

void Config::apply_layer(const Value& layer) {
    for (auto it = layer.begin(); it != layer.end(); ++it) {
        // An unset parameter in a later layer keeps the earlier value.
        if (it.value().is_null()) continue;
        data_[it.key()] = it.value();
    }
}

void Config::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        data_[k] = v;
    }
}

} // namespace yedit
