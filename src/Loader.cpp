/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "yedit/Loader.hpp"
#include "yedit/Codec.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace yedit {

namespace {

/**
 * @brief Convert toml++ value to a document Value.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << *node.as_date();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << *node.as_time();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << *node.as_date_time();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_text_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError(path, "open", std::error_code(errno, std::generic_category()));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw IoError(path, "read", std::error_code(errno, std::generic_category()));
    }
    return ss.str();
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

// ============================================================================
// JSON File Loading
// ============================================================================

Value load_json_file(const std::string& path) {
    const std::string content = read_text_file(path);
    Value parsed = Codec().parse(content, ContentType::Json, path);
    return parsed.is_null() ? Value::object() : parsed;
}

// ============================================================================
// TOML File Loading
// ============================================================================

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw DocumentParseError(path, details.str());
    }

    return toml_value_to_json(table);
}

// ============================================================================
// YAML File Loading
// ============================================================================

Value load_yaml_file(const std::string& path) {
    const std::string content = read_text_file(path);
    Value parsed = Codec().parse(content, ContentType::Yaml, path);
    return parsed.is_null() ? Value::object() : parsed;
}

// ============================================================================
// Auto-detect File Loading
// ============================================================================

Value load_structured_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    } else if (ext == ".yaml" || ext == ".yml") {
        return load_yaml_file(path);
    }
    throw ParameterError("Unsupported file type: " + ext +
                         " (expected .json, .toml, .yaml or .yml)");
}

} // namespace yedit
