/**
 * @file Codec.cpp
 * @brief YAML (yaml-cpp) and JSON (nlohmann::json) conversion
 */

#include "yedit/Codec.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Logger.hpp"
#include "yedit/Parse.hpp"
#include "yedit/Util.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <cmath>

namespace yedit {

// ============================================================================
// Content type names
// ============================================================================

ContentType parse_content_type(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "yaml" || lower == "yml") return ContentType::Yaml;
    if (lower == "json") return ContentType::Json;
    throw ParameterError("Unsupported content_type: " + name +
                         ". Please specify a content_type of yaml or json.");
}

std::string to_string(ContentType type) {
    return type == ContentType::Json ? "json" : "yaml";
}

// ============================================================================
// YAML -> Value
// ============================================================================

namespace {

const std::string TAG_PREFIX = "tag:yaml.org,2002:";

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

/**
 * @brief Type a scalar node according to its tag
 *
 * "!" marks a quoted scalar, "?" (or no tag) a plain one. Core schema
 * tags resolve the text; unknown application tags keep the text.
 */
Value scalar_to_value(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    const std::string& text = node.Scalar();

    if (tag == "!" || tag == TAG_PREFIX + "str") {
        return text;
    }
    if (tag.empty() || tag == "?" ||
        tag == TAG_PREFIX + "int" || tag == TAG_PREFIX + "float" ||
        tag == TAG_PREFIX + "bool" || tag == TAG_PREFIX + "null") {
        return parse_scalar(text);
    }
    return text;
}

std::string join_key(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

Value node_to_value(const YAML::Node& node, const std::string& path,
                    std::vector<DroppedKey>* dropped) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;

        case YAML::NodeType::Scalar:
            return scalar_to_value(node);

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            std::size_t i = 0;
            for (const auto& elem : node) {
                arr.push_back(node_to_value(elem, path + "[" + std::to_string(i) + "]", dropped));
                ++i;
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) {
                const YAML::Node& key_node = kv.first;
                std::string key;
                if (key_node.IsScalar()) {
                    key = key_node.Scalar();
                } else if (key_node.IsNull()) {
                    key = "null";
                } else {
                    YAML::Emitter flow;
                    flow.SetMapFormat(YAML::Flow);
                    flow.SetSeqFormat(YAML::Flow);
                    flow << key_node;
                    DroppedKey record{path, flow.c_str()};
                    YEDIT_LOG_WARN("Dropping non-scalar mapping key %s at '%s'",
                                   record.key.c_str(), path.c_str());
                    if (dropped != nullptr) dropped->push_back(std::move(record));
                    continue;
                }
                obj[key] = node_to_value(kv.second, join_key(path, key), dropped);
            }
            return obj;
        }
    }
    return nullptr;
}

// ============================================================================
// Value -> YAML
// ============================================================================

std::string format_float(double d) {
    if (std::isnan(d)) return ".nan";
    if (std::isinf(d)) return d > 0 ? ".inf" : "-.inf";
    // nlohmann prints the shortest round-trip form and keeps ".0"
    return nlohmann::json(d).dump();
}

void emit_value(YAML::Emitter& out, const Value& v) {
    switch (v.type()) {
        case Value::value_t::object:
            if (v.empty()) {
                out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
                break;
            }
            out << YAML::BeginMap;
            for (auto it = v.begin(); it != v.end(); ++it) {
                out << YAML::Key << it.key() << YAML::Value;
                emit_value(out, it.value());
            }
            out << YAML::EndMap;
            break;

        case Value::value_t::array:
            if (v.empty()) {
                out << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
                break;
            }
            out << YAML::BeginSeq;
            for (const auto& elem : v) {
                emit_value(out, elem);
            }
            out << YAML::EndSeq;
            break;

        case Value::value_t::string: {
            const auto& s = v.get_ref<const std::string&>();
            if (resolves_to_string(s)) {
                out << s;
            } else {
                out << YAML::DoubleQuoted << s;
            }
            break;
        }

        case Value::value_t::boolean:
            out << v.get<bool>();
            break;

        case Value::value_t::number_integer:
            out << static_cast<long long>(v.get<std::int64_t>());
            break;

        case Value::value_t::number_unsigned:
            out << static_cast<unsigned long long>(v.get<std::uint64_t>());
            break;

        case Value::value_t::number_float:
            out << format_float(v.get<double>());
            break;

        default:
            out << YAML::Null;
            break;
    }
}

} // anonymous namespace

Value Codec::from_yaml(const YAML::Node& node, std::vector<DroppedKey>* dropped) const {
    return node_to_value(node, "", dropped);
}

Value Codec::parse_yaml(const std::string& text, const std::string& source,
                        std::vector<DroppedKey>* dropped) const {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw DocumentParseError(source, e.what());
    }
    return from_yaml(root, dropped);
}

Value Codec::parse_json(const std::string& text, const std::string& source) const {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(source, e.what());
    }
}

Value Codec::parse(const std::string& text, ContentType type,
                   const std::string& source,
                   std::vector<DroppedKey>* dropped) const {
    if (is_blank(text)) {
        return nullptr;
    }
    if (type == ContentType::Json) {
        return parse_json(text, source);
    }
    return parse_yaml(text, source, dropped);
}

std::string Codec::dump_yaml(const Value& tree) const {
    YAML::Emitter out;
    out.SetNullFormat(YAML::LowerNull);
    out.SetIndent(2);
    emit_value(out, tree);
    if (!out.good()) {
        throw YeditError("YAML emitter failed: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

std::string Codec::dump_json(const Value& tree) const {
    // nlohmann::json keeps object keys in a std::map, which sorts them.
    const nlohmann::json sorted(tree);
    try {
        return sorted.dump(4) + "\n";
    } catch (const nlohmann::json::type_error& e) {
        throw TypeMismatchError(std::string("cannot encode document as JSON: ") + e.what());
    }
}

std::string Codec::dump(const Value& tree, ContentType type) const {
    if (type == ContentType::Json) {
        return dump_json(tree);
    }
    return dump_yaml(tree);
}

} // namespace yedit
