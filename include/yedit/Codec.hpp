/**
 * @file Codec.hpp
 * @brief Text <-> tree conversion for YAML and JSON documents
 *
 * - YAML is read and written with yaml-cpp. Mapping key order and
 *   sequence order are preserved. Plain scalars are typed with
 *   parse_scalar(); quoted scalars stay strings.
 * - JSON is read with nlohmann::json (key order preserved) and written
 *   with sorted keys and a 4-space indent.
 *
 * A Codec holds no global state. Each Document owns its own instance.
 */

#ifndef YEDIT_CODEC_HPP
#define YEDIT_CODEC_HPP

#include "yedit/Value.hpp"
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace yedit {

/**
 * @brief Supported document formats
 */
enum class ContentType {
    Yaml,
    Json
};

/**
 * @brief Parse a content type name ("yaml" or "json", case-insensitive)
 * @throws ParameterError for anything else
 */
ContentType parse_content_type(const std::string& name);

/**
 * @brief Lowercase name of a content type
 */
std::string to_string(ContentType type);

/**
 * @brief A YAML mapping key that could not be represented as a string
 *
 * Collection keys (e.g. "? [a, b]") have no place in a string-keyed
 * tree. They are dropped while loading and reported through this record.
 */
struct DroppedKey {
    std::string path;  ///< Path of the mapping that held the key ("" = root)
    std::string key;   ///< The key rendered as flow YAML
};

/**
 * @brief YAML/JSON parser and serializer
 */
class Codec {
public:
    Codec() = default;

    /**
     * @brief Parse document text into a tree
     *
     * @param text Document text; empty or whitespace-only text yields null
     * @param type Format of the text
     * @param source Name used in error messages (file path or "<content>")
     * @param dropped If non-null, receives keys dropped while loading YAML
     * @return Parsed tree
     * @throws DocumentParseError on syntax errors
     */
    Value parse(const std::string& text, ContentType type,
                const std::string& source = "<content>",
                std::vector<DroppedKey>* dropped = nullptr) const;

    /**
     * @brief Serialize a tree
     *
     * YAML output keeps key order and uses block style; strings that
     * would read back as another type are double-quoted. JSON output
     * sorts keys and indents by 4 spaces. Both end with a newline.
     *
     * @throws TypeMismatchError if a string is not valid UTF-8 (JSON)
     * @throws YeditError if the YAML emitter reports an error
     */
    std::string dump(const Value& tree, ContentType type) const;

    /**
     * @brief Convert an already parsed yaml-cpp node
     */
    Value from_yaml(const YAML::Node& node, std::vector<DroppedKey>* dropped = nullptr) const;

private:
    Value parse_yaml(const std::string& text, const std::string& source,
                     std::vector<DroppedKey>* dropped) const;
    Value parse_json(const std::string& text, const std::string& source) const;
    std::string dump_yaml(const Value& tree) const;
    std::string dump_json(const Value& tree) const;
};

} // namespace yedit

#endif // YEDIT_CODEC_HPP
