/**
 * @file Document.hpp
 * @brief Document engine: owns one tree and its backing file
 *
 * Every mutating operation returns an OpResult. Missing paths, keys,
 * indices or items are reported as changed == false, never thrown.
 * Malformed paths (InvalidPathError), structural conflicts
 * (PathConflictError) and type violations (TypeMismatchError) throw.
 * No operation leaves the tree partially modified when it throws.
 */

#ifndef YEDIT_DOCUMENT_HPP
#define YEDIT_DOCUMENT_HPP

#include "yedit/Value.hpp"
#include "yedit/Codec.hpp"
#include "yedit/DotPath.hpp"
#include <optional>
#include <string>
#include <vector>

namespace yedit {

/**
 * @brief Construction options for a Document
 */
struct DocumentOptions {
    std::optional<std::string> filename;
    std::optional<Value> content;  ///< Text to parse, or an already structured tree
    ContentType content_type = ContentType::Yaml;
    char separator = DEFAULT_SEPARATOR;
    bool backup = false;
    std::string backup_ext;        ///< Empty: process_start_suffix()
};

/**
 * @brief Outcome of a Document operation
 */
struct OpResult {
    bool changed = false;
    Value result;  ///< Snapshot of the whole tree after the operation
};

/**
 * @brief Path-addressed editing of a YAML/JSON document
 *
 * Example:
 * ```cpp
 * Document doc(DocumentOptions{});
 * doc.put("a.b.c", "d");                   // changed
 * doc.put("a.b.c", "d");                   // unchanged
 * doc.append("a.list", 1);                 // creates a.list = [1]
 * const Value* v = doc.get("a.b");         // {"c": "d"}
 * ```
 */
class Document {
public:
    explicit Document(DocumentOptions opts = DocumentOptions());

    // Access the underlying tree
    const Value& tree() const noexcept { return tree_; }
    void set_tree(Value tree) { tree_ = std::move(tree); }

    /**
     * @brief Replace the tree with one parsed elsewhere, along with the
     *        keys dropped while parsing it
     */
    void set_tree(Value tree, std::vector<DroppedKey> dropped) {
        tree_ = std::move(tree);
        dropped_ = std::move(dropped);
    }

    const DocumentOptions& options() const noexcept { return opts_; }
    char separator() const noexcept { return opts_.separator; }
    const Codec& codec() const noexcept { return codec_; }

    /**
     * @brief Keys dropped from the current tree's source (non-scalar YAML keys)
     */
    const std::vector<DroppedKey>& dropped_keys() const noexcept { return dropped_; }

    // File IO
    bool file_exists() const;
    std::optional<std::string> read() const;

    /**
     * @brief Load the tree from content or file
     *
     * In-memory content wins over file text. Structured content is taken
     * as is. With nothing to load the tree is left as it is (an empty
     * mapping for a fresh Document).
     *
     * @throws DocumentParseError if the text is malformed
     */
    const Value& load();

    /**
     * @brief Serialize the tree and replace the backing file durably
     *
     * @throws YeditError if no filename is configured
     * @throws IoError if the write protocol fails
     */
    OpResult write();

    // Operations
    const Value* get(const std::string& path) const;
    OpResult put(const std::string& path, const Value& value);
    OpResult create(const std::string& path, const Value& value);
    OpResult update(const std::string& path, const Value& value,
                    const std::optional<long long>& index = std::nullopt,
                    const std::optional<Value>& curr_value = std::nullopt);
    OpResult append(const std::string& path, const Value& value);
    OpResult insert(const std::string& path, const Value& value, long long index = 0);
    OpResult remove(const std::string& path,
                    const std::optional<long long>& index = std::nullopt,
                    const std::optional<Value>& match = std::nullopt);
    OpResult pop(const std::string& path, const Value& key_or_item);
    bool exists(const std::string& path, const Value& value) const;

private:
    OpResult unchanged() const { return OpResult{false, tree_}; }
    OpResult changed() const { return OpResult{true, tree_}; }

    // Resolve `path`, creating an empty sequence there if it is missing or null.
    Value* sequence_at(const std::string& path);

    DocumentOptions opts_;
    Codec codec_;
    Value tree_ = Value::object();
    std::vector<DroppedKey> dropped_;
};

} // namespace yedit

#endif // YEDIT_DOCUMENT_HPP
