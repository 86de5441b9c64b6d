/**
 * @file Edit.hpp
 * @brief Edit records and batch processing
 *
 * An edit is one put/update/append/insert request against a Document.
 * A batch applies a list of edits in order and either commits all of
 * them or, if any edit throws, leaves the Document exactly as it was.
 */

#ifndef YEDIT_EDIT_HPP
#define YEDIT_EDIT_HPP

#include "yedit/Value.hpp"
#include "yedit/Coerce.hpp"
#include "yedit/Document.hpp"
#include <optional>
#include <string>
#include <vector>

namespace yedit {

/**
 * @brief Operation performed by an edit
 *
 * There is no delete action: removal is a run with state=absent.
 */
enum class EditAction {
    Set,     ///< put
    Update,  ///< update (merge into mapping / replace in sequence)
    Append,  ///< append to sequence
    Insert   ///< insert into sequence
};

std::string to_string(EditAction action);

/**
 * @brief Parse an action name ("set"/"put", "update", "append", "insert")
 * @throws ParameterError for anything else
 */
EditAction parse_edit_action(const std::string& name);

/**
 * @brief One edit request
 *
 * `value` and `curr_value` are kept as supplied; process_edits() types
 * them with coerce_value() / coerce_current_value().
 */
struct Edit {
    std::string key;
    Value value;
    std::string value_type;
    EditAction action = EditAction::Set;
    std::optional<long long> index;
    std::optional<Value> curr_value;
    ValueFormat curr_value_format = ValueFormat::Yaml;

    /**
     * @brief Build an edit from a mapping
     *
     * Recognized keys: key, value, value_type, action, index, curr_value,
     * curr_value_format. The action may also be selected with boolean
     * update / append / insert keys.
     *
     * @throws ParameterError if `entry` is not a mapping or a field is invalid
     */
    static Edit from_value(const Value& entry);
};

/**
 * @brief Build edits from a sequence of mappings
 *
 * A mapping holding an "edits" sequence is accepted as well.
 *
 * @throws ParameterError on malformed input
 */
std::vector<Edit> edits_from_value(const Value& list);

/**
 * @brief A successful edit: its path and the tree right after it
 */
struct EditRecord {
    std::string key;
    Value edit;
};

/**
 * @brief Outcome of a batch
 */
struct BatchResult {
    bool changed = false;
    std::vector<EditRecord> results;

    /// Results as a sequence of {"key": ..., "edit": ...} mappings
    Value results_value() const;
};

/**
 * @brief Apply edits to a document in order
 *
 * Every edit that reports a change contributes one EditRecord. If any
 * edit throws, the document's tree is restored and the exception
 * propagates.
 *
 * Example:
 * ```cpp
 * Edit e1; e1.key = "a.b"; e1.value = "1";
 * Edit e2; e2.key = "a.list"; e2.value = "x"; e2.action = EditAction::Append;
 * auto batch = process_edits(doc, {e1, e2});
 * // batch.changed == true, doc.tree() == {"a": {"b": 1, "list": ["x"]}}
 * ```
 */
BatchResult process_edits(Document& doc, const std::vector<Edit>& edits);

} // namespace yedit

#endif // YEDIT_EDIT_HPP
