/**
 * @file Mutate.hpp
 * @brief Destructive tree operations: upsert and remove
 *
 * Both functions mutate the tree they are handed. Callers that need
 * "all or nothing" behavior run them against a working copy and swap
 * the copy in on success (see Document).
 */

#ifndef YEDIT_MUTATE_HPP
#define YEDIT_MUTATE_HPP

#include "yedit/Value.hpp"
#include "yedit/DotPath.hpp"
#include <optional>
#include <string>

namespace yedit {

/**
 * @brief Outcome of remove()
 */
enum class RemoveStatus {
    Removed,     ///< Something was deleted
    NotFound,    ///< Path, key, index or item does not exist
    Impossible   ///< The request does not fit the node (e.g. index on a mapping)
};

/**
 * @brief Create or replace the value at a path
 *
 * Walks all but the last step. A missing (or null) mapping entry on the
 * way is created as an empty mapping; an index step must address an
 * existing element. At the last step:
 * - index step: replaces the element if in range, appends if the index
 *   equals the sequence length, fails otherwise (no padding)
 * - key step: sets or overwrites the key
 * An empty path replaces the whole tree.
 *
 * @param tree Tree to modify in place
 * @param steps Parsed path
 * @param value Value to store
 * @param separator Used to render the path in error messages
 * @throws PathConflictError if a step meets a node of the wrong kind or
 *         an index is out of range; the tree may already contain newly
 *         created intermediate mappings at that point
 *
 * Examples:
 * ```cpp
 * Value doc = Value::object();
 * upsert(doc, parse_path("a.b.c"), "d");     // {"a": {"b": {"c": "d"}}}
 * Value list = {{"a", Value::array({1, 2})}};
 * upsert(list, parse_path("a[2]"), 3);       // a == [1, 2, 3]
 * upsert(list, parse_path("a[9]"), 4);       // throws PathConflictError
 * ```
 */
void upsert(Value& tree, const ParsedPath& steps, const Value& value,
            char separator = DEFAULT_SEPARATOR);

/**
 * @brief Remove a node, a key, or a sequence item
 *
 * Without `index` and `match`:
 * - root path: clears the root mapping or sequence
 * - other paths: deletes the addressed key or element from its parent
 *
 * With `index` or `match`, the rules apply to the container the path
 * resolves to:
 * - mapping: `match` names the key to delete; `index` is Impossible
 * - sequence: `match` deletes the first equal element, otherwise `index`
 *   deletes the element at that (possibly negative) position
 *
 * @return Removed, NotFound (nothing matched; tree untouched) or
 *         Impossible (tree untouched)
 */
RemoveStatus remove(Value& tree, const ParsedPath& steps,
                    const std::optional<long long>& index = std::nullopt,
                    const std::optional<Value>& match = std::nullopt);

/**
 * @brief Human-readable name of a RemoveStatus
 */
const char* to_string(RemoveStatus status);

} // namespace yedit

#endif // YEDIT_MUTATE_HPP
