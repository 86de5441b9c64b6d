/**
 * @file Navigate.hpp
 * @brief Read-only resolution of paths inside a document tree
 *
 * Resolution never creates nodes and never throws for a path that does
 * not exist: a missing key, an index out of range, an index applied to a
 * mapping, a key applied to a sequence, or a scalar in the middle of the
 * path all resolve to nullptr. Only a syntactically invalid path string
 * raises (InvalidPathError, from the grammar layer).
 */

#ifndef YEDIT_NAVIGATE_HPP
#define YEDIT_NAVIGATE_HPP

#include "yedit/Value.hpp"
#include "yedit/DotPath.hpp"
#include <string>

namespace yedit {

/**
 * @brief Resolve parsed steps against a tree
 *
 * @param tree Root of the tree
 * @param steps Parsed path; empty addresses the root
 * @return Pointer to the node at the path, or nullptr if any step cannot
 *         be followed
 *
 * Examples:
 * ```cpp
 * Value doc = {{"a", {{"b", Value::array({1, 2, 3})}}}};
 * resolve(doc, parse_path("a.b[1]"));   // → 2
 * resolve(doc, parse_path("a.b[-1]"));  // → 3
 * resolve(doc, parse_path("a.b[3]"));   // → nullptr
 * resolve(doc, parse_path("a.x.y"));    // → nullptr
 * ```
 */
const Value* resolve(const Value& tree, const ParsedPath& steps);

/**
 * @brief Mutable overload used by the mutator and the document engine
 */
Value* resolve(Value& tree, const ParsedPath& steps);

/**
 * @brief Parse `path` with `separator` and resolve it
 * @throws InvalidPathError if the path string is malformed
 */
const Value* resolve(const Value& tree, const std::string& path,
                     char separator = DEFAULT_SEPARATOR);

/**
 * @brief Follow a single step from `node`
 * @return Child node or nullptr
 */
const Value* step_into(const Value& node, const PathStep& step);

} // namespace yedit

#endif // YEDIT_NAVIGATE_HPP
