/**
 * @file Navigate.cpp
 * @brief Implementation of read-only path resolution
 */

#include "yedit/Navigate.hpp"
#include "yedit/Util.hpp"

namespace yedit {

const Value* step_into(const Value& node, const PathStep& step) {
    if (step.is_key()) {
        if (!node.is_object()) return nullptr;
        auto it = node.find(step.key);
        if (it == node.end()) return nullptr;
        return &(*it);
    }

    if (!node.is_array()) return nullptr;
    auto idx = normalize_index(step.index, node.size());
    if (!idx) return nullptr;
    return &node[*idx];
}

const Value* resolve(const Value& tree, const ParsedPath& steps) {
    const Value* current = &tree;
    for (const auto& step : steps) {
        current = step_into(*current, step);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

Value* resolve(Value& tree, const ParsedPath& steps) {
    return const_cast<Value*>(resolve(static_cast<const Value&>(tree), steps));
}

const Value* resolve(const Value& tree, const std::string& path, char separator) {
    return resolve(tree, parse_path(path, separator));
}

} // namespace yedit
