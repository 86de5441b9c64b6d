/**
 * @file Mutate.cpp
 * @brief Implementation of upsert and remove
 */

#include "yedit/Mutate.hpp"
#include "yedit/Navigate.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Util.hpp"

namespace yedit {

namespace {
    /**
     * @brief Descend one step for writing, creating empty mappings for
     *        missing keys
     */
    Value* descend_for_write(Value& node, const PathStep& step,
                             const ParsedPath& steps, char separator) {
        if (step.is_key()) {
            if (!node.is_object()) {
                throw PathConflictError(
                    format_path(steps, separator),
                    "expected mapping before key '" + step.key + "', found " + type_name(node));
            }
            Value& child = node[step.key];
            if (child.is_null()) {
                child = Value::object();
            }
            return &child;
        }

        if (!node.is_array()) {
            throw PathConflictError(
                format_path(steps, separator),
                "expected sequence before index [" + std::to_string(step.index) +
                "], found " + type_name(node));
        }
        auto idx = normalize_index(step.index, node.size());
        if (!idx) {
            throw PathConflictError(
                format_path(steps, separator),
                "index [" + std::to_string(step.index) + "] out of range (size " +
                std::to_string(node.size()) + ")");
        }
        return &node[*idx];
    }

    RemoveStatus remove_from_container(Value& node,
                                       const std::optional<long long>& index,
                                       const std::optional<Value>& match) {
        if (node.is_object()) {
            if (match) {
                if (!match->is_string()) return RemoveStatus::Impossible;
                return node.erase(match->get<std::string>()) > 0
                    ? RemoveStatus::Removed : RemoveStatus::NotFound;
            }
            if (index) return RemoveStatus::Impossible;
            node.clear();
            return RemoveStatus::Removed;
        }

        if (node.is_array()) {
            std::optional<std::size_t> pos;
            if (match) {
                pos = find_equal(node, *match);
            } else if (index) {
                pos = normalize_index(*index, node.size());
            } else {
                node.clear();
                return RemoveStatus::Removed;
            }
            if (!pos) return RemoveStatus::NotFound;
            node.erase(*pos);
            return RemoveStatus::Removed;
        }

        return RemoveStatus::Impossible;
    }
}

void upsert(Value& tree, const ParsedPath& steps, const Value& value, char separator) {
    if (steps.empty()) {
        tree = value;
        return;
    }

    Value* current = &tree;
    for (size_t i = 0; i + 1 < steps.size(); ++i) {
        current = descend_for_write(*current, steps[i], steps, separator);
    }

    const PathStep& last = steps.back();
    if (last.is_key()) {
        if (!current->is_object()) {
            throw PathConflictError(
                format_path(steps, separator),
                "cannot set key '" + last.key + "' on " + type_name(*current));
        }
        (*current)[last.key] = value;
        return;
    }

    if (!current->is_array()) {
        throw PathConflictError(
            format_path(steps, separator),
            "cannot set index [" + std::to_string(last.index) + "] on " + type_name(*current));
    }

    // The next free slot appends; anything further out is an error.
    if (last.index == static_cast<long long>(current->size())) {
        current->push_back(value);
        return;
    }
    auto idx = normalize_index(last.index, current->size());
    if (!idx) {
        throw PathConflictError(
            format_path(steps, separator),
            "index [" + std::to_string(last.index) + "] out of range (size " +
            std::to_string(current->size()) + ")");
    }
    (*current)[*idx] = value;
}

RemoveStatus remove(Value& tree, const ParsedPath& steps,
                    const std::optional<long long>& index,
                    const std::optional<Value>& match) {
    if (index || match || steps.empty()) {
        Value* target = resolve(tree, steps);
        if (target == nullptr) return RemoveStatus::NotFound;
        return remove_from_container(*target, index, match);
    }

    ParsedPath parent_steps(steps.begin(), steps.end() - 1);
    Value* parent = resolve(tree, parent_steps);
    if (parent == nullptr) return RemoveStatus::NotFound;

    const PathStep& last = steps.back();
    if (last.is_index()) {
        if (!parent->is_array()) return RemoveStatus::NotFound;
        auto idx = normalize_index(last.index, parent->size());
        if (!idx) return RemoveStatus::NotFound;
        parent->erase(*idx);
        return RemoveStatus::Removed;
    }

    if (!parent->is_object()) return RemoveStatus::NotFound;
    return parent->erase(last.key) > 0 ? RemoveStatus::Removed : RemoveStatus::NotFound;
}

const char* to_string(RemoveStatus status) {
    switch (status) {
        case RemoveStatus::Removed: return "removed";
        case RemoveStatus::NotFound: return "not found";
        case RemoveStatus::Impossible: return "impossible";
    }
    return "unknown";
}

} // namespace yedit
