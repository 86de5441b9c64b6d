/**
 * @file Edit.cpp
 * @brief Implementation of edit parsing and batch processing
 */

#include "yedit/Edit.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Logger.hpp"
#include "yedit/Util.hpp"

namespace yedit {

std::string to_string(EditAction action) {
    switch (action) {
        case EditAction::Set: return "set";
        case EditAction::Update: return "update";
        case EditAction::Append: return "append";
        case EditAction::Insert: return "insert";
    }
    return "set";
}

EditAction parse_edit_action(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "set" || lower == "put" || lower.empty()) return EditAction::Set;
    if (lower == "update") return EditAction::Update;
    if (lower == "append") return EditAction::Append;
    if (lower == "insert") return EditAction::Insert;
    throw ParameterError("Unsupported edit action: " + name +
                         " (expected set, update, append or insert)");
}

namespace {

bool flag(const Value& entry, const char* name) {
    auto it = entry.find(name);
    if (it == entry.end() || it->is_null()) {
        return false;
    }
    auto b = as_bool(*it);
    if (!b) {
        throw ParameterError(std::string("edit field '") + name + "' is not a boolean: " +
                             describe(*it));
    }
    return *b;
}

std::string text_field(const Value& entry, const char* name) {
    auto it = entry.find(name);
    if (it == entry.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw ParameterError(std::string("edit field '") + name + "' must be a string");
    }
    return it->get<std::string>();
}

} // anonymous namespace

Edit Edit::from_value(const Value& entry) {
    if (!entry.is_object()) {
        throw ParameterError("edit must be a mapping, got " + type_name(entry));
    }

    Edit edit;
    edit.key = text_field(entry, "key");

    auto value = entry.find("value");
    if (value == entry.end()) {
        throw ParameterError("edit for key '" + edit.key + "' has no value");
    }
    edit.value = *value;
    edit.value_type = text_field(entry, "value_type");

    auto action = entry.find("action");
    if (action != entry.end() && !action->is_null()) {
        edit.action = parse_edit_action(text_field(entry, "action"));
    } else if (flag(entry, "update")) {
        edit.action = EditAction::Update;
    } else if (flag(entry, "append")) {
        edit.action = EditAction::Append;
    } else if (flag(entry, "insert")) {
        edit.action = EditAction::Insert;
    }

    auto index = entry.find("index");
    if (index != entry.end() && !index->is_null()) {
        edit.index = as_integer(*index);
        if (!edit.index) {
            throw ParameterError("edit field 'index' is not an integer: " + describe(*index));
        }
    }

    auto curr = entry.find("curr_value");
    if (curr != entry.end() && !curr->is_null()) {
        edit.curr_value = *curr;
    }

    const std::string format = text_field(entry, "curr_value_format");
    if (!format.empty()) {
        edit.curr_value_format = parse_value_format(format);
    }

    return edit;
}

std::vector<Edit> edits_from_value(const Value& list) {
    if (list.is_object() && list.contains("edits")) {
        return edits_from_value(list.at("edits"));
    }
    if (!list.is_array()) {
        throw ParameterError("edits must be a list of mappings, got " + type_name(list));
    }

    std::vector<Edit> edits;
    edits.reserve(list.size());
    for (const auto& entry : list) {
        edits.push_back(Edit::from_value(entry));
    }
    return edits;
}

Value BatchResult::results_value() const {
    Value out = Value::array();
    for (const auto& record : results) {
        out.push_back(Value{{"key", record.key}, {"edit", record.edit}});
    }
    return out;
}

BatchResult process_edits(Document& doc, const std::vector<Edit>& edits) {
    const Value snapshot = doc.tree();
    BatchResult batch;

    try {
        for (const auto& edit : edits) {
            const Value value = coerce_value(edit.value, edit.value_type, doc.codec());
            YEDIT_LOG_DEBUG("edit %s '%s' <- %s", to_string(edit.action).c_str(),
                            edit.key.c_str(), describe(value).c_str());

            OpResult rval;
            switch (edit.action) {
                case EditAction::Update: {
                    auto curr = coerce_current_value(edit.curr_value, edit.curr_value_format,
                                                     doc.codec());
                    rval = doc.update(edit.key, value, edit.index, curr);
                    break;
                }
                case EditAction::Append:
                    rval = doc.append(edit.key, value);
                    break;
                case EditAction::Insert:
                    rval = doc.insert(edit.key, value, edit.index.value_or(0));
                    break;
                case EditAction::Set:
                    rval = doc.put(edit.key, value);
                    break;
            }

            if (rval.changed) {
                batch.results.push_back(EditRecord{edit.key, std::move(rval.result)});
            }
        }
    } catch (const std::exception&) {
        doc.set_tree(snapshot);
        throw;
    }

    batch.changed = !batch.results.empty();
    return batch;
}

} // namespace yedit
