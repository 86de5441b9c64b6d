/**
 * @file Params.cpp
 * @brief Implementation of run parameter validation
 */

#include "yedit/Params.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Util.hpp"

namespace yedit {

std::string to_string(State state) {
    switch (state) {
        case State::Present: return "present";
        case State::Absent: return "absent";
        case State::List: return "list";
    }
    return "present";
}

State parse_state(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "present") return State::Present;
    if (lower == "absent") return State::Absent;
    if (lower == "list") return State::List;
    throw ParameterError("value of state must be one of: present, absent, list, got: " + name);
}

namespace {

/**
 * @brief Field reader that records problems instead of throwing
 */
class FieldReader {
public:
    FieldReader(const Value& params, std::vector<std::string>& errors)
        : params_(params), errors_(errors) {}

    const Value* find(const char* name) const {
        auto it = params_.find(name);
        if (it == params_.end() || it->is_null()) {
            return nullptr;
        }
        return &*it;
    }

    bool present(const char* name) const { return find(name) != nullptr; }

    std::optional<std::string> text(const char* name) {
        const Value* v = find(name);
        if (v == nullptr) return std::nullopt;
        if (v->is_string()) return v->get<std::string>();
        if (v->is_primitive()) return describe(*v);
        errors_.push_back(std::string("parameter ") + name + " must be a string");
        return std::nullopt;
    }

    bool boolean(const char* name) {
        const Value* v = find(name);
        if (v == nullptr) return false;
        auto b = as_bool(*v);
        if (!b) {
            errors_.push_back(std::string("parameter ") + name + " is not a valid boolean: " +
                              describe(*v));
            return false;
        }
        return *b;
    }

    std::optional<long long> integer(const char* name) {
        const Value* v = find(name);
        if (v == nullptr) return std::nullopt;
        auto i = as_integer(*v);
        if (!i) {
            errors_.push_back(std::string("parameter ") + name + " is not a valid integer: " +
                              describe(*v));
        }
        return i;
    }

    // Run a parser that throws ParameterError, keeping its messages.
    template <typename Fn>
    void guarded(Fn&& fn) {
        try {
            fn();
        } catch (const ParameterError& e) {
            errors_.insert(errors_.end(), e.messages().begin(), e.messages().end());
        } catch (const InvalidPathError& e) {
            errors_.push_back(e.what());
        }
    }

private:
    const Value& params_;
    std::vector<std::string>& errors_;
};

} // anonymous namespace

ModuleParams ModuleParams::from_value(const Value& params) {
    if (!params.is_object()) {
        throw ParameterError("parameters must be a mapping, got " + type_name(params));
    }

    std::vector<std::string> errors;
    FieldReader r(params, errors);
    ModuleParams p;

    if (auto s = r.text("state")) {
        r.guarded([&] { p.state = parse_state(*s); });
    }
    p.debug = r.boolean("debug");
    p.src = r.text("src");
    if (const Value* c = r.find("content")) {
        p.content = *c;
    }
    if (auto ct = r.text("content_type")) {
        r.guarded([&] { p.content_type = parse_content_type(*ct); });
    }

    // key is the one parameter where an explicit null differs from "".
    auto key_it = params.find("key");
    if (key_it != params.end() && key_it->is_null()) {
        p.key = std::nullopt;
    } else {
        p.key = r.text("key").value_or("");
    }

    if (const Value* v = r.find("value")) {
        p.value = *v;
    }
    p.value_type = r.text("value_type").value_or("");
    p.update = r.boolean("update");
    p.append = r.boolean("append");
    p.insert = r.boolean("insert");
    p.index = r.integer("index");
    if (const Value* cv = r.find("curr_value")) {
        p.curr_value = *cv;
    }
    if (auto f = r.text("curr_value_format")) {
        r.guarded([&] { p.curr_value_format = parse_value_format(*f); });
    }
    p.backup = r.boolean("backup");
    p.backup_ext = r.text("backup_ext").value_or(process_start_suffix());
    if (auto sep = r.text("separator")) {
        r.guarded([&] { p.separator = separator_from_string(*sep); });
    }
    if (const Value* e = r.find("edits")) {
        r.guarded([&] { p.edits = edits_from_value(*e); });
    }

    // Cross-field rules
    if (r.present("curr_value") && r.present("index")) {
        errors.push_back("parameters are mutually exclusive: curr_value|index");
    }
    if (p.update && p.append) {
        errors.push_back("parameters are mutually exclusive: update|append");
    }
    if (!p.content && !p.src) {
        errors.push_back("one of the following is required: content, src");
    }

    if (p.src) {
        const bool key_error = !p.key.has_value();
        bool edit_error = !p.edits || p.edits->empty();
        if (!edit_error) {
            for (const auto& edit : *p.edits) {
                if (edit.key.empty()) {
                    edit_error = true;
                    break;
                }
            }
        }
        if (key_error && edit_error) {
            errors.push_back("Empty value for parameter key not allowed.");
        }
    }

    if (!errors.empty()) {
        throw ParameterError(errors);
    }
    return p;
}

Edit ModuleParams::single_edit() const {
    Edit edit;
    edit.key = key.value_or("");
    edit.value = value.value_or(Value());
    edit.value_type = value_type;

    if (update) {
        edit.action = EditAction::Update;
        edit.curr_value = curr_value;
        edit.curr_value_format = curr_value_format;
        edit.index = index;
    } else if (append) {
        edit.action = EditAction::Append;
    } else if (insert) {
        edit.action = EditAction::Insert;
        edit.index = index;
    }
    return edit;
}

} // namespace yedit
