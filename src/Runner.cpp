/**
 * @file Runner.cpp
 * @brief Implementation of the present/absent/list state machine
 */

#include "yedit/Runner.hpp"
#include "yedit/Document.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Logger.hpp"
#include "yedit/Util.hpp"

namespace yedit {

namespace {

Value failure(const std::string& msg) {
    return Value{{"failed", true}, {"msg", msg}};
}

Value outcome(bool changed, const Value& result, State state) {
    return Value{{"changed", changed}, {"result", result}, {"state", to_string(state)}};
}

// Text content is parsed with the content type; structured content is used as is.
Value parse_content(const Document& doc, const ModuleParams& params,
                    std::vector<DroppedKey>& dropped) {
    const Value& content = *params.content;
    if (!content.is_string()) {
        return content;
    }
    Value parsed = doc.codec().parse(content.get<std::string>(), params.content_type,
                                     "<content>", &dropped);
    return parsed.is_null() ? Value::object() : parsed;
}

// Content replaces whatever was loaded from src, dropped keys included.
void replace_with_content(Document& doc, const ModuleParams& params) {
    std::vector<DroppedKey> dropped;
    Value content = parse_content(doc, params, dropped);
    doc.set_tree(std::move(content), std::move(dropped));
}

bool has_content(const ModuleParams& params) {
    if (!params.content || params.content->is_null()) return false;
    if (params.content->is_string()) return !params.content->get_ref<const std::string&>().empty();
    return true;
}

Value run_list(Document& doc, const ModuleParams& params) {
    if (has_content(params)) {
        replace_with_content(doc, params);
    }

    const std::string key = params.key.value_or("");
    if (key.empty()) {
        return outcome(false, doc.tree(), params.state);
    }
    const Value* found = doc.get(key);
    return outcome(false, found != nullptr ? *found : Value(), params.state);
}

Value run_absent(Document& doc, const ModuleParams& params) {
    if (has_content(params)) {
        replace_with_content(doc, params);
    }

    const std::string key = params.key.value_or("");
    std::optional<Value> match;
    if (params.value && !params.value->is_null()) {
        // Mapping keys are names: keep the text as given.
        const Value* target = doc.get(key);
        if (target != nullptr && target->is_object() && params.value->is_string()) {
            match = *params.value;
        } else {
            match = coerce_value(*params.value, params.value_type, doc.codec());
        }
    }

    OpResult rval;
    if (params.update) {
        rval = match ? doc.pop(key, *match) : OpResult{false, doc.tree()};
    } else {
        rval = doc.remove(key, params.index, match);
    }

    if (rval.changed && params.src) {
        doc.write();
    }
    return outcome(rval.changed, rval.result, params.state);
}

Value run_present(Document& doc, const ModuleParams& params) {
    if (has_content(params)) {
        std::vector<DroppedKey> dropped;
        Value content = parse_content(doc, params, dropped);
        const bool same = deep_equal(doc.tree(), content);
        doc.set_tree(std::move(content), std::move(dropped));
        if (same && !params.value) {
            return outcome(false, doc.tree(), params.state);
        }
    }

    std::vector<Edit> edits;
    if (params.value) {
        edits.push_back(params.single_edit());
    } else if (params.edits) {
        edits = *params.edits;
    }

    if (!edits.empty()) {
        BatchResult batch = process_edits(doc, edits);
        if (batch.changed && params.src) {
            doc.write();
        }
        return outcome(batch.changed, batch.results_value(), params.state);
    }

    if (params.src) {
        OpResult rval = doc.write();
        return outcome(rval.changed, rval.result, params.state);
    }

    return outcome(false, doc.tree(), params.state);
}

} // anonymous namespace

Value run(const ModuleParams& params) {
    DocumentOptions opts;
    opts.filename = params.src;
    opts.content_type = params.content_type;
    opts.separator = params.separator;
    opts.backup = params.backup;
    opts.backup_ext = params.backup_ext;
    Document doc(opts);

    try {
        if (params.src) {
            bool loaded = doc.file_exists();
            try {
                doc.load();
            } catch (const DocumentParseError& e) {
                YEDIT_LOG_WARN("%s", e.what());
                if (params.state == State::Present && !has_content(params)) {
                    throw;
                }
                loaded = false;
            }

            if (!loaded && params.state != State::Present) {
                return failure("Error opening file [" + *params.src + "]. Verify that the "
                               "file exists, that it is has correct permissions, and is "
                               "valid yaml.");
            }
        }

        Value result;
        switch (params.state) {
            case State::List:
                result = run_list(doc, params);
                break;
            case State::Absent:
                result = run_absent(doc, params);
                break;
            case State::Present:
                result = run_present(doc, params);
                break;
        }

        if (!doc.dropped_keys().empty()) {
            Value dropped = Value::array();
            for (const auto& d : doc.dropped_keys()) {
                dropped.push_back(Value{{"path", d.path}, {"key", d.key}});
            }
            result["dropped_keys"] = dropped;
        }
        return result;
    } catch (const YeditError& e) {
        YEDIT_LOG_DEBUG("run failed: %s", e.what());
        return failure(e.what());
    }
}

} // namespace yedit
