/**
 * @file Document.cpp
 * @brief Implementation of the document engine
 */

#include "yedit/Document.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Loader.hpp"
#include "yedit/Logger.hpp"
#include "yedit/Mutate.hpp"
#include "yedit/Navigate.hpp"
#include "yedit/Util.hpp"
#include "yedit/Writer.hpp"

#include <algorithm>

namespace yedit {

Document::Document(DocumentOptions opts) : opts_(std::move(opts)) {}

bool Document::file_exists() const {
    return opts_.filename.has_value() && yedit::file_exists(*opts_.filename);
}

std::optional<std::string> Document::read() const {
    if (!file_exists()) {
        return std::nullopt;
    }
    return read_text_file(*opts_.filename);
}

const Value& Document::load() {
    if (opts_.content && !opts_.content->is_null() && !opts_.content->is_string()) {
        tree_ = *opts_.content;
        return tree_;
    }

    std::optional<std::string> text;
    std::string source = "<content>";
    if (opts_.content && opts_.content->is_string() &&
        !opts_.content->get_ref<const std::string&>().empty()) {
        text = opts_.content->get<std::string>();
    } else {
        text = read();
        if (opts_.filename) source = *opts_.filename;
    }

    if (!text || text->empty()) {
        return tree_;
    }

    dropped_.clear();
    Value parsed = codec_.parse(*text, opts_.content_type, source, &dropped_);
    tree_ = parsed.is_null() ? Value::object() : std::move(parsed);
    YEDIT_LOG_DEBUG("Loaded %s document from %s", to_string(opts_.content_type).c_str(),
                    source.c_str());
    return tree_;
}

OpResult Document::write() {
    if (!opts_.filename) {
        throw YeditError("Please specify a filename.");
    }

    WriteOptions wopts;
    wopts.backup = opts_.backup;
    wopts.backup_ext = opts_.backup_ext;
    write_file_durable(*opts_.filename, codec_.dump(tree_, opts_.content_type), wopts);
    return changed();
}

const Value* Document::get(const std::string& path) const {
    return resolve(tree_, parse_path(path, opts_.separator));
}

OpResult Document::put(const std::string& path, const Value& value) {
    const ParsedPath steps = parse_path(path, opts_.separator);

    const Value* current = resolve(tree_, steps);
    if (current != nullptr && deep_equal(*current, value)) {
        return unchanged();
    }

    Value working = tree_;
    upsert(working, steps, value, opts_.separator);

    // The root may only ever be replaced by a container.
    if (steps.empty() && !is_container(working)) {
        return unchanged();
    }

    tree_ = std::move(working);
    return changed();
}

OpResult Document::create(const std::string& path, const Value& value) {
    if (file_exists()) {
        return unchanged();
    }

    const ParsedPath steps = parse_path(path, opts_.separator);
    Value working = tree_;
    upsert(working, steps, value, opts_.separator);
    if (steps.empty() && !is_container(working)) {
        return unchanged();
    }

    tree_ = std::move(working);
    return changed();
}

OpResult Document::update(const std::string& path, const Value& value,
                          const std::optional<long long>& index,
                          const std::optional<Value>& curr_value) {
    Value* entry = resolve(tree_, parse_path(path, opts_.separator));
    if (entry == nullptr) {
        return unchanged();
    }

    if (entry->is_object()) {
        if (!value.is_object()) {
            throw TypeMismatchError(
                "Cannot replace key, value entry in dict with non-dict type. value=[" +
                describe(value) + "] type=[" + type_name(value) + "]");
        }
        for (auto it = value.begin(); it != value.end(); ++it) {
            (*entry)[it.key()] = it.value();
        }
        return changed();
    }

    if (entry->is_array()) {
        std::optional<std::size_t> ind;
        if (curr_value && !curr_value->is_null()) {
            ind = find_equal(*entry, *curr_value);
        } else if (index) {
            ind = normalize_index(*index, entry->size());
        }

        if (ind && !deep_equal((*entry)[*ind], value)) {
            (*entry)[*ind] = value;
            return changed();
        }

        if (find_equal(*entry, value)) {
            return unchanged();
        }
        entry->push_back(value);
        return changed();
    }

    throw TypeMismatchError("cannot update " + type_name(*entry) + " at '" + path +
                            "': expected mapping or sequence");
}

Value* Document::sequence_at(const std::string& path) {
    const ParsedPath steps = parse_path(path, opts_.separator);
    Value* entry = resolve(tree_, steps);
    if (entry == nullptr || entry->is_null()) {
        put(path, Value::array());
        entry = resolve(tree_, steps);
    }
    if (entry == nullptr || !entry->is_array()) {
        return nullptr;
    }
    return entry;
}

OpResult Document::append(const std::string& path, const Value& value) {
    Value* entry = sequence_at(path);
    if (entry == nullptr) {
        return unchanged();
    }
    entry->push_back(value);
    return changed();
}

OpResult Document::insert(const std::string& path, const Value& value, long long index) {
    Value* entry = sequence_at(path);
    if (entry == nullptr) {
        return unchanged();
    }

    // Positions clamp to the sequence bounds; negatives count from the end.
    const auto size = static_cast<long long>(entry->size());
    long long pos = index < 0 ? std::max(0LL, size + index) : std::min(index, size);
    entry->insert(entry->begin() + pos, value);
    return changed();
}

OpResult Document::remove(const std::string& path,
                          const std::optional<long long>& index,
                          const std::optional<Value>& match) {
    const ParsedPath steps = parse_path(path, opts_.separator);
    if (resolve(tree_, steps) == nullptr) {
        return unchanged();
    }

    switch (yedit::remove(tree_, steps, index, match)) {
        case RemoveStatus::Removed:
            return changed();
        case RemoveStatus::NotFound:
            return unchanged();
        case RemoveStatus::Impossible:
            break;
    }
    std::string what = "entry";
    if (match) {
        what = describe(*match);
    } else if (index) {
        what = "index [" + std::to_string(*index) + "]";
    }
    throw PathConflictError(path, "cannot remove " + what + " from " +
                                  type_name(*resolve(tree_, steps)));
}

OpResult Document::pop(const std::string& path, const Value& key_or_item) {
    Value* entry = resolve(tree_, parse_path(path, opts_.separator));
    if (entry == nullptr) {
        return unchanged();
    }

    if (entry->is_object()) {
        if (key_or_item.is_string() && entry->erase(key_or_item.get<std::string>()) > 0) {
            return changed();
        }
        return unchanged();
    }

    if (entry->is_array()) {
        auto pos = find_equal(*entry, key_or_item);
        if (!pos) {
            return unchanged();
        }
        entry->erase(*pos);
        return changed();
    }

    return unchanged();
}

bool Document::exists(const std::string& path, const Value& value) const {
    const Value* entry = get(path);
    if (entry == nullptr) {
        return value.is_null();
    }

    if (entry->is_array()) {
        return find_equal(*entry, value).has_value();
    }

    if (entry->is_object()) {
        if (value.is_object()) {
            for (auto it = value.begin(); it != value.end(); ++it) {
                auto found = entry->find(it.key());
                if (found == entry->end() || !deep_equal(*found, it.value())) {
                    return false;
                }
            }
            return true;
        }
        return value.is_string() && entry->contains(value.get<std::string>());
    }

    return deep_equal(*entry, value);
}

} // namespace yedit
