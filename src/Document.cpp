/**
 * @file Document.cpp
 * @brief Implementation of path-addressed document editing
 */

#include "routerkit/Document.hpp"
#include "routerkit/Yaml.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace routerkit {

namespace {
    /**
     * @brief Resolve a sequence index, counting negative values from the end
     * @return Position within @p size, or nullopt when out of range
     */
    std::optional<size_t> resolve_index(long idx, size_t size) {
        const long n = static_cast<long>(size);
        if (idx < 0) {
            idx += n;
        }
        if (idx < 0 || idx >= n) {
            return std::nullopt;
        }
        return static_cast<size_t>(idx);
    }

    /**
     * @brief Follow one segment from @p node
     * @return Child node, or nullptr if the segment does not apply
     */
    const Value* step(const Value& node, const PathSegment& seg) {
        switch (node.type()) {
            case Value::value_t::object: {
                if (!seg.is_key()) return nullptr;
                auto it = node.find(seg.key);
                return it == node.end() ? nullptr : &(*it);
            }
            case Value::value_t::array: {
                if (!seg.is_index()) return nullptr;
                auto pos = resolve_index(seg.index, node.size());
                return pos ? &node[*pos] : nullptr;
            }
            default:
                return nullptr;
        }
    }

    /**
     * @brief Follow the first @p count segments from @p data
     */
    const Value* walk(const Value& data, const std::vector<PathSegment>& segments, size_t count) {
        const Value* current = &data;
        for (size_t i = 0; i < count && current != nullptr; ++i) {
            current = step(*current, segments[i]);
        }
        return current;
    }

    std::string read_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw DocumentError(path, "cannot open file for reading");
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    Value parse_content(const std::string& text, ContentType type, const std::string& origin) {
        if (type == ContentType::Json) {
            try {
                return Value::parse(text);
            } catch (const nlohmann::json::parse_error& e) {
                throw DocumentError(origin, std::string("Problem with loading json: ") + e.what());
            }
        }
        try {
            return parse_yaml(text);
        } catch (const DocumentError& e) {
            throw DocumentError(origin, e.details());
        }
    }
}

// ============================================================================
// Free functions
// ============================================================================

const Value* get_entry(const Value& data, const std::string& path, char sep) {
    const auto segments = parse_path(path, sep);
    return walk(data, segments, segments.size());
}

bool add_entry(Value& data, const std::string& path, const Value& item, char sep) {
    const auto segments = parse_path(path, sep);
    if (segments.empty()) {
        data = item;
        return true;
    }

    Value* current = &data;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const auto& seg = segments[i];

        if (seg.is_key()) {
            if (current->is_null()) {
                *current = Value::object();
            }
            if (!current->is_object()) {
                return false;
            }
            auto it = current->find(seg.key);
            if (it == current->end() || it->is_null()) {
                (*current)[seg.key] = Value::object();
            }
            current = &(*current)[seg.key];
        } else {
            // never auto-vivify sequence positions
            if (!current->is_array()) {
                return false;
            }
            auto pos = resolve_index(seg.index, current->size());
            if (!pos) {
                return false;
            }
            current = &(*current)[*pos];
        }
    }

    const auto& last = segments.back();
    if (last.is_index()) {
        if (!current->is_array()) {
            return false;
        }
        auto pos = resolve_index(last.index, current->size());
        if (!pos) {
            return false;
        }
        (*current)[*pos] = item;
        return true;
    }

    if (current->is_null()) {
        *current = Value::object();
    }
    if (!current->is_object()) {
        return false;
    }
    (*current)[last.key] = item;
    return true;
}

bool remove_entry(Value& data, const std::string& path, char sep) {
    const auto segments = parse_path(path, sep);
    if (segments.empty()) {
        switch (data.type()) {
            case Value::value_t::object:
            case Value::value_t::array:
                data.clear();
                return true;
            default:
                return false;
        }
    }

    Value* parent = const_cast<Value*>(walk(data, segments, segments.size() - 1));
    if (parent == nullptr) {
        return false;
    }

    const auto& last = segments.back();
    if (last.is_index()) {
        if (!parent->is_array()) {
            return false;
        }
        auto pos = resolve_index(last.index, parent->size());
        if (!pos) {
            return false;
        }
        parent->erase(*pos);
        return true;
    }

    if (!parent->is_object()) {
        return false;
    }
    return parent->erase(last.key) > 0;
}

// ============================================================================
// Document
// ============================================================================

Document::Document(Value content, char separator)
    : root_(std::move(content))
    , separator_(separator)
{
    if (!is_separator_candidate(separator)) {
        throw RouterKitError(std::string("Unsupported path separator '") + separator + "'");
    }
    if (root_.is_null()) {
        root_ = Value::object();
    }
}

Document Document::load(const std::string& filename, ContentType type, char separator, bool backup) {
    Document doc(Value::object(), separator);
    doc.filename_ = filename;
    doc.content_type_ = type;
    doc.backup_ = backup;

    if (!doc.file_exists()) {
        return doc;
    }

    const std::string contents = read_file(filename);
    if (contents.empty()) {
        return doc;
    }

    doc.root_ = parse_content(contents, type, filename);
    if (doc.root_.is_null()) {
        doc.root_ = Value::object();
    }
    return doc;
}

Document Document::from_string(const std::string& text, ContentType type, char separator) {
    Document doc(Value::object(), separator);
    doc.content_type_ = type;
    if (!text.empty()) {
        doc.root_ = parse_content(text, type, "");
        if (doc.root_.is_null()) {
            doc.root_ = Value::object();
        }
    }
    return doc;
}

std::optional<Value> Document::get(const std::string& path) const {
    const Value* entry = get_entry(root_, path, separator_);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return *entry;
}

bool Document::put(const std::string& path, const Value& value) {
    const Value* current = get_entry(root_, path, separator_);
    if (current != nullptr && *current == value) {
        return false;
    }

    Value working = root_;
    if (!add_entry(working, path, value, separator_)) {
        return false;
    }
    root_ = std::move(working);
    return true;
}

bool Document::create(const std::string& path, const Value& value) {
    if (file_exists()) {
        return false;
    }
    return put(path, value);
}

bool Document::remove(const std::string& path) {
    if (get_entry(root_, path, separator_) == nullptr) {
        return false;
    }
    return remove_entry(root_, path, separator_);
}

bool Document::pop(const std::string& path, const Value& key_or_item) {
    Value* entry = const_cast<Value*>(get_entry(root_, path, separator_));
    if (entry == nullptr) {
        return false;
    }

    switch (entry->type()) {
        case Value::value_t::object:
            if (!key_or_item.is_string()) {
                return false;
            }
            return entry->erase(key_or_item.get<std::string>()) > 0;

        case Value::value_t::array: {
            auto it = std::find(entry->begin(), entry->end(), key_or_item);
            if (it == entry->end()) {
                return false;
            }
            entry->erase(it);
            return true;
        }

        default:
            return false;
    }
}

bool Document::append(const std::string& path, const Value& value) {
    const Value* entry = get_entry(root_, path, separator_);
    if (entry == nullptr || entry->is_null()) {
        if (!put(path, Value::array())) {
            return false;
        }
    }

    Value* target = const_cast<Value*>(get_entry(root_, path, separator_));
    if (target == nullptr || !target->is_array()) {
        return false;
    }
    target->push_back(value);
    return true;
}

bool Document::update(const std::string& path,
                      const Value& value,
                      std::optional<long> index,
                      const std::optional<Value>& curr_value) {
    Value* entry = const_cast<Value*>(get_entry(root_, path, separator_));
    if (entry == nullptr) {
        return false;
    }

    switch (entry->type()) {
        case Value::value_t::object:
            if (!value.is_object()) {
                throw TypeMismatchError(path, "mapping", type_name(value));
            }
            entry->update(value);
            return true;

        case Value::value_t::array: {
            std::optional<size_t> position;
            if (curr_value.has_value()) {
                auto it = std::find(entry->begin(), entry->end(), *curr_value);
                if (it == entry->end()) {
                    return false;
                }
                position = static_cast<size_t>(std::distance(entry->begin(), it));
            } else if (index.has_value()) {
                position = resolve_index(*index, entry->size());
                if (!position.has_value()) {
                    return false;
                }
            }

            if (position.has_value() && (*entry)[*position] != value) {
                (*entry)[*position] = value;
                return true;
            }

            if (std::find(entry->begin(), entry->end(), value) == entry->end()) {
                entry->push_back(value);
                return true;
            }
            return false;
        }

        default:
            return false;
    }
}

bool Document::exists(const std::string& path, const Value& value) const {
    const Value* entry = get_entry(root_, path, separator_);
    if (entry == nullptr) {
        return value.is_null();
    }

    switch (entry->type()) {
        case Value::value_t::array:
            return std::find(entry->begin(), entry->end(), value) != entry->end();

        case Value::value_t::object:
            if (value.is_object()) {
                for (auto it = value.begin(); it != value.end(); ++it) {
                    auto found = entry->find(it.key());
                    if (found == entry->end() || *found != it.value()) {
                        return false;
                    }
                }
                return true;
            }
            if (value.is_string()) {
                return entry->contains(value.get<std::string>());
            }
            return false;

        default:
            return *entry == value;
    }
}

std::string Document::to_yaml() const {
    return dump_yaml(root_);
}

std::string Document::to_json(int indent) const {
    return root_.dump(indent);
}

bool Document::file_exists() const {
    if (filename_.empty()) {
        return false;
    }
    std::error_code ec;
    return fs::exists(filename_, ec);
}

void Document::write() const {
    if (filename_.empty()) {
        throw DocumentError("", "Please specify a filename.");
    }

    std::error_code ec;
    if (backup_ && file_exists()) {
        fs::copy_file(filename_, filename_ + ".orig", fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw DocumentError(filename_, "backup failed: " + ec.message());
        }
    }

    const std::string contents = content_type_ == ContentType::Json ? to_json(2) + "\n" : to_yaml();
    const std::string tmp = filename_ + ".routerkit";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw DocumentError(tmp, "cannot open file for writing");
        }
        ofs << contents;
        ofs.flush();
        if (!ofs) {
            throw DocumentError(tmp, "write failed");
        }
    }

    fs::rename(tmp, filename_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw DocumentError(filename_, "rename failed: " + ec.message());
    }
}

} // namespace routerkit
