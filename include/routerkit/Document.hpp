/**
 * @file Document.hpp
 * @brief Path-addressed editing of semi-structured documents
 *
 * A Document owns a root Value and a path separator. Every operation
 * addresses its target with a path string (see Path.hpp):
 *
 * - get:     read a node (std::nullopt when it does not resolve)
 * - put:     set a node, creating intermediate mappings
 * - remove:  delete a node
 * - pop:     delete a key from a mapping or an item from a sequence
 * - append:  push onto a sequence, creating it when absent
 * - update:  merge into a mapping or replace/ensure within a sequence
 * - exists:  membership / containment check
 *
 * Mutations either fully apply or leave the document untouched. Paths that
 * do not match the grammar raise InvalidPathError.
 */

#ifndef ROUTERKIT_DOCUMENT_HPP
#define ROUTERKIT_DOCUMENT_HPP

#include "routerkit/Value.hpp"
#include "routerkit/Path.hpp"
#include "routerkit/Errors.hpp"
#include <optional>
#include <string>

namespace routerkit {

/**
 * @brief Serialization format of a Document's backing file
 */
enum class ContentType {
    Yaml,
    Json
};

// ============================================================================
// Free functions over a Value tree
// ============================================================================

/**
 * @brief Resolve a path inside @p data
 *
 * @param data Root node
 * @param path Path string ("" is the root)
 * @param sep Active separator
 * @return Pointer to the node, or nullptr if any segment does not resolve
 * @throws InvalidPathError if the path does not match the grammar
 *
 * A negative index counts from the end of the sequence (-1 is the last
 * element). Indices outside [-size, size) never resolve.
 */
const Value* get_entry(const Value& data, const std::string& path, char sep = kDefaultSeparator);

/**
 * @brief Set @p item at @p path, creating missing intermediate mappings
 *
 * Missing or null key targets along the way become empty mappings.
 * Traversal stops (returns false) at a non-container value or at a
 * sequence index that does not exist. The last index segment only
 * overwrites an existing element; it never appends.
 *
 * @return true if the item was stored
 * @throws InvalidPathError if the path does not match the grammar
 *
 * Examples:
 * ```cpp
 * Value v = Value::object();
 * add_entry(v, "a.b.c", 1);     // {"a": {"b": {"c": 1}}}
 * add_entry(v, "a.b.c.d", 1);   // false: "c" holds a scalar
 * add_entry(v, "l[0]", 1);      // false: no sequence "l"
 * ```
 */
bool add_entry(Value& data, const std::string& path, const Value& item, char sep = kDefaultSeparator);

/**
 * @brief Delete the node at @p path
 *
 * The empty path clears the root container in place.
 *
 * @return true if something was removed
 * @throws InvalidPathError if the path does not match the grammar
 */
bool remove_entry(Value& data, const std::string& path, char sep = kDefaultSeparator);

// ============================================================================
// Document
// ============================================================================

/**
 * @brief Owned document tree with path-based editing and file persistence
 */
class Document {
public:
    Document() = default;

    /**
     * @brief Wrap an in-memory tree
     * @param content Root value; null becomes an empty mapping
     * @param separator Path separator (one of '.', '#', '|', ':')
     */
    explicit Document(Value content, char separator = kDefaultSeparator);

    /**
     * @brief Load a document from a file
     *
     * A missing or empty file yields an empty mapping bound to @p filename,
     * so the document can be populated and written later.
     *
     * @throws DocumentError if the file exists but cannot be parsed
     */
    static Document load(const std::string& filename,
                         ContentType type = ContentType::Yaml,
                         char separator = kDefaultSeparator,
                         bool backup = false);

    /**
     * @brief Parse a document from text
     * @throws DocumentError on parse errors
     */
    static Document from_string(const std::string& text,
                                ContentType type = ContentType::Yaml,
                                char separator = kDefaultSeparator);

    // Access
    const Value& root() const noexcept { return root_; }
    char separator() const noexcept { return separator_; }

    const std::string& filename() const noexcept { return filename_; }
    void set_filename(std::string filename) { filename_ = std::move(filename); }

    ContentType content_type() const noexcept { return content_type_; }
    void set_content_type(ContentType type) noexcept { content_type_ = type; }

    bool backup() const noexcept { return backup_; }
    void set_backup(bool backup) noexcept { backup_ = backup; }

    /**
     * @brief Read the node at @p path
     * @return Copy of the node, or std::nullopt when it does not resolve
     * @throws InvalidPathError if the path is malformed
     */
    std::optional<Value> get(const std::string& path) const;

    /**
     * @brief Set @p value at @p path (copy-then-mutate)
     *
     * The edit is applied to a deep copy which replaces the root only on
     * success.
     *
     * @return false when the node already equals @p value or the path
     *         cannot be created
     */
    bool put(const std::string& path, const Value& value);

    /**
     * @brief put() that only applies while the backing file does not exist
     */
    bool create(const std::string& path, const Value& value);

    /**
     * @brief Delete the node at @p path
     * @return false if the path does not resolve
     */
    bool remove(const std::string& path);

    /**
     * @brief Remove a key from a mapping, or the first equal item from a
     *        sequence, at @p path
     */
    bool pop(const std::string& path, const Value& key_or_item);

    /**
     * @brief Append @p value to the sequence at @p path
     *
     * An absent (or null) target is first created as an empty sequence.
     *
     * @return false if the target exists but is not a sequence
     */
    bool append(const std::string& path, const Value& value);

    /**
     * @brief Update the container at @p path
     *
     * Mapping target: shallow merge of @p value (must be a mapping),
     * always reported as a change.
     *
     * Sequence target, first rule that applies:
     * 1. @p curr_value given: replace the element equal to it
     *    (false if absent)
     * 2. @p index given: replace that element if it differs
     *    (negative counts from the end, false if out of range)
     * 3. otherwise: false if @p value is already present, else append it
     *
     * @return true if the document changed
     * @throws TypeMismatchError when merging a non-mapping into a mapping
     */
    bool update(const std::string& path,
                const Value& value,
                std::optional<long> index = std::nullopt,
                const std::optional<Value>& curr_value = std::nullopt);

    /**
     * @brief Check whether @p value is present at @p path
     *
     * - sequence target: membership
     * - mapping target: every pair of a mapping @p value matches, or a
     *   string @p value names an existing key
     * - anything else: equality
     */
    bool exists(const std::string& path, const Value& value) const;

    // Serialization
    std::string to_yaml() const;
    std::string to_json(int indent = 2) const;

    /**
     * @brief Whether the backing file is present on disk
     */
    bool file_exists() const;

    /**
     * @brief Write the document to its backing file
     *
     * Writes to "<file>.routerkit" and renames over the destination. With
     * backup enabled an existing destination is first copied to
     * "<file>.orig".
     *
     * @throws DocumentError if no filename is set or IO fails
     */
    void write() const;

private:
    Value root_ = Value::object();
    char separator_ = kDefaultSeparator;
    std::string filename_;
    ContentType content_type_ = ContentType::Yaml;
    bool backup_ = false;
};

} // namespace routerkit

#endif // ROUTERKIT_DOCUMENT_HPP
