/**
 * @file Path.hpp
 * @brief Path grammar for addressing nodes inside a Document
 *
 * A path is a sequence of key and index segments joined by the active
 * separator, e.g. "spec.template.spec.containers[0].env".
 *
 * Grammar:
 * - segment      := index_segment | key_segment
 * - index_segment := '[' '-'? digit+ ']'
 * - key_segment  := [A-Za-z0-9_/%-]+ plus every character of
 *                   {'.', '#', '|', ':'} that is not the active separator
 * - path         := (segment sep?)+   (anchored at both ends)
 *
 * The empty path denotes the document root.
 */

#ifndef ROUTERKIT_PATH_HPP
#define ROUTERKIT_PATH_HPP

#include "routerkit/Errors.hpp"
#include <string>
#include <vector>

namespace routerkit {

/// Default separator between path segments
constexpr char kDefaultSeparator = '.';

/// Characters that may be configured as the separator
constexpr char kSeparatorCandidates[] = {'.', '#', '|', ':'};

/**
 * @brief One step of a parsed path
 */
struct PathSegment {
    enum class Kind { Key, Index };

    Kind kind = Kind::Key;
    std::string key;   ///< Mapping key (Kind::Key)
    long index = 0;    ///< Sequence position (Kind::Index), may be negative

    static PathSegment make_key(std::string k) {
        PathSegment s;
        s.kind = Kind::Key;
        s.key = std::move(k);
        return s;
    }

    static PathSegment make_index(long i) {
        PathSegment s;
        s.kind = Kind::Index;
        s.index = i;
        return s;
    }

    bool is_key() const noexcept { return kind == Kind::Key; }
    bool is_index() const noexcept { return kind == Kind::Index; }

    bool operator==(const PathSegment& other) const {
        return kind == other.kind && key == other.key && index == other.index;
    }
};

/**
 * @brief Check whether a character may be used as the active separator
 */
bool is_separator_candidate(char c) noexcept;

/**
 * @brief Validate a path against the grammar
 *
 * @param path Path string to check
 * @param sep Active separator
 * @return true if the path is empty or matches the grammar
 *
 * Examples:
 * - is_valid_path("a.b[0].c")        → true
 * - is_valid_path("a#b", '#')        → true
 * - is_valid_path("a.b", '#')        → true ("a.b" is one key)
 * - is_valid_path("a b")             → false
 */
bool is_valid_path(const std::string& path, char sep = kDefaultSeparator);

/**
 * @brief Split a path into segments
 *
 * @param path Path string
 * @param sep Active separator
 * @return Parsed segments; empty for the root path
 * @throws InvalidPathError if the path does not match the grammar
 *
 * Examples:
 * - "spec.ports[1].port" → [key spec, key ports, index 1, key port]
 * - "[0]"                → [index 0]
 * - ""                   → []
 */
std::vector<PathSegment> parse_path(const std::string& path, char sep = kDefaultSeparator);

/**
 * @brief Render segments back into a path string
 *
 * Index segments are attached to the preceding segment without a
 * separator ("a[0]"), key segments are joined with @p sep.
 */
std::string join_path(const std::vector<PathSegment>& segments, char sep = kDefaultSeparator);

} // namespace routerkit

#endif // ROUTERKIT_PATH_HPP
