/**
 * @file Path.cpp
 * @brief Implementation of the path grammar
 */

#include "routerkit/Path.hpp"
#include <cctype>
#include <sstream>

namespace routerkit {

namespace {
    /**
     * @brief Check if character may appear inside a key segment
     *
     * Separator candidates other than the active one are literal key
     * characters.
     */
    bool is_key_char(char c, char sep) {
        if (std::isalnum(static_cast<unsigned char>(c))) return true;
        switch (c) {
            case '_': case '/': case '%': case '-':
                return true;
            default:
                break;
        }
        return is_separator_candidate(c) && c != sep;
    }

    /**
     * @brief Single pass over the path, matching (segment sep?)+
     * @return false at the first character that breaks the grammar
     */
    bool tokenize(const std::string& path, char sep, std::vector<PathSegment>& out) {
        const size_t n = path.size();
        size_t pos = 0;

        while (pos < n) {
            const char c = path[pos];

            if (c == '[') {
                size_t start = ++pos;
                if (pos < n && path[pos] == '-') ++pos;
                const size_t digits = pos;
                while (pos < n && std::isdigit(static_cast<unsigned char>(path[pos]))) ++pos;
                if (pos == digits || pos >= n || path[pos] != ']') {
                    return false;
                }
                long idx = 0;
                try {
                    idx = std::stol(path.substr(start, pos - start));
                } catch (const std::out_of_range&) {
                    return false;
                }
                ++pos; // ']'
                out.push_back(PathSegment::make_index(idx));
            } else if (is_key_char(c, sep)) {
                const size_t start = pos;
                while (pos < n && is_key_char(path[pos], sep)) ++pos;
                out.push_back(PathSegment::make_key(path.substr(start, pos - start)));
            } else {
                return false;
            }

            // at most one separator between segments
            if (pos < n && path[pos] == sep) ++pos;
        }

        return true;
    }
}

bool is_separator_candidate(char c) noexcept {
    for (char candidate : kSeparatorCandidates) {
        if (candidate == c) return true;
    }
    return false;
}

bool is_valid_path(const std::string& path, char sep) {
    if (path.empty()) return true;
    std::vector<PathSegment> ignored;
    return tokenize(path, sep, ignored);
}

std::vector<PathSegment> parse_path(const std::string& path, char sep) {
    std::vector<PathSegment> segments;
    if (path.empty()) {
        return segments;
    }
    if (!tokenize(path, sep, segments)) {
        throw InvalidPathError(path, sep);
    }
    return segments;
}

std::string join_path(const std::vector<PathSegment>& segments, char sep) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        if (seg.is_index()) {
            oss << '[' << seg.index << ']';
        } else {
            if (i > 0) oss << sep;
            oss << seg.key;
        }
    }
    return oss.str();
}

} // namespace routerkit
