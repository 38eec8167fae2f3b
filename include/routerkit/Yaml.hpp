/**
 * @file Yaml.hpp
 * @brief YAML text <-> Value conversion (yaml-cpp)
 *
 * Plain scalars are resolved with the YAML 1.2 core schema
 * (null, bool, int, float, otherwise string). Quoted scalars are always
 * strings. Emission uses block style throughout; strings that would
 * resolve to another type are double-quoted so they survive a round trip.
 * The YAML 1.1 boolean spellings (yes, off, ...) are quoted as well, since
 * older readers such as the oc client load them as booleans.
 */

#ifndef ROUTERKIT_YAML_HPP
#define ROUTERKIT_YAML_HPP

#include "routerkit/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace routerkit {

/**
 * @brief Convert a yaml-cpp node tree into a Value
 */
Value yaml_to_value(const YAML::Node& node);

/**
 * @brief Resolve a plain (unquoted) scalar to its core-schema type
 *
 * Examples:
 * - "~", "null", ""  → null
 * - "true", "False"  → boolean
 * - "42", "0x1f"     → integer
 * - "2.5", ".inf"    → float
 * - "50%"            → string
 */
Value resolve_plain_scalar(const std::string& text);

/**
 * @brief Match a YAML 1.1 boolean spelling
 *
 * Accepts y/yes/true/on and n/no/false/off in lower, capitalized and
 * upper case ("y" and "n" also as "Y" and "N").
 *
 * @return The boolean, or nullopt for any other text
 */
std::optional<bool> yaml11_boolean(const std::string& text);

/**
 * @brief Parse a single YAML document
 * @throws DocumentError on syntax errors
 */
Value parse_yaml(const std::string& text);

/**
 * @brief Parse every document of a multi-document YAML stream
 * @throws DocumentError on syntax errors
 */
std::vector<Value> parse_yaml_all(const std::string& text);

/**
 * @brief Serialize a Value as block-style YAML
 */
std::string dump_yaml(const Value& value);

} // namespace routerkit

#endif // ROUTERKIT_YAML_HPP
