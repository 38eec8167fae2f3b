/**
 * @file Parse.hpp
 * @brief String-to-Value type parsing utilities
 *
 * Two decoders live here:
 *
 * parse_value() turns strings from environment variables and --set
 * overrides into typed Values. First match wins:
 * - Boolean ("true", "false" - case insensitive)
 * - Null ("null" - case insensitive)
 * - Integer (matches ^-?[0-9]+$)
 * - Float (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...")
 * - Raw string (fallback)
 *
 * parse_typed_value() decodes the value of a declarative edit according to
 * an optional value_type hint ("bool", "str").
 */

#ifndef ROUTERKIT_PARSE_HPP
#define ROUTERKIT_PARSE_HPP

#include "routerkit/Value.hpp"
#include <string>

namespace routerkit {

/**
 * @brief Parse string value to appropriate type
 *
 * @param str Input string to parse
 * @return Parsed Value with appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("true")       // → true (boolean)
 * parse_value("FALSE")      // → false (boolean)
 * parse_value("null")       // → null
 * parse_value("42")         // → 42 (integer)
 * parse_value("3.14")       // → 3.14 (float)
 * parse_value("[\"a\",\"b\"]") // → ["a", "b"] (array)
 * parse_value("\"1936\"")   // → "1936" (string, unquoted)
 * parse_value("80:80")      // → "80:80" (string)
 * parse_value("")           // → "" (empty string)
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Decode an edit value according to a type hint
 *
 * - @p vtype contains "bool": a string must be one of the YAML boolean
 *   spellings (y/yes/true/on and n/no/false/off in their usual casings)
 *   and becomes a boolean
 * - @p vtype contains "str": booleans are stringified, strings pass
 *   through untouched
 * - otherwise a non-empty string is decoded as a YAML scalar or flow
 *   collection
 *
 * Non-string values other than the boolean/"str" case are returned as is.
 *
 * @throws TypeMismatchError for a non-boolean string with a "bool" hint
 * @throws DocumentError if the string is not valid YAML
 */
Value parse_typed_value(const Value& value, const std::string& vtype = "");

} // namespace routerkit

#endif // ROUTERKIT_PARSE_HPP
