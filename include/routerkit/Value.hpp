/**
 * @file Value.hpp
 * @brief Value type for managed resource documents
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Number (int64_t, uint64_t, double)
 * - String (std::string, UTF-8)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...})
 *
 * Both the rendered (desired) and the live (observed) form of a resource
 * are held in this representation.
 */

#ifndef ROUTERKIT_VALUE_HPP
#define ROUTERKIT_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace routerkit {

/**
 * @brief JSON-like tagged value used for every document tree
 *
 * Alias for nlohmann::json. Traversal code switches on Value::type()
 * (nlohmann::json::value_t) rather than probing with is_*() chains.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "float",
 *         "string", "sequence", "mapping")
 */
inline std::string type_name(const Value& val) {
    switch (val.type()) {
        case Value::value_t::null:            return "null";
        case Value::value_t::boolean:         return "boolean";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return "integer";
        case Value::value_t::number_float:    return "float";
        case Value::value_t::string:          return "string";
        case Value::value_t::array:           return "sequence";
        case Value::value_t::object:          return "mapping";
        case Value::value_t::binary:          return "binary";
        case Value::value_t::discarded:       return "discarded";
    }
    return "unknown";
}

/**
 * @brief Check if value is a container (sequence or mapping)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace routerkit

#endif // ROUTERKIT_VALUE_HPP
