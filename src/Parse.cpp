/**
 * @file Parse.cpp
 * @brief Implementation of type parsing
 */

#include "routerkit/Parse.hpp"
#include "routerkit/Errors.hpp"
#include "routerkit/Util.hpp"
#include "routerkit/Yaml.hpp"

#include <regex>

namespace routerkit {

namespace {
    bool matches_regex(const std::string& str, const std::regex& re) {
        return std::regex_match(str, re);
    }
}

Value parse_value(const std::string& str) {
    static const std::regex int_re("^-?[0-9]+$");
    static const std::regex float_re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");

    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    if (lower == "null") {
        return nullptr;
    }

    if (matches_regex(str, int_re)) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too large: keep as string below
        }
    }

    if (matches_regex(str, float_re)) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
        }
    }

    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        try {
            return Value::parse(str);
        } catch (const nlohmann::json::parse_error&) {
            // Not JSON after all
        }
    }

    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        try {
            Value parsed = Value::parse(str);
            if (parsed.is_string()) {
                return parsed;
            }
        } catch (const nlohmann::json::parse_error&) {
        }
    }

    return str;
}

Value parse_typed_value(const Value& value, const std::string& vtype) {
    const bool want_bool = contains(vtype, "bool");
    const bool want_str = contains(vtype, "str");

    if (value.is_string() && want_bool) {
        const auto& s = value.get_ref<const std::string&>();
        if (auto b = yaml11_boolean(s)) {
            return *b;
        }
        throw TypeMismatchError("value_type", vtype, "string '" + s + "'");
    }

    if (value.is_boolean() && want_str) {
        return value.get<bool>() ? "True" : "False";
    }

    if (value.is_string() && !want_str) {
        const auto& s = value.get_ref<const std::string&>();
        // "" would load as null
        if (s.empty()) {
            return value;
        }
        return parse_yaml(s);
    }

    return value;
}

} // namespace routerkit
