/**
 * @file Yaml.cpp
 * @brief YAML conversion implementation
 */

#include "routerkit/Yaml.hpp"
#include "routerkit/Errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <regex>

namespace routerkit {

namespace {
    const std::array<const char*, 11> kTrueSpellings = {
        "y", "Y", "yes", "Yes", "YES", "true", "True", "TRUE", "on", "On", "ON"
    };

    const std::array<const char*, 11> kFalseSpellings = {
        "n", "N", "no", "No", "NO", "false", "False", "FALSE", "off", "Off", "OFF"
    };

    bool one_of(const std::string& str, const std::array<const char*, 11>& spellings) {
        return std::find_if(spellings.begin(), spellings.end(),
                            [&str](const char* s) { return str == s; }) != spellings.end();
    }

    /**
     * @brief Whether a string must be quoted to load back as a string
     */
    bool needs_quotes(const std::string& s) {
        return !resolve_plain_scalar(s).is_string() || yaml11_boolean(s).has_value();
    }

    const std::regex& int_pattern() {
        static const std::regex re("^[-+]?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?$");
        return re;
    }

    Value parse_integer(const std::string& text, int base) {
        const std::string digits = base == 10 ? text : text.substr(2);
        try {
            if (!digits.empty() && digits[0] == '-') {
                return static_cast<std::int64_t>(std::stoll(digits, nullptr, base));
            }
            const auto u = std::stoull(digits, nullptr, base);
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<std::int64_t>(u);
            }
            return u;
        } catch (const std::out_of_range&) {
            // Too large for 64 bits: keep the literal text
            return text;
        }
    }

    void emit_value(YAML::Emitter& out, const Value& value) {
        switch (value.type()) {
            case Value::value_t::null:
                out << YAML::Null;
                break;

            case Value::value_t::boolean:
                out << value.get<bool>();
                break;

            case Value::value_t::number_integer:
                out << value.get<std::int64_t>();
                break;

            case Value::value_t::number_unsigned:
                out << value.get<std::uint64_t>();
                break;

            case Value::value_t::number_float: {
                const double d = value.get<double>();
                if (std::isnan(d)) {
                    out << ".nan";
                } else if (std::isinf(d)) {
                    out << (d > 0 ? ".inf" : "-.inf");
                } else {
                    // nlohmann keeps a trailing ".0" so integral floats stay floats
                    out << value.dump();
                }
                break;
            }

            case Value::value_t::string: {
                const auto& s = value.get_ref<const std::string&>();
                if (needs_quotes(s)) {
                    out << YAML::DoubleQuoted << s;
                } else {
                    out << s;
                }
                break;
            }

            case Value::value_t::array:
                out << YAML::BeginSeq;
                for (const auto& item : value) {
                    emit_value(out, item);
                }
                out << YAML::EndSeq;
                break;

            case Value::value_t::object:
                out << YAML::BeginMap;
                for (auto it = value.begin(); it != value.end(); ++it) {
                    out << YAML::Key;
                    if (needs_quotes(it.key())) {
                        out << YAML::DoubleQuoted;
                    }
                    out << it.key();
                    out << YAML::Value;
                    emit_value(out, it.value());
                }
                out << YAML::EndMap;
                break;

            case Value::value_t::binary:
            case Value::value_t::discarded:
                out << YAML::Null;
                break;
        }
    }
}

std::optional<bool> yaml11_boolean(const std::string& text) {
    if (one_of(text, kTrueSpellings)) {
        return true;
    }
    if (one_of(text, kFalseSpellings)) {
        return false;
    }
    return std::nullopt;
}

Value resolve_plain_scalar(const std::string& text) {
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return nullptr;
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return true;
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return false;
    }
    if (std::regex_match(text, int_pattern())) {
        return parse_integer(text, 10);
    }
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'o')) {
        const int base = text[1] == 'x' ? 16 : 8;
        const std::string body = text.substr(2);
        const char* allowed = base == 16 ? "0123456789abcdefABCDEF" : "01234567";
        if (body.find_first_not_of(allowed) == std::string::npos) {
            return parse_integer(text, base);
        }
    }
    if (std::regex_match(text, float_pattern())) {
        try {
            return std::stod(text);
        } catch (const std::out_of_range&) {
            return text;
        }
    }
    if (text == ".inf" || text == ".Inf" || text == ".INF" || text == "+.inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (text == "-.inf" || text == "-.Inf" || text == "-.INF") {
        return -std::numeric_limits<double>::infinity();
    }
    if (text == ".nan" || text == ".NaN" || text == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return text;
}

Value yaml_to_value(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;

        case YAML::NodeType::Scalar:
            // Quoted scalars carry the non-specific "!" tag
            if (node.Tag() == "!") {
                return node.Scalar();
            }
            return resolve_plain_scalar(node.Scalar());

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_value(item));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_value(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

Value parse_yaml(const std::string& text) {
    try {
        return yaml_to_value(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw DocumentError("", std::string("Problem with loading yaml: ") + e.what());
    }
}

std::vector<Value> parse_yaml_all(const std::string& text) {
    std::vector<Value> docs;
    try {
        for (const auto& node : YAML::LoadAll(text)) {
            docs.push_back(yaml_to_value(node));
        }
    } catch (const YAML::Exception& e) {
        throw DocumentError("", std::string("Problem with loading yaml: ") + e.what());
    }
    return docs;
}

std::string dump_yaml(const Value& value) {
    YAML::Emitter out;
    out << YAML::Block;
    emit_value(out, value);
    std::string text = out.c_str();
    if (!text.empty() && text.back() != '\n') {
        text += '\n';
    }
    return text;
}

} // namespace routerkit
