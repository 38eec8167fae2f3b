/**
 * @file Loader.cpp
 * @brief Option file decoding
 */

#include "routerkit/Loader.hpp"
#include "routerkit/Errors.hpp"
#include "routerkit/Util.hpp"
#include "routerkit/Yaml.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace routerkit {

namespace {
    std::string slurp(const std::string& path) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw FileNotFoundError(path);
        }
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw FileNotFoundError(path);
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    /**
     * @brief Convert one TOML node; @p where is its dotted key for errors
     */
    Value from_toml(const toml::node& node, const std::string& where, const std::string& source) {
        if (auto s = node.as_string()) return s->get();
        if (auto i = node.as_integer()) return i->get();
        if (auto f = node.as_floating_point()) return f->get();
        if (auto b = node.as_boolean()) return b->get();

        if (auto arr = node.as_array()) {
            Value out = Value::array();
            for (size_t i = 0; i < arr->size(); ++i) {
                out.push_back(from_toml(*arr->get(i), where + "[" + std::to_string(i) + "]", source));
            }
            return out;
        }

        if (auto table = node.as_table()) {
            Value out = Value::object();
            for (const auto& [key, child] : *table) {
                const std::string name(key.str());
                out[name] = from_toml(child, where.empty() ? name : where + "." + name, source);
            }
            return out;
        }

        // date, time and date-time
        throw ConfigParseError(source, "'" + where + "': dates and times are not valid option values");
    }

    Value parse_toml(const std::string& text, const std::string& source) {
        try {
            const toml::table table = toml::parse(text, source);
            return from_toml(table, "", source);
        } catch (const toml::parse_error& e) {
            std::ostringstream details;
            details << "line " << e.source().begin.line
                    << ", column " << e.source().begin.column
                    << ": " << e.description();
            throw ConfigParseError(source, details.str());
        }
    }
}

std::optional<ConfigFormat> config_format_for(const std::string& path) {
    const std::string ext = to_lower(fs::path(path).extension().string());
    if (ext == ".json") return ConfigFormat::Json;
    if (ext == ".toml") return ConfigFormat::Toml;
    if (ext == ".yaml" || ext == ".yml") return ConfigFormat::Yaml;
    return std::nullopt;
}

Value parse_config(const std::string& text, ConfigFormat format, const std::string& source) {
    try {
        switch (format) {
            case ConfigFormat::Json:
                return nlohmann::json::parse(text);

            case ConfigFormat::Toml:
                return parse_toml(text, source);

            case ConfigFormat::Yaml: {
                Value result = parse_yaml(text);
                return result.is_null() ? Value::object() : result;
            }
        }
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(source, e.what());
    } catch (const DocumentError& e) {
        throw ConfigParseError(source, e.details());
    }
    throw ConfigError("Unknown option file format");
}

Value load_config_file(const std::string& path) {
    if (path.empty()) {
        return Value::object();
    }

    auto format = config_format_for(path);
    if (!format) {
        throw ConfigError("Unsupported option file '" + path +
                          "' (expected .json, .toml, .yaml or .yml)");
    }
    return parse_config(slurp(path), *format, path);
}

} // namespace routerkit
