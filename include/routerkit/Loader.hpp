/**
 * @file Loader.hpp
 * @brief Reading routerctl option files
 *
 * An option file is a flat mapping of router options in JSON, TOML or
 * YAML, picked by extension (.json, .toml, .yaml/.yml).
 */

#ifndef ROUTERKIT_LOADER_HPP
#define ROUTERKIT_LOADER_HPP

#include "routerkit/Value.hpp"

#include <optional>
#include <string>

namespace routerkit {

enum class ConfigFormat {
    Json,
    Toml,
    Yaml
};

/**
 * @brief Format of an option file from its extension (case insensitive)
 * @return nullopt for any other extension
 */
std::optional<ConfigFormat> config_format_for(const std::string& path);

/**
 * @brief Decode option text
 *
 * An empty YAML document yields an empty mapping. TOML dates and times
 * have no option counterpart and are rejected.
 *
 * @param text File contents
 * @param format Syntax of @p text
 * @param source File name reported in errors
 * @throws ConfigParseError on a syntax error (TOML errors carry line and column)
 */
Value parse_config(const std::string& text, ConfigFormat format, const std::string& source);

/**
 * @brief Read and decode an option file
 *
 * An empty @p path loads nothing and yields an empty mapping.
 *
 * @throws FileNotFoundError if the file cannot be read
 * @throws ConfigError for an unsupported extension
 * @throws ConfigParseError on a syntax error
 */
Value load_config_file(const std::string& path);

} // namespace routerkit

#endif // ROUTERKIT_LOADER_HPP
