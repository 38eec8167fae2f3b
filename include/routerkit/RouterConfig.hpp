/**
 * @file RouterConfig.hpp
 * @brief Router options, layered from defaults, file, environment and CLI
 *
 * Load precedence (lowest to highest):
 *   defaults -> config file -> environment (prefix) -> overrides
 * followed by validation and the mandatory-key check.
 *
 * Keys are flat option names ("stats_port", "service_account", ...).
 * Environment variables map by stripping the prefix and lowercasing:
 * ROUTERCTL_STATS_PORT=1937 sets "stats_port" to 1937.
 */

#ifndef ROUTERKIT_ROUTER_CONFIG_HPP
#define ROUTERKIT_ROUTER_CONFIG_HPP

#include "routerkit/Status.hpp"
#include "routerkit/Value.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace routerkit {

/**
 * @brief Options for constructing a RouterConfig from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix = std::string("ROUTERCTL");
    std::map<std::string, Value> overrides; // final precedence
    std::vector<std::string> mandatory;
};

/**
 * @brief One declarative modification of the rendered deployment
 *
 * JSON form:
 * ```json
 * {"action": "update", "key": "spec.template.spec.nodeSelector",
 *  "value": {"region": "infra"}}
 * ```
 * Optional fields: "index" (integer), "curr_value", "value_type".
 */
struct Edit {
    enum class Action {
        Put,
        Update,
        Append
    };

    Action action = Action::Put;
    std::string key;
    Value value;
    std::optional<long> index;
    std::optional<Value> curr_value;
    std::string value_type;

    /**
     * @throws ConfigError if the object is malformed
     */
    static Edit from_json(const Value& j);

    Value to_json() const;
};

const char* to_string(Edit::Action action) noexcept;

/**
 * @brief Router configuration
 *
 * Data is kept as a flat mapping. Options flagged for the command line are
 * rendered by to_option_list() in a fixed order.
 */
class RouterConfig {
public:
    /**
     * @brief Configuration holding only the defaults
     */
    RouterConfig();

    /**
     * @brief Defaults overlaid with @p data
     */
    explicit RouterConfig(const Value& data);

    /**
     * @brief Load using defaults -> file -> env -> overrides
     *
     * With state "present", cert_file and key_file become mandatory in
     * addition to opts.mandatory.
     *
     * @throws FileNotFoundError, ConfigParseError for file problems
     * @throws MissingMandatoryConfig if a mandatory key is unset
     * @throws ConfigError for invalid values (unknown state, router_type
     *         together with images, malformed edits)
     */
    static RouterConfig load(const LoadOptions& opts);

    /**
     * @brief The built-in defaults
     */
    static Value defaults();

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }

    /**
     * @brief Whether @p key holds a non-null value
     */
    bool contains(const std::string& key) const;

    const Value& at(const std::string& key) const;

    template <typename T>
    T get(const std::string& key, const T& fallback) const {
        if (!contains(key)) return fallback;
        try {
            return at(key).get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

    void set(const std::string& key, const Value& value);

    // Typed accessors
    std::string name() const;
    std::string namespace_name() const;
    std::string kubeconfig() const;
    std::string service_account() const;
    std::string oc_binary() const;
    State state() const;
    bool debug() const;
    std::chrono::seconds settle_interval() const;

    /**
     * @brief Whether stats_password was configured (non-empty)
     */
    bool has_stats_password() const;

    /**
     * @brief Declared edits, in order
     * @throws ConfigError if an entry is malformed
     */
    std::vector<Edit> edits() const;

    /**
     * @brief Options for the dry-run command line
     *
     * Each included option whose value is set renders as
     * "--option-name=value":
     * - booleans and integers always render (false and 0 included)
     * - strings, sequences and mappings render when non-empty
     * - sequences are comma-joined; mappings render as k=v pairs
     *
     * Example: {"stats_port": 1936, "selector": ""} yields
     * {"--stats-port=1936"}.
     */
    std::vector<std::string> to_option_list() const;

    // Enforcement
    void validate() const;
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

    std::string to_json_string(int indent = 2) const;

private:
    Value data_ = Value::object();
};

} // namespace routerkit

#endif // ROUTERKIT_ROUTER_CONFIG_HPP
