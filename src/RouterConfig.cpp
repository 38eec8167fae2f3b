#include "routerkit/RouterConfig.hpp"
#include "routerkit/Errors.hpp"
#include "routerkit/Loader.hpp"
#include "routerkit/Parse.hpp"
#include "routerkit/Util.hpp"

#include <algorithm>
#include <cctype>

namespace routerkit {

namespace {
    struct OptionSpec {
        const char* key;
        bool include;
    };

    // Command line order of the dry-run options
    const OptionSpec kOptionSpecs[] = {
        {"default_cert", true},
        {"cert_file", false},
        {"key_file", false},
        {"images", true},
        {"latest_images", true},
        {"labels", true},
        {"ports", true},
        {"replicas", true},
        {"selector", true},
        {"service_account", true},
        {"router_type", false},
        {"host_network", true},
        {"external_host", true},
        {"external_host_vserver", true},
        {"external_host_insecure", true},
        {"external_host_partition_path", true},
        {"external_host_username", true},
        {"external_host_password", true},
        {"external_host_private_key", true},
        {"expose_metrics", true},
        {"metrics_image", true},
        {"stats_user", true},
        {"stats_password", true},
        {"stats_port", true},
        {"cacert_file", false},
        {"edits", false},
    };

    std::string scalar_text(const Value& v) {
        if (v.is_string()) {
            return v.get<std::string>();
        }
        if (v.is_boolean()) {
            return v.get<bool>() ? "true" : "false";
        }
        return v.dump();
    }

    // nullopt when the option is left off the command line
    std::optional<std::string> option_text(const Value& v) {
        switch (v.type()) {
            case Value::value_t::null:
            case Value::value_t::discarded:
            case Value::value_t::binary:
                return std::nullopt;

            case Value::value_t::boolean:
            case Value::value_t::number_integer:
            case Value::value_t::number_unsigned:
                return scalar_text(v);

            case Value::value_t::number_float:
                if (v.get<double>() == 0.0) return std::nullopt;
                return scalar_text(v);

            case Value::value_t::string:
                if (v.get_ref<const std::string&>().empty()) return std::nullopt;
                return v.get<std::string>();

            case Value::value_t::array: {
                if (v.empty()) return std::nullopt;
                std::vector<std::string> parts;
                for (const auto& item : v) {
                    parts.push_back(scalar_text(item));
                }
                return join(parts, ",");
            }

            case Value::value_t::object: {
                if (v.empty()) return std::nullopt;
                std::vector<std::string> parts;
                for (auto it = v.begin(); it != v.end(); ++it) {
                    parts.push_back(it.key() + "=" + scalar_text(it.value()));
                }
                return join(parts, ",");
            }
        }
        return std::nullopt;
    }

    bool is_set(const Value& layer, const char* key) {
        auto it = layer.find(key);
        return it != layer.end() && !it->is_null();
    }

    /**
     * @brief Lay the options of @p upper over @p lower
     *
     * Options are flat: a value in the upper layer replaces the lower one
     * whole, so ports, edits and label mappings never mix entries from two
     * layers. A null upper value leaves the lower value in place.
     */
    Value overlay(const Value& lower, const Value& upper) {
        Value result = lower.is_object() ? lower : Value::object();
        if (!upper.is_object()) {
            return result;
        }
        for (auto it = upper.begin(); it != upper.end(); ++it) {
            if (!it->is_null()) {
                result[it.key()] = it.value();
            }
        }
        return result;
    }
}

// ============================================================================
// Edit
// ============================================================================

const char* to_string(Edit::Action action) noexcept {
    switch (action) {
        case Edit::Action::Put:    return "put";
        case Edit::Action::Update: return "update";
        case Edit::Action::Append: return "append";
    }
    return "unknown";
}

Edit Edit::from_json(const Value& j) {
    if (!j.is_object()) {
        throw ConfigError("Edit must be a mapping, got " + type_name(j));
    }

    Edit edit;

    auto action = j.find("action");
    if (action == j.end() || !action->is_string()) {
        throw ConfigError("Edit is missing 'action': " + j.dump());
    }
    const std::string name = to_lower(action->get<std::string>());
    if (name == "put") {
        edit.action = Action::Put;
    } else if (name == "update") {
        edit.action = Action::Update;
    } else if (name == "append") {
        edit.action = Action::Append;
    } else {
        throw ConfigError("Unknown edit action '" + name + "' (expected put, update or append)");
    }

    auto key = j.find("key");
    if (key == j.end() || !key->is_string()) {
        throw ConfigError("Edit is missing 'key': " + j.dump());
    }
    edit.key = key->get<std::string>();

    edit.value = j.value("value", Value());

    auto index = j.find("index");
    if (index != j.end() && !index->is_null()) {
        if (!index->is_number_integer()) {
            throw ConfigError("Edit 'index' must be an integer: " + j.dump());
        }
        edit.index = index->get<long>();
    }

    auto curr = j.find("curr_value");
    if (curr != j.end() && !curr->is_null()) {
        edit.curr_value = *curr;
    }

    auto vtype = j.find("value_type");
    if (vtype != j.end() && vtype->is_string()) {
        edit.value_type = vtype->get<std::string>();
    }

    return edit;
}

Value Edit::to_json() const {
    Value j = {
        {"action", to_string(action)},
        {"key", key},
        {"value", value}
    };
    if (index) j["index"] = *index;
    if (curr_value) j["curr_value"] = *curr_value;
    if (!value_type.empty()) j["value_type"] = value_type;
    return j;
}

// ============================================================================
// RouterConfig
// ============================================================================

Value RouterConfig::defaults() {
    return Value{
        {"state", "present"},
        {"debug", false},
        {"name", "router"},
        {"namespace", "default"},
        {"kubeconfig", "/etc/origin/master/admin.kubeconfig"},
        {"oc", "oc"},
        {"settle_seconds", 15},
        {"default_cert", nullptr},
        {"cert_file", nullptr},
        {"key_file", nullptr},
        {"cacert_file", nullptr},
        {"images", nullptr},
        {"latest_images", false},
        {"labels", nullptr},
        {"ports", Value::array({"80:80", "443:443"})},
        {"replicas", 1},
        {"selector", nullptr},
        {"service_account", "router"},
        {"router_type", "haproxy-router"},
        {"host_network", true},
        {"external_host", nullptr},
        {"external_host_vserver", nullptr},
        {"external_host_insecure", false},
        {"external_host_partition_path", nullptr},
        {"external_host_username", nullptr},
        {"external_host_password", nullptr},
        {"external_host_private_key", nullptr},
        {"expose_metrics", false},
        {"metrics_image", nullptr},
        {"stats_user", nullptr},
        {"stats_password", nullptr},
        {"stats_port", 1936},
        {"edits", Value::array()}
    };
}

RouterConfig::RouterConfig()
    : data_(defaults())
{}

RouterConfig::RouterConfig(const Value& data)
    : data_(overlay(defaults(), data))
{}

RouterConfig RouterConfig::load(const LoadOptions& opts) {
    // Everything above the defaults, so explicit settings can be told apart
    RouterConfig user(Value::object());
    user.data_ = Value::object();

    // 1) file
    if (opts.file_path.has_value()) {
        Value filej = load_config_file(*opts.file_path);
        if (!filej.is_object()) {
            throw ConfigParseError(*opts.file_path, "top level must be a mapping");
        }
        user.data_ = overlay(user.data_, filej);
    }

    // 2) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        user.apply_env_prefix(*opts.prefix);
    }

    // 3) overrides
    user.apply_overrides(opts.overrides);

    if (is_set(user.data_, "router_type") && is_set(user.data_, "images")) {
        throw ConfigError("Options 'router_type' and 'images' are mutually exclusive");
    }

    RouterConfig cfg(user.data_);
    cfg.validate();

    // 4) mandatory
    std::vector<std::string> mandatory = opts.mandatory;
    if (cfg.state() == State::Present) {
        for (const char* key : {"cert_file", "key_file"}) {
            if (std::find(mandatory.begin(), mandatory.end(), key) == mandatory.end()) {
                mandatory.emplace_back(key);
            }
        }
    }
    cfg.enforce_mandatory(mandatory);

    return cfg;
}

bool RouterConfig::contains(const std::string& key) const {
    return is_set(data_, key.c_str());
}

const Value& RouterConfig::at(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end()) {
        throw ConfigError("Unknown configuration key: " + key);
    }
    return *it;
}

void RouterConfig::set(const std::string& key, const Value& value) {
    data_[key] = value;
}

std::string RouterConfig::name() const {
    return get<std::string>("name", "router");
}

std::string RouterConfig::namespace_name() const {
    return get<std::string>("namespace", "default");
}

std::string RouterConfig::kubeconfig() const {
    return get<std::string>("kubeconfig", "");
}

std::string RouterConfig::service_account() const {
    return get<std::string>("service_account", "router");
}

std::string RouterConfig::oc_binary() const {
    return get<std::string>("oc", "oc");
}

State RouterConfig::state() const {
    const std::string text = get<std::string>("state", "present");
    auto state = state_from_string(text);
    if (!state) {
        throw ConfigError("Invalid state '" + text + "' (expected present or absent)");
    }
    return *state;
}

bool RouterConfig::debug() const {
    return get<bool>("debug", false);
}

std::chrono::seconds RouterConfig::settle_interval() const {
    return std::chrono::seconds(get<long>("settle_seconds", 15));
}

bool RouterConfig::has_stats_password() const {
    return contains("stats_password") && option_text(at("stats_password")).has_value();
}

std::vector<Edit> RouterConfig::edits() const {
    std::vector<Edit> out;
    if (!contains("edits")) {
        return out;
    }
    const Value& list = at("edits");
    if (!list.is_array()) {
        throw ConfigError("'edits' must be a sequence, got " + type_name(list));
    }
    for (const auto& item : list) {
        out.push_back(Edit::from_json(item));
    }
    return out;
}

std::vector<std::string> RouterConfig::to_option_list() const {
    std::vector<std::string> out;
    for (const auto& spec : kOptionSpecs) {
        if (!spec.include || !data_.contains(spec.key)) {
            continue;
        }
        auto text = option_text(data_[spec.key]);
        if (!text) {
            continue;
        }
        std::string flag = spec.key;
        std::replace(flag.begin(), flag.end(), '_', '-');
        out.push_back("--" + flag + "=" + *text);
    }
    return out;
}

void RouterConfig::validate() const {
    (void)state();

    if (contains("settle_seconds")) {
        const Value& settle = at("settle_seconds");
        if (!settle.is_number_integer() || settle.get<long>() < 0) {
            throw ConfigError("'settle_seconds' must be a non-negative integer");
        }
    }

    if (name().empty()) {
        throw ConfigError("'name' must not be empty");
    }

    // Surfaces malformed edits before any cluster call
    (void)edits();
}

void RouterConfig::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

void RouterConfig::apply_env_prefix(const std::string& prefix) {
    // prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.rfind(normalized, 0) != 0) {
            continue;
        }
        const std::string key = to_lower(name.substr(normalized.size()));
        if (key.empty()) continue;
        data_[key] = parse_value(value);
    }
}

void RouterConfig::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        data_[k] = v;
    }
}

std::string RouterConfig::to_json_string(int indent) const {
    return data_.dump(indent);
}

} // namespace routerkit
