/**
 * @file Resource.cpp
 * @brief Typed resource accessors
 */

#include "routerkit/Resource.hpp"

#include <algorithm>

namespace routerkit {

const char* to_string(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::DeploymentConfig:   return "DeploymentConfig";
        case ResourceKind::Service:            return "Service";
        case ResourceKind::ServiceAccount:     return "ServiceAccount";
        case ResourceKind::Secret:             return "Secret";
        case ResourceKind::ClusterRoleBinding: return "ClusterRoleBinding";
    }
    return "Unknown";
}

const char* short_name(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::DeploymentConfig:   return "dc";
        case ResourceKind::Service:            return "svc";
        case ResourceKind::ServiceAccount:     return "sa";
        case ResourceKind::Secret:             return "secret";
        case ResourceKind::ClusterRoleBinding: return "clusterrolebinding";
    }
    return "unknown";
}

std::optional<ResourceKind> kind_from_string(const std::string& kind) {
    for (auto k : {ResourceKind::DeploymentConfig, ResourceKind::Service,
                   ResourceKind::ServiceAccount, ResourceKind::Secret,
                   ResourceKind::ClusterRoleBinding}) {
        if (kind == to_string(k)) {
            return k;
        }
    }
    return std::nullopt;
}

std::optional<size_t> find_named(const Value& list, const std::string& name) {
    if (!list.is_array()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < list.size(); ++i) {
        const Value& item = list[i];
        if (item.is_object() && item.value("name", Value()) == name) {
            return i;
        }
    }
    return std::nullopt;
}

// ============================================================================
// ManagedResource
// ============================================================================

ManagedResource::ManagedResource(ResourceKind kind, Document document)
    : kind_(kind)
    , doc_(std::move(document))
{}

std::string ManagedResource::name() const {
    auto value = doc_.get("metadata.name");
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return "";
}

Value ManagedResource::list_at(const std::string& path) const {
    auto value = doc_.get(path);
    if (value && value->is_array()) {
        return *value;
    }
    return Value::array();
}

Value ManagedResource::map_at(const std::string& path) const {
    auto value = doc_.get(path);
    if (value && value->is_object()) {
        return *value;
    }
    return Value::object();
}

std::string ManagedResource::indexed(const std::string& path, size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

// ============================================================================
// DeploymentConfig
// ============================================================================

DeploymentConfig::DeploymentConfig(Document document)
    : ManagedResource(ResourceKind::DeploymentConfig, std::move(document))
{}

DeploymentConfig::DeploymentConfig(Value content)
    : DeploymentConfig(Document(std::move(content)))
{}

std::optional<Value> DeploymentConfig::replicas() const {
    return doc_.get(kReplicasPath);
}

bool DeploymentConfig::update_replicas(const Value& replicas) {
    return doc_.put(kReplicasPath, replicas);
}

bool DeploymentConfig::needs_update_replicas(const Value& replicas) const {
    auto current = doc_.get(kReplicasPath);
    return !current || *current != replicas;
}

Value DeploymentConfig::env_vars() const {
    return list_at(kEnvPath);
}

std::optional<Value> DeploymentConfig::env_value(const std::string& key) const {
    const Value env = env_vars();
    auto idx = find_named(env, key);
    if (!idx) {
        return std::nullopt;
    }
    return env[*idx].value("value", Value());
}

bool DeploymentConfig::exists_env_key(const std::string& key) const {
    return find_named(env_vars(), key).has_value();
}

bool DeploymentConfig::exists_env_value(const std::string& key, const Value& value) const {
    auto current = env_value(key);
    return current && *current == value;
}

bool DeploymentConfig::add_env_value(const std::string& key, const Value& value) {
    return doc_.append(kEnvPath, Value{{"name", key}, {"value", value}});
}

bool DeploymentConfig::update_env_var(const std::string& key, const Value& value) {
    auto idx = find_named(env_vars(), key);
    if (!idx) {
        return add_env_value(key, value);
    }
    doc_.put(indexed(kEnvPath, *idx) + ".value", value);
    return true;
}

bool DeploymentConfig::delete_env_vars(const std::vector<std::string>& keys) {
    bool modified = false;
    for (const auto& key : keys) {
        auto idx = find_named(env_vars(), key);
        if (idx && doc_.remove(indexed(kEnvPath, *idx))) {
            modified = true;
        }
    }
    return modified;
}

Value DeploymentConfig::container_ports() const {
    return list_at(kPortsPath);
}

Value DeploymentConfig::volumes() const {
    return list_at(kVolumesPath);
}

Value DeploymentConfig::volume_mounts() const {
    return list_at(kVolumeMountsPath);
}

std::optional<Value> DeploymentConfig::find_volume_by_name(const std::string& name, bool mounts) const {
    const Value list = mounts ? volume_mounts() : volumes();
    auto idx = find_named(list, name);
    if (!idx) {
        return std::nullopt;
    }
    return list[*idx];
}

bool DeploymentConfig::exists_volume(const Value& volume) const {
    if (!volume.is_object() || !volume.contains("name")) {
        return false;
    }
    return find_volume_by_name(volume["name"].get<std::string>()).has_value();
}

bool DeploymentConfig::exists_volume_mount(const Value& volume_mount) const {
    if (!volume_mount.is_object() || !volume_mount.contains("name")) {
        return false;
    }
    return find_volume_by_name(volume_mount["name"].get<std::string>(), true).has_value();
}

bool DeploymentConfig::add_volume(const Value& volume) {
    if (volume.is_null() || volume.empty()) {
        return false;
    }
    return doc_.append(kVolumesPath, volume);
}

bool DeploymentConfig::add_volume_mount(const Value& volume_mount) {
    if (volume_mount.is_null() || volume_mount.empty()) {
        return false;
    }
    return doc_.append(kVolumeMountsPath, volume_mount);
}

bool DeploymentConfig::update_volume(const Value& volume) {
    if (!volume.is_object() || !volume.contains("name")) {
        return false;
    }
    auto idx = find_named(volumes(), volume["name"].get<std::string>());
    if (!idx) {
        return add_volume(volume);
    }
    doc_.put(indexed(kVolumesPath, *idx), volume);
    return true;
}

bool DeploymentConfig::delete_volume_by_name(const std::string& name) {
    bool modified = false;
    if (auto idx = find_named(volumes(), name)) {
        modified = doc_.remove(indexed(kVolumesPath, *idx));
    }
    if (auto idx = find_named(volume_mounts(), name)) {
        modified = doc_.remove(indexed(kVolumeMountsPath, *idx)) || modified;
    }
    return modified;
}

// ============================================================================
// Service
// ============================================================================

Service::Service(Document document)
    : ManagedResource(ResourceKind::Service, std::move(document))
{}

Service::Service(Value content)
    : Service(Document(std::move(content)))
{}

Value Service::ports() const {
    return list_at(kPortsPath);
}

bool Service::add_ports(const Value& ports) {
    const Value list = ports.is_array() ? ports : Value::array({ports});
    bool added = false;
    for (const auto& port : list) {
        added = doc_.append(kPortsPath, port) || added;
    }
    return added;
}

std::optional<Value> Service::find_port(const Value& port) const {
    if (!port.is_object() || !port.contains("port")) {
        return std::nullopt;
    }
    for (const auto& existing : ports()) {
        if (existing.is_object() && existing.value("port", Value()) == port["port"]) {
            return existing;
        }
    }
    return std::nullopt;
}

bool Service::delete_ports(const Value& ports) {
    const Value list = ports.is_array() ? ports : Value::array({ports});
    bool removed = false;
    for (const auto& port : list) {
        auto existing = find_port(port);
        if (existing && doc_.pop(kPortsPath, *existing)) {
            removed = true;
        }
    }
    return removed;
}

bool Service::add_cluster_ip(const std::string& ip) {
    return doc_.put(kClusterIpPath, ip);
}

bool Service::add_portal_ip(const std::string& ip) {
    return doc_.put(kPortalIpPath, ip);
}

bool Service::force_port_protocol(const std::string& protocol) {
    bool changed = false;
    const size_t count = ports().size();
    for (size_t i = 0; i < count; ++i) {
        changed = doc_.put(indexed(kPortsPath, i) + ".protocol", protocol) || changed;
    }
    return changed;
}

// ============================================================================
// ServiceAccount
// ============================================================================

ServiceAccount::ServiceAccount(Document document)
    : ManagedResource(ResourceKind::ServiceAccount, std::move(document))
{}

ServiceAccount::ServiceAccount(Value content)
    : ServiceAccount(Document(std::move(content)))
{}

Value ServiceAccount::secrets() const {
    return list_at(kSecretsPath);
}

Value ServiceAccount::image_pull_secrets() const {
    return list_at(kImagePullSecretsPath);
}

std::optional<Value> ServiceAccount::find_secret(const std::string& name) const {
    const Value list = secrets();
    auto idx = find_named(list, name);
    if (!idx) return std::nullopt;
    return list[*idx];
}

std::optional<Value> ServiceAccount::find_image_pull_secret(const std::string& name) const {
    const Value list = image_pull_secrets();
    auto idx = find_named(list, name);
    if (!idx) return std::nullopt;
    return list[*idx];
}

bool ServiceAccount::add_secret(const std::string& name) {
    return doc_.append(kSecretsPath, Value{{"name", name}});
}

bool ServiceAccount::add_image_pull_secret(const std::string& name) {
    return doc_.append(kImagePullSecretsPath, Value{{"name", name}});
}

bool ServiceAccount::delete_secret(const std::string& name) {
    auto idx = find_named(secrets(), name);
    return idx && doc_.remove(indexed(kSecretsPath, *idx));
}

bool ServiceAccount::delete_image_pull_secret(const std::string& name) {
    auto idx = find_named(image_pull_secrets(), name);
    return idx && doc_.remove(indexed(kImagePullSecretsPath, *idx));
}

// ============================================================================
// Secret
// ============================================================================

Secret::Secret(Document document)
    : ManagedResource(ResourceKind::Secret, std::move(document))
{}

Secret::Secret(Value content)
    : Secret(Document(std::move(content)))
{}

Value Secret::secrets() const {
    return map_at(kDataPath);
}

std::optional<Value> Secret::find_secret(const std::string& key) const {
    const Value data = secrets();
    auto it = data.find(key);
    if (it == data.end()) {
        return std::nullopt;
    }
    return *it;
}

bool Secret::add_secret(const std::string& key, const Value& value) {
    Value data = secrets();
    data[key] = value;
    doc_.put(kDataPath, data);
    return true;
}

bool Secret::update_secret(const std::string& key, const Value& value) {
    return add_secret(key, value);
}

bool Secret::delete_secret(const std::string& key) {
    return doc_.pop(kDataPath, key);
}

// ============================================================================
// RoleBinding
// ============================================================================

RoleBinding::RoleBinding(Document document)
    : ManagedResource(ResourceKind::ClusterRoleBinding, std::move(document))
{}

RoleBinding::RoleBinding(Value content)
    : RoleBinding(Document(std::move(content)))
{}

Value RoleBinding::subjects() const {
    return list_at(kSubjectsPath);
}

Value RoleBinding::role_ref() const {
    return map_at(kRoleRefPath);
}

Value RoleBinding::group_names() const {
    return list_at(kGroupNamesPath);
}

Value RoleBinding::user_names() const {
    return list_at(kUserNamesPath);
}

namespace {
    std::optional<size_t> index_of(const Value& list, const Value& item) {
        auto it = std::find(list.begin(), list.end(), item);
        if (it == list.end()) {
            return std::nullopt;
        }
        return static_cast<size_t>(std::distance(list.begin(), it));
    }
}

std::optional<size_t> RoleBinding::find_subject(const Value& subject) const {
    return index_of(subjects(), subject);
}

std::optional<size_t> RoleBinding::find_group_name(const std::string& group) const {
    return index_of(group_names(), group);
}

std::optional<size_t> RoleBinding::find_user_name(const std::string& user) const {
    return index_of(user_names(), user);
}

bool RoleBinding::add_subject(const Value& subject) {
    return doc_.append(kSubjectsPath, subject);
}

bool RoleBinding::add_group_name(const std::string& group) {
    return doc_.append(kGroupNamesPath, group);
}

bool RoleBinding::add_user_name(const std::string& user) {
    return doc_.append(kUserNamesPath, user);
}

bool RoleBinding::add_role_ref(const std::string& role) {
    if (!role_ref().empty()) {
        return false;
    }
    return doc_.put(kRoleRefPath, Value{{"name", role}});
}

bool RoleBinding::remove_subject(const Value& subject) {
    return doc_.pop(kSubjectsPath, subject);
}

bool RoleBinding::remove_group_name(const std::string& group) {
    return doc_.pop(kGroupNamesPath, group);
}

bool RoleBinding::remove_user_name(const std::string& user) {
    return doc_.pop(kUserNamesPath, user);
}

bool RoleBinding::remove_role_ref(const std::string& role) {
    const Value ref = role_ref();
    if (ref.value("name", Value()) != role) {
        return false;
    }
    return doc_.remove(std::string(kRoleRefPath) + ".name");
}

bool RoleBinding::update_subject(const Value& subject) {
    if (find_subject(subject)) {
        return true;
    }
    return add_subject(subject);
}

} // namespace routerkit
