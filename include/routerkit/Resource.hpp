/**
 * @file Resource.hpp
 * @brief Typed wrappers over the documents of a router bundle
 *
 * Each managed resource owns one Document. Accessors read from the
 * document on every call and mutators go through the Document operations,
 * so there is never a cached view that can drift from the tree.
 */

#ifndef ROUTERKIT_RESOURCE_HPP
#define ROUTERKIT_RESOURCE_HPP

#include "routerkit/Document.hpp"
#include "routerkit/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace routerkit {

enum class ResourceKind {
    DeploymentConfig,
    Service,
    ServiceAccount,
    Secret,
    ClusterRoleBinding
};

/**
 * @brief API kind name ("DeploymentConfig", "Service", ...)
 */
const char* to_string(ResourceKind kind) noexcept;

/**
 * @brief Name used on the oc command line ("dc", "svc", "sa", ...)
 */
const char* short_name(ResourceKind kind) noexcept;

/**
 * @brief Map an API kind name back to a ResourceKind
 * @return std::nullopt for kinds the router does not manage
 */
std::optional<ResourceKind> kind_from_string(const std::string& kind);

/**
 * @brief Index of the first element of @p list whose "name" equals @p name
 */
std::optional<size_t> find_named(const Value& list, const std::string& name);

// ============================================================================
// ManagedResource
// ============================================================================

/**
 * @brief A resource document tagged with its kind
 */
class ManagedResource {
public:
    ManagedResource(ResourceKind kind, Document document);

    ResourceKind kind() const noexcept { return kind_; }

    /**
     * @brief metadata.name, or "" when absent
     */
    std::string name() const;

    const Document& document() const noexcept { return doc_; }
    Document& document() noexcept { return doc_; }

    const Value& root() const noexcept { return doc_.root(); }

protected:
    // Sequence at path, [] when absent
    Value list_at(const std::string& path) const;
    // Mapping at path, {} when absent
    Value map_at(const std::string& path) const;

    static std::string indexed(const std::string& path, size_t index);

    ResourceKind kind_;
    Document doc_;
};

// ============================================================================
// DeploymentConfig
// ============================================================================

/**
 * @brief Router deployment: replicas, first-container env, ports and volumes
 */
class DeploymentConfig : public ManagedResource {
public:
    static constexpr const char* kReplicasPath = "spec.replicas";
    static constexpr const char* kContainersPath = "spec.template.spec.containers";
    static constexpr const char* kEnvPath = "spec.template.spec.containers[0].env";
    static constexpr const char* kPortsPath = "spec.template.spec.containers[0].ports";
    static constexpr const char* kVolumesPath = "spec.template.spec.volumes";
    static constexpr const char* kVolumeMountsPath = "spec.template.spec.containers[0].volumeMounts";

    explicit DeploymentConfig(Document document);
    explicit DeploymentConfig(Value content);

    std::optional<Value> replicas() const;
    bool update_replicas(const Value& replicas);
    bool needs_update_replicas(const Value& replicas) const;

    // Environment of the first container
    Value env_vars() const;
    std::optional<Value> env_value(const std::string& key) const;
    bool exists_env_key(const std::string& key) const;
    bool exists_env_value(const std::string& key, const Value& value) const;
    bool add_env_value(const std::string& key, const Value& value);

    /**
     * @brief Set the value of an existing variable, or add it
     */
    bool update_env_var(const std::string& key, const Value& value);

    /**
     * @brief Remove every listed variable that is present
     * @return true if at least one variable was removed
     */
    bool delete_env_vars(const std::vector<std::string>& keys);

    Value container_ports() const;

    Value volumes() const;
    Value volume_mounts() const;
    std::optional<Value> find_volume_by_name(const std::string& name, bool mounts = false) const;
    bool exists_volume(const Value& volume) const;
    bool exists_volume_mount(const Value& volume_mount) const;
    bool add_volume(const Value& volume);
    bool add_volume_mount(const Value& volume_mount);

    /**
     * @brief Replace the volume with the same name, or add it
     */
    bool update_volume(const Value& volume);

    /**
     * @brief Remove the named volume and its mount
     */
    bool delete_volume_by_name(const std::string& name);
};

// ============================================================================
// Service
// ============================================================================

class Service : public ManagedResource {
public:
    static constexpr const char* kPortsPath = "spec.ports";
    static constexpr const char* kClusterIpPath = "spec.clusterIP";
    static constexpr const char* kPortalIpPath = "spec.portalIP";

    explicit Service(Document document);
    explicit Service(Value content);

    Value ports() const;

    /**
     * @brief Append one port mapping or a sequence of them
     */
    bool add_ports(const Value& ports);

    /**
     * @brief Port whose "port" number matches that of @p port
     */
    std::optional<Value> find_port(const Value& port) const;

    bool delete_ports(const Value& ports);

    bool add_cluster_ip(const std::string& ip);
    bool add_portal_ip(const std::string& ip);

    /**
     * @brief Set "protocol" on every port
     * @return true if any port changed
     */
    bool force_port_protocol(const std::string& protocol = "TCP");
};

// ============================================================================
// ServiceAccount
// ============================================================================

class ServiceAccount : public ManagedResource {
public:
    static constexpr const char* kSecretsPath = "secrets";
    static constexpr const char* kImagePullSecretsPath = "imagePullSecrets";

    explicit ServiceAccount(Document document);
    explicit ServiceAccount(Value content);

    Value secrets() const;
    Value image_pull_secrets() const;

    std::optional<Value> find_secret(const std::string& name) const;
    std::optional<Value> find_image_pull_secret(const std::string& name) const;

    bool add_secret(const std::string& name);
    bool add_image_pull_secret(const std::string& name);

    bool delete_secret(const std::string& name);
    bool delete_image_pull_secret(const std::string& name);
};

// ============================================================================
// Secret
// ============================================================================

/**
 * @brief Opaque secret; entries live under "data"
 *
 * Entry keys such as "tls.crt" contain the path separator, so entries are
 * edited through the "data" mapping as a whole.
 */
class Secret : public ManagedResource {
public:
    static constexpr const char* kDataPath = "data";

    explicit Secret(Document document);
    explicit Secret(Value content);

    Value secrets() const;
    std::optional<Value> find_secret(const std::string& key) const;
    bool add_secret(const std::string& key, const Value& value);
    bool update_secret(const std::string& key, const Value& value);
    bool delete_secret(const std::string& key);
};

// ============================================================================
// RoleBinding
// ============================================================================

/**
 * @brief Cluster role binding granting the router its cluster role
 */
class RoleBinding : public ManagedResource {
public:
    static constexpr const char* kSubjectsPath = "subjects";
    static constexpr const char* kRoleRefPath = "roleRef";
    static constexpr const char* kGroupNamesPath = "groupNames";
    static constexpr const char* kUserNamesPath = "userNames";

    explicit RoleBinding(Document document);
    explicit RoleBinding(Value content);

    Value subjects() const;
    Value role_ref() const;
    Value group_names() const;
    Value user_names() const;

    std::optional<size_t> find_subject(const Value& subject) const;
    std::optional<size_t> find_group_name(const std::string& group) const;
    std::optional<size_t> find_user_name(const std::string& user) const;

    bool add_subject(const Value& subject);
    bool add_group_name(const std::string& group);
    bool add_user_name(const std::string& user);

    /**
     * @brief Set roleRef.name when no role is referenced yet
     */
    bool add_role_ref(const std::string& role);

    bool remove_subject(const Value& subject);
    bool remove_group_name(const std::string& group);
    bool remove_user_name(const std::string& user);
    bool remove_role_ref(const std::string& role);

    bool update_subject(const Value& subject);
};

} // namespace routerkit

#endif // ROUTERKIT_RESOURCE_HPP
