/**
 * @file Bundle.hpp
 * @brief The set of resources that make up one router
 */

#ifndef ROUTERKIT_BUNDLE_HPP
#define ROUTERKIT_BUNDLE_HPP

#include "routerkit/Resource.hpp"
#include <optional>
#include <vector>

namespace routerkit {

/**
 * @brief One resource per managed kind, each possibly absent
 *
 * Used both for the dry-run rendering (desired) and for what was fetched
 * from the cluster (observed).
 */
struct RouterBundle {
    std::optional<DeploymentConfig> deployment;
    std::optional<Service> service;
    std::optional<ServiceAccount> service_account;
    std::optional<Secret> secret;
    std::optional<RoleBinding> role_binding;

    /**
     * @brief Build a bundle from the "items" of a dry-run list
     *
     * Items of unmanaged kinds are ignored; a later item of the same kind
     * replaces an earlier one.
     */
    static RouterBundle from_items(const Value& items);

    /**
     * @brief Store @p content as the resource of @p kind
     */
    void set(ResourceKind kind, Value content);

    /**
     * @brief Resource of @p kind, or nullptr when absent
     */
    const ManagedResource* find(ResourceKind kind) const;

    /**
     * @brief Present resources, in creation order
     */
    std::vector<const ManagedResource*> parts() const;

    bool empty() const { return parts().empty(); }
};

} // namespace routerkit

#endif // ROUTERKIT_BUNDLE_HPP
