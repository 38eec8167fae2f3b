/**
 * @file Bundle.cpp
 * @brief RouterBundle implementation
 */

#include "routerkit/Bundle.hpp"

namespace routerkit {

RouterBundle RouterBundle::from_items(const Value& items) {
    RouterBundle bundle;
    if (!items.is_array()) {
        return bundle;
    }

    for (const auto& item : items) {
        if (!item.is_object()) {
            continue;
        }
        auto kind_it = item.find("kind");
        if (kind_it == item.end() || !kind_it->is_string()) {
            continue;
        }
        if (auto kind = kind_from_string(kind_it->get<std::string>())) {
            bundle.set(*kind, item);
        }
    }
    return bundle;
}

void RouterBundle::set(ResourceKind kind, Value content) {
    switch (kind) {
        case ResourceKind::DeploymentConfig:
            deployment.emplace(std::move(content));
            break;
        case ResourceKind::Service:
            service.emplace(std::move(content));
            break;
        case ResourceKind::ServiceAccount:
            service_account.emplace(std::move(content));
            break;
        case ResourceKind::Secret:
            secret.emplace(std::move(content));
            break;
        case ResourceKind::ClusterRoleBinding:
            role_binding.emplace(std::move(content));
            break;
    }
}

const ManagedResource* RouterBundle::find(ResourceKind kind) const {
    switch (kind) {
        case ResourceKind::DeploymentConfig:
            return deployment ? &*deployment : nullptr;
        case ResourceKind::Service:
            return service ? &*service : nullptr;
        case ResourceKind::ServiceAccount:
            return service_account ? &*service_account : nullptr;
        case ResourceKind::Secret:
            return secret ? &*secret : nullptr;
        case ResourceKind::ClusterRoleBinding:
            return role_binding ? &*role_binding : nullptr;
    }
    return nullptr;
}

std::vector<const ManagedResource*> RouterBundle::parts() const {
    std::vector<const ManagedResource*> out;
    for (auto kind : {ResourceKind::DeploymentConfig, ResourceKind::Service,
                      ResourceKind::ServiceAccount, ResourceKind::Secret,
                      ResourceKind::ClusterRoleBinding}) {
        if (const ManagedResource* part = find(kind)) {
            out.push_back(part);
        }
    }
    return out;
}

} // namespace routerkit
