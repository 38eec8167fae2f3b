/**
 * @file Router.hpp
 * @brief Reconciliation of one router against the cluster
 *
 * A pass observes the live parts, renders the desired bundle with a
 * dry run, applies the declared edits and then decides between create,
 * no-op, update (delete everything, settle, recreate) and delete.
 *
 * Example:
 * ```cpp
 * OcClient client(options, std::make_unique<ProcessRunner>());
 * Router router(config, client);
 * Status status = router.run();
 * std::cout << status.to_json().dump(2) << std::endl;
 * ```
 */

#ifndef ROUTERKIT_ROUTER_HPP
#define ROUTERKIT_ROUTER_HPP

#include "routerkit/Bundle.hpp"
#include "routerkit/ClusterClient.hpp"
#include "routerkit/RouterConfig.hpp"
#include "routerkit/Status.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace routerkit {

/**
 * @brief Kind and name of one managed cluster object
 */
struct RouterPart {
    ResourceKind kind;
    std::string name;
};

/**
 * @brief Apply declared edits to a rendered deployment, in order
 *
 * Edit values are decoded with parse_typed_value() only when the edit
 * carries a value_type; otherwise they are stored as given.
 *
 * @return true if at least one edit changed the document
 * @throws RenderingFailedError if edits were given and none changed anything
 * @throws TypeMismatchError if an edit does not fit its target
 */
bool apply_edits(DeploymentConfig& deployment, const std::vector<Edit>& edits);

class Router {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    /**
     * @param config Router options
     * @param client Cluster access; must outlive the router
     * @param sleeper Settling wait used by update(); defaults to
     *        std::this_thread::sleep_for
     */
    Router(RouterConfig config, ClusterClient& client, Sleeper sleeper = {});

    const RouterConfig& config() const noexcept { return config_; }

    /**
     * @brief The five managed objects, in creation order
     */
    std::vector<RouterPart> parts() const;

    /**
     * @brief Fetch every part from the cluster
     */
    const RouterBundle& observe();

    const RouterBundle& observed() const noexcept { return observed_; }

    /**
     * @brief Deployment, service, service account and secret are all live
     */
    bool exists() const;

    /**
     * @brief Whether any part is live
     */
    bool any_exists() const;

    /**
     * @brief Dry-run render plus edits; cached for the rest of the pass
     * @throws RenderingFailedError, CollaboratorError
     */
    const RouterBundle& render();

    /**
     * @brief Compare the rendered bundle with the observed one
     *
     * Renders first if needed. Works on copies; neither bundle changes.
     */
    bool needs_update();

    /**
     * @brief Create every rendered part
     *
     * "already exists" is tolerated per part.
     *
     * @return Sequence of per-part command results
     * @throws CollaboratorError aggregating the parts that failed
     */
    Value create();

    /**
     * @brief Delete all parts, wait the settling interval, create again
     * @return {"delete": [...], "create": [...]}
     */
    Value update();

    /**
     * @brief Delete every part; "not found" is tolerated
     * @throws CollaboratorError aggregating the parts that failed
     */
    Value remove();

    /**
     * @brief One reconciliation pass toward the configured state
     *
     * Errors are reported in the returned Status, never thrown.
     *
     * @param check_mode Report the decision without changing the cluster
     */
    Status run(bool check_mode = false);

private:
    Status ensure_present(bool check_mode);
    Status ensure_absent(bool check_mode);

    RouterConfig config_;
    ClusterClient& client_;
    Sleeper sleeper_;

    RouterBundle observed_;
    std::optional<RouterBundle> desired_;
};

} // namespace routerkit

#endif // ROUTERKIT_ROUTER_HPP
