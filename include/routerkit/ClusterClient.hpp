/**
 * @file ClusterClient.hpp
 * @brief Access to the cluster through the oc command line tool
 */

#ifndef ROUTERKIT_CLUSTER_CLIENT_HPP
#define ROUTERKIT_CLUSTER_CLIENT_HPP

#include "routerkit/Command.hpp"
#include "routerkit/TempFile.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace routerkit {

/**
 * @brief The four cluster operations reconciliation needs
 *
 * Failures are reported through CommandResult::returncode; only a failure
 * to run the tool at all is thrown.
 */
class ClusterClient {
public:
    virtual ~ClusterClient() = default;

    /**
     * @brief Dry-run render of the router bundle
     * @param name Router name
     * @param namespace_name Target namespace
     * @param options Rendered "--key=value" options
     * @return results holds the JSON list (with "items")
     */
    virtual CommandResult render(const std::string& name,
                                 const std::string& namespace_name,
                                 const std::vector<std::string>& options) = 0;

    /**
     * @brief Fetch objects of @p kind by name or label selector
     * @return results is always a sequence ([] on failure)
     */
    virtual CommandResult get(const std::string& kind,
                              const std::string& name,
                              const std::string& selector = "") = 0;

    /**
     * @brief Create the object(s) described by a document file
     */
    virtual CommandResult create(const std::string& file) = 0;

    /**
     * @brief Delete an object by kind and name
     */
    virtual CommandResult remove(const std::string& kind,
                                 const std::string& name,
                                 const std::string& selector = "") = 0;
};

struct ClientOptions {
    std::string namespace_name = "default";
    std::string kubeconfig;
    std::string oc_binary = "oc";
    bool all_namespaces = false;
    bool verbose = false;
};

/**
 * @brief ClusterClient backed by the oc binary
 *
 * Every command runs with KUBECONFIG pointing at a private copy of the
 * configured kubeconfig that lives as long as the client. Commands other
 * than render are scoped with "-n <namespace>" (or "--all-namespaces")
 * unless the namespace is empty or "none".
 */
class OcClient : public ClusterClient {
public:
    /**
     * @throws FileNotFoundError if a kubeconfig is configured but missing
     */
    OcClient(ClientOptions options, std::unique_ptr<CommandRunner> runner);

    CommandResult render(const std::string& name,
                         const std::string& namespace_name,
                         const std::vector<std::string>& options) override;

    CommandResult get(const std::string& kind,
                      const std::string& name,
                      const std::string& selector = "") override;

    CommandResult create(const std::string& file) override;

    CommandResult remove(const std::string& kind,
                         const std::string& name,
                         const std::string& selector = "") override;

    const ClientOptions& options() const noexcept { return options_; }

    /**
     * @brief Path of the private kubeconfig copy ("" when none)
     */
    std::string kubeconfig_path() const;

private:
    std::vector<std::string> base_command(bool scoped) const;
    CommandResult execute(std::vector<std::string> argv, bool json_output);

    ClientOptions options_;
    std::unique_ptr<CommandRunner> runner_;
    std::optional<TempFile> kubeconfig_copy_;
};

} // namespace routerkit

#endif // ROUTERKIT_CLUSTER_CLIENT_HPP
