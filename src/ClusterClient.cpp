/**
 * @file ClusterClient.cpp
 * @brief oc-backed cluster client
 */

#include "routerkit/ClusterClient.hpp"
#include "routerkit/Util.hpp"

#include <spdlog/spdlog.h>

namespace routerkit {

OcClient::OcClient(ClientOptions options, std::unique_ptr<CommandRunner> runner)
    : options_(std::move(options))
    , runner_(std::move(runner))
{
    if (!options_.kubeconfig.empty()) {
        kubeconfig_copy_.emplace(TempFile::copy_of(options_.kubeconfig, "routerkit-kubeconfig"));
    }
}

std::string OcClient::kubeconfig_path() const {
    return kubeconfig_copy_ ? kubeconfig_copy_->path() : std::string();
}

std::vector<std::string> OcClient::base_command(bool scoped) const {
    std::vector<std::string> argv = {options_.oc_binary};
    if (!scoped) {
        return argv;
    }

    const std::string ns = to_lower(options_.namespace_name);
    if (options_.all_namespaces) {
        argv.push_back("--all-namespaces");
    } else if (!ns.empty() && ns != "none") {
        argv.push_back("-n");
        argv.push_back(options_.namespace_name);
    }
    return argv;
}

CommandResult OcClient::execute(std::vector<std::string> argv, bool json_output) {
    CommandResult result;
    result.cmd = join_command(argv);

    std::map<std::string, std::string> env;
    if (kubeconfig_copy_) {
        env["KUBECONFIG"] = kubeconfig_copy_->path();
    }

    if (options_.verbose) {
        spdlog::debug("oc: {}", result.cmd);
    }

    ProcessOutput output = runner_->run(argv, env);
    result.returncode = output.exit_code;
    result.stdout_text = std::move(output.out);
    result.stderr_text = std::move(output.err);

    if (!result.ok()) {
        result.results = Value::object();
        spdlog::debug("oc: exit {}: {}", result.returncode, trim(result.stderr_text));
        return result;
    }

    if (options_.verbose) {
        spdlog::debug("oc: STDOUT: {}", result.stdout_text);
        spdlog::debug("oc: STDERR: {}", result.stderr_text);
    }

    if (json_output) {
        try {
            result.results = Value::parse(result.stdout_text);
        } catch (const nlohmann::json::parse_error& e) {
            result.decode_error = e.what();
            spdlog::warn("oc: could not decode output of '{}': {}", result.cmd, e.what());
        }
    } else {
        result.results = result.stdout_text;
    }
    return result;
}

CommandResult OcClient::render(const std::string& name,
                               const std::string& namespace_name,
                               const std::vector<std::string>& options) {
    std::vector<std::string> argv = base_command(false);
    argv.insert(argv.end(), {"adm", "router", name, "-n", namespace_name});
    argv.insert(argv.end(), options.begin(), options.end());
    argv.insert(argv.end(), {"--dry-run=True", "-o", "json"});
    return execute(std::move(argv), true);
}

CommandResult OcClient::get(const std::string& kind,
                            const std::string& name,
                            const std::string& selector) {
    std::vector<std::string> argv = base_command(true);
    argv.push_back("get");
    argv.push_back(kind);
    if (!selector.empty()) {
        argv.push_back("--selector=" + selector);
    } else if (!name.empty()) {
        argv.push_back(name);
    }
    argv.insert(argv.end(), {"-o", "json"});

    CommandResult result = execute(std::move(argv), true);

    // Always hand back a sequence
    if (!result.ok() || result.decode_error) {
        result.results = Value::array();
    } else if (result.results.is_object() && result.results.contains("items")) {
        Value items = result.results["items"];
        result.results = items.is_array() ? std::move(items) : Value::array();
    } else if (!result.results.is_array()) {
        result.results = Value::array({result.results});
    }
    return result;
}

CommandResult OcClient::create(const std::string& file) {
    std::vector<std::string> argv = base_command(true);
    argv.insert(argv.end(), {"create", "-f", file});
    return execute(std::move(argv), false);
}

CommandResult OcClient::remove(const std::string& kind,
                               const std::string& name,
                               const std::string& selector) {
    std::vector<std::string> argv = base_command(true);
    argv.insert(argv.end(), {"delete", kind, name});
    if (!selector.empty()) {
        argv.push_back("--selector=" + selector);
    }
    return execute(std::move(argv), false);
}

} // namespace routerkit
