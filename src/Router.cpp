/**
 * @file Router.cpp
 * @brief Router reconciliation
 */

#include "routerkit/Router.hpp"
#include "routerkit/Compare.hpp"
#include "routerkit/Errors.hpp"
#include "routerkit/Parse.hpp"
#include "routerkit/TempFile.hpp"
#include "routerkit/Util.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace routerkit {

namespace {
    const std::set<std::string> kAccountSkip = {"secrets", "imagePullSecrets"};

    const std::set<std::string> kServiceSkip = {"portalIP", "clusterIP", "sessionAffinity", "type"};

    const std::set<std::string> kDeploymentSkip = {
        "dnsPolicy", "terminationGracePeriodSeconds", "restartPolicy", "timeoutSeconds",
        "livenessProbe", "readinessProbe", "terminationMessagePath", "hostPort", "defaultMode"
    };

    std::string read_text(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw FileNotFoundError(path);
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        std::string text = ss.str();
        if (!text.empty() && text.back() != '\n') {
            text += '\n';
        }
        return text;
    }

    // Throws one error describing every failed command
    void raise_failures(const std::vector<CommandResult>& failures) {
        if (failures.empty()) {
            return;
        }
        std::vector<std::string> cmds;
        std::vector<std::string> errors;
        for (const auto& failure : failures) {
            cmds.push_back(failure.cmd);
            errors.push_back(trim(failure.stderr_text));
        }
        throw CollaboratorError(join(cmds, "; "), failures.back().returncode, join(errors, "; "));
    }

    void settle(std::chrono::seconds interval) {
        std::this_thread::sleep_for(interval);
    }
}

// ============================================================================
// Edits
// ============================================================================

bool apply_edits(DeploymentConfig& deployment, const std::vector<Edit>& edits) {
    if (edits.empty()) {
        return false;
    }

    Document& doc = deployment.document();
    bool changed = false;

    for (const auto& edit : edits) {
        // values are taken verbatim unless a type hint asks for decoding
        const bool typed = !edit.value_type.empty();
        const Value value = typed ? parse_typed_value(edit.value, edit.value_type) : edit.value;
        bool result = false;

        switch (edit.action) {
            case Edit::Action::Put:
                result = doc.put(edit.key, value);
                break;

            case Edit::Action::Update: {
                std::optional<Value> curr_value;
                if (edit.curr_value) {
                    curr_value = typed ? parse_typed_value(*edit.curr_value, edit.value_type)
                                       : *edit.curr_value;
                }
                result = doc.update(edit.key, value, edit.index, curr_value);
                break;
            }

            case Edit::Action::Append:
                result = doc.append(edit.key, value);
                break;
        }

        spdlog::debug("edit {} {}: {}", to_string(edit.action), edit.key,
                      result ? "changed" : "unchanged");
        changed = changed || result;
    }

    if (!changed) {
        throw RenderingFailedError("none of the declared edits changed the deployment");
    }
    return true;
}

// ============================================================================
// Router
// ============================================================================

Router::Router(RouterConfig config, ClusterClient& client, Sleeper sleeper)
    : config_(std::move(config))
    , client_(client)
    , sleeper_(sleeper ? std::move(sleeper) : Sleeper(settle))
{}

std::vector<RouterPart> Router::parts() const {
    const std::string name = config_.name();
    return {
        {ResourceKind::DeploymentConfig, name},
        {ResourceKind::Service, name},
        {ResourceKind::ServiceAccount, config_.service_account()},
        {ResourceKind::Secret, name + "-certs"},
        {ResourceKind::ClusterRoleBinding, "router-" + name + "-role"},
    };
}

const RouterBundle& Router::observe() {
    observed_ = RouterBundle();
    for (const auto& part : parts()) {
        CommandResult result = client_.get(short_name(part.kind), part.name);
        if (result.ok() && result.results.is_array() && !result.results.empty()) {
            observed_.set(part.kind, result.results[0]);
        } else {
            spdlog::debug("{}/{} is not live", short_name(part.kind), part.name);
        }
    }
    return observed_;
}

bool Router::exists() const {
    return observed_.deployment && observed_.service &&
           observed_.service_account && observed_.secret;
}

bool Router::any_exists() const {
    return !observed_.empty();
}

const RouterBundle& Router::render() {
    if (desired_) {
        return *desired_;
    }

    RouterConfig options = config_;

    // Certificate, key and CA are handed to the dry run as one PEM file
    std::optional<TempFile> pem;
    if (config_.contains("cert_file")) {
        std::string bundle = read_text(config_.at("cert_file").get<std::string>());
        if (config_.contains("key_file")) {
            bundle += read_text(config_.at("key_file").get<std::string>());
        }
        if (config_.contains("cacert_file")) {
            const std::string cacert = config_.at("cacert_file").get<std::string>();
            std::error_code ec;
            if (fs::exists(cacert, ec)) {
                bundle += read_text(cacert);
            }
        }
        pem.emplace("routerkit-router", ".pem");
        pem->write(bundle);
        options.set("default_cert", pem->path());
    }

    CommandResult result = client_.render(config_.name(), config_.namespace_name(),
                                          options.to_option_list());
    if (!result.ok()) {
        throw RenderingFailedError("dry run exited with " + std::to_string(result.returncode) +
                                   ": " + trim(result.stderr_text));
    }
    if (result.decode_error) {
        throw RenderingFailedError("dry run output is not JSON: " + *result.decode_error);
    }

    Value items = Value::array();
    if (result.results.is_object()) {
        items = result.results.value("items", Value::array());
    }

    RouterBundle bundle = RouterBundle::from_items(items);
    if (!bundle.deployment) {
        throw RenderingFailedError("dry run produced no DeploymentConfig");
    }

    apply_edits(*bundle.deployment, config_.edits());

    desired_ = std::move(bundle);
    return *desired_;
}

bool Router::needs_update() {
    RouterBundle desired = render();
    const bool debug = config_.debug();

    if (desired.service) {
        desired.service->force_port_protocol("TCP");
    }

    if (desired.deployment) {
        DeploymentConfig& dc = *desired.deployment;

        // A generated password must not count as drift
        if (!config_.has_stats_password() && observed_.deployment) {
            if (auto live = observed_.deployment->env_value("STATS_PASSWORD")) {
                dc.update_env_var("STATS_PASSWORD", *live);
            }
        }

        const Value ports = dc.container_ports();
        for (size_t i = 0; i < ports.size(); ++i) {
            if (ports[i].is_object() && !ports[i].contains("protocol")) {
                dc.document().put(std::string(DeploymentConfig::kPortsPath) + "[" +
                                  std::to_string(i) + "].protocol", "TCP");
            }
        }
    }

    struct Check {
        ResourceKind kind;
        const std::set<std::string>& skip;
    };
    const Check checks[] = {
        {ResourceKind::ServiceAccount, kAccountSkip},
        {ResourceKind::Secret, kAccountSkip},
        {ResourceKind::Service, kServiceSkip},
        {ResourceKind::DeploymentConfig, kDeploymentSkip},
    };

    for (const auto& check : checks) {
        const ManagedResource* want = desired.find(check.kind);
        if (want == nullptr) {
            continue;
        }
        const ManagedResource* have = observed_.find(check.kind);
        if (have == nullptr) {
            spdlog::info("{} {} is rendered but not live", to_string(check.kind), want->name());
            return true;
        }
        if (!equal_under_skip(want->root(), have->root(), check.skip, debug)) {
            spdlog::info("{} {} differs from the live object", to_string(check.kind), want->name());
            return true;
        }
    }
    return false;
}

Value Router::create() {
    const RouterBundle& desired = render();

    Value results = Value::array();
    std::vector<CommandResult> failures;

    for (const ManagedResource* part : desired.parts()) {
        TempFile file(std::string("routerkit-") + short_name(part->kind()), ".yml");

        Document doc = part->document();
        doc.set_filename(file.path());
        doc.set_content_type(ContentType::Yaml);
        doc.write();

        CommandResult result = client_.create(file.path());
        if (!result.ok()) {
            if (contains(result.stderr_text, "already exist")) {
                spdlog::info("{} {} already exists", to_string(part->kind()), part->name());
            } else {
                failures.push_back(result);
            }
        }
        results.push_back(result.to_json());
    }

    raise_failures(failures);
    return results;
}

Value Router::update() {
    render();

    Value deleted = remove();

    spdlog::info("waiting {}s for router {} to settle", config_.settle_interval().count(),
                 config_.name());
    sleeper_(config_.settle_interval());

    Value created = create();
    return Value{{"delete", deleted}, {"create", created}};
}

Value Router::remove() {
    Value results = Value::array();
    std::vector<CommandResult> failures;

    for (const auto& part : parts()) {
        CommandResult result = client_.remove(short_name(part.kind), part.name);
        if (!result.ok() && !contains(result.stderr_text, "not found")) {
            failures.push_back(result);
        }
        results.push_back(result.to_json());
    }

    raise_failures(failures);
    return results;
}

Status Router::run(bool check_mode) {
    try {
        const State state = config_.state();
        observe();
        return state == State::Present ? ensure_present(check_mode) : ensure_absent(check_mode);
    } catch (const RouterKitError& e) {
        spdlog::error("router {}: {}", config_.name(), e.what());
        return Status::failure(e.what());
    }
}

Status Router::ensure_present(bool check_mode) {
    Status status;
    status.state = State::Present;

    if (!exists()) {
        status.changed = true;
        if (check_mode) {
            status.msg = "CHECK_MODE: Would have performed a create.";
            return status;
        }
        spdlog::info("creating router {} in {}", config_.name(), config_.namespace_name());
        status.results = create();
        return status;
    }

    if (!needs_update()) {
        spdlog::info("router {} is up to date", config_.name());
        return status;
    }

    status.changed = true;
    if (check_mode) {
        status.msg = "CHECK_MODE: Would have performed an update.";
        return status;
    }
    spdlog::info("replacing router {} in {}", config_.name(), config_.namespace_name());
    status.results = update();
    return status;
}

Status Router::ensure_absent(bool check_mode) {
    Status status;
    status.state = State::Absent;

    if (!any_exists()) {
        spdlog::info("router {} is already absent", config_.name());
        return status;
    }

    status.changed = true;
    if (check_mode) {
        status.msg = "CHECK_MODE: Would have performed a delete.";
        return status;
    }
    spdlog::info("deleting router {} from {}", config_.name(), config_.namespace_name());
    status.results = remove();
    return status;
}

} // namespace routerkit
