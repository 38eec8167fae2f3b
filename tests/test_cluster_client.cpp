/**
 * @file test_cluster_client.cpp
 * @brief Tests for the oc-backed cluster client
 *
 * A recording runner stands in for the oc binary: it keeps every argv and
 * environment it was given and replays queued outputs.
 */

#include <gtest/gtest.h>
#include "routerkit/ClusterClient.hpp"
#include "routerkit/Errors.hpp"
#include "routerkit/Status.hpp"

#include <deque>
#include <sstream>

using namespace routerkit;

namespace {
    struct Call {
        std::vector<std::string> argv;
        std::map<std::string, std::string> env;
    };

    class RecordingRunner : public CommandRunner {
    public:
        RecordingRunner(std::vector<Call>& calls, std::deque<ProcessOutput>& replies)
            : calls_(calls), replies_(replies) {}

        ProcessOutput run(const std::vector<std::string>& argv,
                          const std::map<std::string, std::string>& env) override {
            calls_.push_back({argv, env});
            if (replies_.empty()) {
                return {0, "{}", ""};
            }
            ProcessOutput out = replies_.front();
            replies_.pop_front();
            return out;
        }

    private:
        std::vector<Call>& calls_;
        std::deque<ProcessOutput>& replies_;
    };

    struct Harness {
        std::vector<Call> calls;
        std::deque<ProcessOutput> replies;

        OcClient client(ClientOptions options = {}) {
            return OcClient(std::move(options), std::make_unique<RecordingRunner>(calls, replies));
        }
    };

    using Argv = std::vector<std::string>;
}

// ============================================================================
// render
// ============================================================================

TEST(OcClient, RenderCommandLine) {
    Harness h;
    h.replies.push_back({0, R"({"kind": "List", "items": []})", ""});
    OcClient client = h.client();

    CommandResult result = client.render("router", "default", {"--replicas=2", "--stats-port=1936"});

    ASSERT_EQ(h.calls.size(), 1u);
    EXPECT_EQ(h.calls[0].argv, (Argv{"oc", "adm", "router", "router", "-n", "default",
                                     "--replicas=2", "--stats-port=1936",
                                     "--dry-run=True", "-o", "json"}));
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.results["kind"], "List");
    EXPECT_EQ(result.cmd, "oc adm router router -n default --replicas=2 --stats-port=1936 --dry-run=True -o json");
}

TEST(OcClient, RenderDecodeError) {
    Harness h;
    h.replies.push_back({0, "error: not json", ""});
    OcClient client = h.client();

    CommandResult result = client.render("router", "default", {});
    EXPECT_TRUE(result.ok());
    ASSERT_TRUE(result.decode_error.has_value());
    EXPECT_EQ(result.stdout_text, "error: not json");
}

TEST(OcClient, RenderFailureKeepsStderr) {
    Harness h;
    h.replies.push_back({1, "", "error: unknown flag: --bogus\n"});
    OcClient client = h.client();

    CommandResult result = client.render("router", "default", {"--bogus=1"});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.returncode, 1);
    EXPECT_TRUE(result.results.is_object());
    EXPECT_TRUE(result.results.empty());
    EXPECT_EQ(result.stderr_text, "error: unknown flag: --bogus\n");
}

TEST(OcClient, CustomBinary) {
    Harness h;
    ClientOptions options;
    options.oc_binary = "/usr/local/bin/oc";
    OcClient client = h.client(options);

    client.render("r", "infra", {});
    EXPECT_EQ(h.calls[0].argv[0], "/usr/local/bin/oc");
}

// ============================================================================
// get
// ============================================================================

TEST(OcClient, GetSingleObjectBecomesSequence) {
    Harness h;
    h.replies.push_back({0, R"({"kind": "Service", "metadata": {"name": "router"}})", ""});
    OcClient client = h.client();

    CommandResult result = client.get("svc", "router");

    EXPECT_EQ(h.calls[0].argv, (Argv{"oc", "-n", "default", "get", "svc", "router", "-o", "json"}));
    ASSERT_TRUE(result.results.is_array());
    ASSERT_EQ(result.results.size(), 1u);
    EXPECT_EQ(result.results[0]["kind"], "Service");
}

TEST(OcClient, GetListUnwrapsItems) {
    Harness h;
    h.replies.push_back({0, R"({"kind": "List", "items": [{"kind": "Secret"}, {"kind": "Secret"}]})", ""});
    OcClient client = h.client();

    CommandResult result = client.get("secret", "", "router=router");

    EXPECT_EQ(h.calls[0].argv, (Argv{"oc", "-n", "default", "get", "secret",
                                     "--selector=router=router", "-o", "json"}));
    ASSERT_TRUE(result.results.is_array());
    EXPECT_EQ(result.results.size(), 2u);
}

TEST(OcClient, GetNotFoundIsEmptySequence) {
    Harness h;
    h.replies.push_back({1, "", "Error from server (NotFound): deploymentconfigs \"router\" not found\n"});
    OcClient client = h.client();

    CommandResult result = client.get("dc", "router");
    EXPECT_FALSE(result.ok());
    ASSERT_TRUE(result.results.is_array());
    EXPECT_TRUE(result.results.empty());
}

TEST(OcClient, NamespaceNoneIsUnscoped) {
    Harness h;
    ClientOptions options;
    options.namespace_name = "None";
    OcClient client = h.client(options);

    client.get("clusterrolebinding", "router-router-role");
    EXPECT_EQ(h.calls[0].argv, (Argv{"oc", "get", "clusterrolebinding", "router-router-role", "-o", "json"}));
}

TEST(OcClient, AllNamespaces) {
    Harness h;
    ClientOptions options;
    options.all_namespaces = true;
    OcClient client = h.client(options);

    client.get("dc", "router");
    EXPECT_EQ(h.calls[0].argv, (Argv{"oc", "--all-namespaces", "get", "dc", "router", "-o", "json"}));
}

// ============================================================================
// create / remove
// ============================================================================

TEST(OcClient, CreateReturnsText) {
    Harness h;
    h.replies.push_back({0, "deploymentconfig \"router\" created\n", ""});
    ClientOptions options;
    options.namespace_name = "infra";
    OcClient client = h.client(options);

    CommandResult result = client.create("/tmp/routerkit-dc.yml");

    EXPECT_EQ(h.calls[0].argv, (Argv{"oc", "-n", "infra", "create", "-f", "/tmp/routerkit-dc.yml"}));
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.results, "deploymentconfig \"router\" created\n");
    EXPECT_FALSE(result.decode_error.has_value());
}

TEST(OcClient, RemoveCommandLine) {
    Harness h;
    OcClient client = h.client();

    client.remove("sa", "router");
    client.remove("pod", "", "router=router");

    EXPECT_EQ(h.calls[0].argv, (Argv{"oc", "-n", "default", "delete", "sa", "router"}));
    EXPECT_EQ(h.calls[1].argv, (Argv{"oc", "-n", "default", "delete", "pod", "", "--selector=router=router"}));
}

// ============================================================================
// kubeconfig
// ============================================================================

TEST(OcClient, NoKubeconfigNoEnv) {
    Harness h;
    OcClient client = h.client();

    client.get("dc", "router");
    EXPECT_TRUE(client.kubeconfig_path().empty());
    EXPECT_EQ(h.calls[0].env.count("KUBECONFIG"), 0u);
}

TEST(OcClient, KubeconfigIsCopied) {
    TempFile source("routerkit-test", ".kubeconfig");
    source.write("apiVersion: v1\nkind: Config\n");

    Harness h;
    ClientOptions options;
    options.kubeconfig = source.path();
    OcClient client = h.client(options);

    const std::string copy = client.kubeconfig_path();
    EXPECT_FALSE(copy.empty());
    EXPECT_NE(copy, source.path());

    client.get("dc", "router");
    client.create("/tmp/routerkit-dc.yml");
    ASSERT_EQ(h.calls.size(), 2u);
    EXPECT_EQ(h.calls[0].env.at("KUBECONFIG"), copy);
    EXPECT_EQ(h.calls[1].env.at("KUBECONFIG"), copy);
}

TEST(OcClient, MissingKubeconfig) {
    Harness h;
    ClientOptions options;
    options.kubeconfig = "/nonexistent/admin.kubeconfig";
    EXPECT_THROW(h.client(options), FileNotFoundError);
    EXPECT_TRUE(h.calls.empty());
}

TEST(OcClient, MissingKubeconfigReportsFailedStatus) {
    Harness h;
    ClientOptions options;
    options.kubeconfig = "/nonexistent/admin.kubeconfig";

    std::ostringstream out;
    int code = 0;
    try {
        h.client(options);
        FAIL() << "Expected FileNotFoundError";
    } catch (const ConfigError& e) {
        code = report(out, Status::failure(e.what()));
    }

    EXPECT_EQ(code, 1);
    Value j = Value::parse(out.str());
    EXPECT_EQ(j["failed"], true);
    EXPECT_NE(j["msg"].get<std::string>().find("/nonexistent/admin.kubeconfig"), std::string::npos);
}
