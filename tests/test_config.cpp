/**
 * @file test_config.cpp
 * @brief Tests for router configuration loading and option rendering
 */

#include <gtest/gtest.h>
#include "routerkit/Errors.hpp"
#include "routerkit/RouterConfig.hpp"
#include "routerkit/TempFile.hpp"

#include <algorithm>
#include <cstdlib>

using namespace routerkit;

namespace {
    using Options = std::vector<std::string>;

    TempFile file_with(const std::string& content, const std::string& extension) {
        TempFile file("routerkit-config", extension);
        file.write(content);
        return file;
    }

    // Load without picking up anything from the process environment
    LoadOptions hermetic() {
        LoadOptions opts;
        opts.prefix = std::nullopt;
        opts.overrides["cert_file"] = "/etc/origin/master/router.crt";
        opts.overrides["key_file"] = "/etc/origin/master/router.key";
        return opts;
    }
}

// ============================================================================
// Defaults
// ============================================================================

TEST(RouterConfig, Defaults) {
    RouterConfig cfg;
    EXPECT_EQ(cfg.name(), "router");
    EXPECT_EQ(cfg.namespace_name(), "default");
    EXPECT_EQ(cfg.service_account(), "router");
    EXPECT_EQ(cfg.kubeconfig(), "/etc/origin/master/admin.kubeconfig");
    EXPECT_EQ(cfg.oc_binary(), "oc");
    EXPECT_EQ(cfg.state(), State::Present);
    EXPECT_FALSE(cfg.debug());
    EXPECT_EQ(cfg.settle_interval(), std::chrono::seconds(15));
    EXPECT_FALSE(cfg.has_stats_password());
    EXPECT_TRUE(cfg.edits().empty());
    EXPECT_FALSE(cfg.contains("selector"));
    EXPECT_TRUE(cfg.contains("stats_port"));
}

TEST(RouterConfig, UnknownKey) {
    RouterConfig cfg;
    EXPECT_THROW(cfg.at("no_such_option"), ConfigError);
    EXPECT_EQ(cfg.get<int>("no_such_option", 7), 7);
    EXPECT_EQ(cfg.get<int>("name", 7), 7);
}

TEST(RouterConfig, DataOverlaysDefaults) {
    RouterConfig cfg(Value{{"name", "infra-router"}, {"replicas", 3}});
    EXPECT_EQ(cfg.name(), "infra-router");
    EXPECT_EQ(cfg.at("replicas"), 3);
    EXPECT_EQ(cfg.at("stats_port"), 1936);
}

TEST(RouterConfig, NullKeepsDefault) {
    RouterConfig cfg(Value{{"replicas", nullptr}, {"ports", nullptr}, {"selector", nullptr}});
    EXPECT_EQ(cfg.at("replicas"), 1);
    EXPECT_EQ(cfg.at("ports"), Value::array({"80:80", "443:443"}));
    EXPECT_FALSE(cfg.contains("selector"));
}

TEST(RouterConfig, SequencesReplaceDefaults) {
    RouterConfig cfg(Value{{"ports", Value::array({"8080:8080"})}});
    EXPECT_EQ(cfg.at("ports"), Value::array({"8080:8080"}));
}

TEST(RouterConfig, NonMappingDataKeepsDefaults) {
    RouterConfig cfg(Value::array({"router"}));
    EXPECT_EQ(cfg.name(), "router");
    EXPECT_EQ(cfg.at("stats_port"), 1936);
}

// ============================================================================
// Option list
// ============================================================================

TEST(ToOptionList, DefaultOptions) {
    RouterConfig cfg;
    EXPECT_EQ(cfg.to_option_list(), (Options{
        "--latest-images=false",
        "--ports=80:80,443:443",
        "--replicas=1",
        "--service-account=router",
        "--host-network=true",
        "--external-host-insecure=false",
        "--expose-metrics=false",
        "--stats-port=1936"
    }));
}

TEST(ToOptionList, FormatsEveryShape) {
    RouterConfig cfg(Value{
        {"default_cert", "/tmp/router.pem"},
        {"images", "openshift3/ose-${component}:${version}"},
        {"labels", {{"router", "infra"}}},
        {"selector", "region=infra"},
        {"stats_password", "s3cret"},
        {"replicas", 0}
    });

    Options options = cfg.to_option_list();
    ASSERT_FALSE(options.empty());
    EXPECT_EQ(options.front(), "--default-cert=/tmp/router.pem");

    auto has = [&](const std::string& flag) {
        return std::find(options.begin(), options.end(), flag) != options.end();
    };
    EXPECT_TRUE(has("--images=openshift3/ose-${component}:${version}"));
    EXPECT_TRUE(has("--labels=router=infra"));
    EXPECT_TRUE(has("--selector=region=infra"));
    EXPECT_TRUE(has("--stats-password=s3cret"));
    EXPECT_TRUE(has("--replicas=0"));
    EXPECT_TRUE(cfg.has_stats_password());
}

TEST(ToOptionList, SkipsEmptyValues) {
    RouterConfig cfg(Value{
        {"selector", ""},
        {"ports", Value::array()},
        {"labels", Value::object()},
        {"stats_password", ""}
    });

    Options options = cfg.to_option_list();
    for (const auto& option : options) {
        EXPECT_EQ(option.find("--selector"), std::string::npos);
        EXPECT_EQ(option.find("--ports"), std::string::npos);
        EXPECT_EQ(option.find("--labels"), std::string::npos);
        EXPECT_EQ(option.find("--stats-password"), std::string::npos);
    }
    EXPECT_FALSE(cfg.has_stats_password());
}

TEST(ToOptionList, ExcludesLocalOptions) {
    RouterConfig cfg(Value{
        {"cert_file", "/etc/origin/master/router.crt"},
        {"key_file", "/etc/origin/master/router.key"},
        {"cacert_file", "/etc/origin/master/ca.crt"}
    });

    for (const auto& option : cfg.to_option_list()) {
        EXPECT_EQ(option.find("--cert-file"), std::string::npos);
        EXPECT_EQ(option.find("--key-file"), std::string::npos);
        EXPECT_EQ(option.find("--cacert-file"), std::string::npos);
        EXPECT_EQ(option.find("--router-type"), std::string::npos);
        EXPECT_EQ(option.find("--edits"), std::string::npos);
    }
}

// ============================================================================
// Loading
// ============================================================================

TEST(RouterConfigLoad, MandatoryCertificateWhenPresent) {
    LoadOptions opts;
    opts.prefix = std::nullopt;

    try {
        RouterConfig::load(opts);
        FAIL() << "Expected MissingMandatoryConfig";
    } catch (const MissingMandatoryConfig& e) {
        EXPECT_EQ(e.missing_keys(), (std::vector<std::string>{"cert_file", "key_file"}));
    }
}

TEST(RouterConfigLoad, AbsentNeedsNoCertificate) {
    LoadOptions opts;
    opts.prefix = std::nullopt;
    opts.overrides["state"] = "absent";

    RouterConfig cfg = RouterConfig::load(opts);
    EXPECT_EQ(cfg.state(), State::Absent);
}

TEST(RouterConfigLoad, ExtraMandatoryKeys) {
    LoadOptions opts = hermetic();
    opts.mandatory = {"selector"};
    EXPECT_THROW(RouterConfig::load(opts), MissingMandatoryConfig);

    opts.overrides["selector"] = "region=infra";
    EXPECT_NO_THROW(RouterConfig::load(opts));
}

TEST(RouterConfigLoad, YamlFile) {
    auto file = file_with(
        "name: infra-router\n"
        "namespace: infra\n"
        "replicas: 2\n"
        "selector: region=infra\n"
        "edits:\n"
        "  - action: put\n"
        "    key: spec.strategy.rollingParams.intervalSeconds\n"
        "    value: 1\n", ".yml");

    LoadOptions opts = hermetic();
    opts.file_path = file.path();
    RouterConfig cfg = RouterConfig::load(opts);

    EXPECT_EQ(cfg.name(), "infra-router");
    EXPECT_EQ(cfg.namespace_name(), "infra");
    EXPECT_EQ(cfg.at("replicas"), 2);
    EXPECT_EQ(cfg.at("stats_port"), 1936);
    ASSERT_EQ(cfg.edits().size(), 1u);
    EXPECT_EQ(cfg.edits()[0].action, Edit::Action::Put);
}

TEST(RouterConfigLoad, TomlFile) {
    auto file = file_with(
        "name = \"edge\"\n"
        "stats_port = 1937\n"
        "ports = [\"80:80\"]\n", ".toml");

    LoadOptions opts = hermetic();
    opts.file_path = file.path();
    RouterConfig cfg = RouterConfig::load(opts);

    EXPECT_EQ(cfg.name(), "edge");
    EXPECT_EQ(cfg.at("stats_port"), 1937);
    EXPECT_EQ(cfg.at("ports"), Value::array({"80:80"}));
}

TEST(RouterConfigLoad, FileMustBeMapping) {
    auto file = file_with("- router\n- infra\n", ".yaml");

    LoadOptions opts = hermetic();
    opts.file_path = file.path();
    EXPECT_THROW(RouterConfig::load(opts), ConfigParseError);
}

TEST(RouterConfigLoad, MissingFile) {
    LoadOptions opts = hermetic();
    opts.file_path = "/nonexistent/routerctl.json";
    EXPECT_THROW(RouterConfig::load(opts), FileNotFoundError);
}

TEST(RouterConfigLoad, EnvironmentPrefix) {
    ::setenv("RKTEST_STATS_PORT", "1937", 1);
    ::setenv("RKTEST_HOST_NETWORK", "false", 1);
    ::setenv("RKTEST_SELECTOR", "region=infra", 1);

    LoadOptions opts = hermetic();
    opts.prefix = "RKTEST_";
    RouterConfig cfg = RouterConfig::load(opts);

    EXPECT_EQ(cfg.at("stats_port"), 1937);
    EXPECT_EQ(cfg.at("host_network"), false);
    EXPECT_EQ(cfg.at("selector"), "region=infra");

    ::unsetenv("RKTEST_STATS_PORT");
    ::unsetenv("RKTEST_HOST_NETWORK");
    ::unsetenv("RKTEST_SELECTOR");
}

TEST(RouterConfigLoad, Precedence) {
    auto file = file_with(R"({"name": "from-file", "replicas": 2, "stats_port": 1940})", ".json");
    ::setenv("RKPREC_REPLICAS", "3", 1);
    ::setenv("RKPREC_STATS_PORT", "1941", 1);

    LoadOptions opts = hermetic();
    opts.file_path = file.path();
    opts.prefix = "RKPREC";
    opts.overrides["stats_port"] = 1942;
    RouterConfig cfg = RouterConfig::load(opts);

    EXPECT_EQ(cfg.name(), "from-file");
    EXPECT_EQ(cfg.at("replicas"), 3);
    EXPECT_EQ(cfg.at("stats_port"), 1942);

    ::unsetenv("RKPREC_REPLICAS");
    ::unsetenv("RKPREC_STATS_PORT");
}

TEST(RouterConfigLoad, LayersReplaceWholeValues) {
    auto file = file_with(
        "labels:\n"
        "  region: infra\n"
        "  zone: east\n"
        "selector: region=infra\n"
        "edits:\n"
        "  - {action: put, key: spec.replicas, value: 2}\n"
        "  - {action: put, key: spec.paused, value: true}\n", ".yaml");

    LoadOptions opts = hermetic();
    opts.file_path = file.path();
    opts.overrides["labels"] = Value{{"region", "edge"}};
    opts.overrides["edits"] = Value::array({
        Value{{"action", "append"}, {"key", "metadata.finalizers"}, {"value", "orphan"}}
    });
    opts.overrides["selector"] = nullptr;
    RouterConfig cfg = RouterConfig::load(opts);

    EXPECT_EQ(cfg.at("labels"), (Value{{"region", "edge"}}));
    ASSERT_EQ(cfg.edits().size(), 1u);
    EXPECT_EQ(cfg.edits()[0].action, Edit::Action::Append);
    EXPECT_FALSE(cfg.contains("selector"));
}

// ============================================================================
// Validation
// ============================================================================

TEST(RouterConfigLoad, RouterTypeExcludesImages) {
    LoadOptions opts = hermetic();
    opts.overrides["images"] = "registry/router:v3";
    EXPECT_NO_THROW(RouterConfig::load(opts));

    opts.overrides["router_type"] = "haproxy-router";
    EXPECT_THROW(RouterConfig::load(opts), ConfigError);
}

TEST(RouterConfigLoad, InvalidState) {
    LoadOptions opts = hermetic();
    opts.overrides["state"] = "list";
    EXPECT_THROW(RouterConfig::load(opts), ConfigError);
}

TEST(RouterConfigLoad, InvalidSettleSeconds) {
    LoadOptions opts = hermetic();
    opts.overrides["settle_seconds"] = -1;
    EXPECT_THROW(RouterConfig::load(opts), ConfigError);

    opts.overrides["settle_seconds"] = "soon";
    EXPECT_THROW(RouterConfig::load(opts), ConfigError);

    opts.overrides["settle_seconds"] = 0;
    EXPECT_EQ(RouterConfig::load(opts).settle_interval(), std::chrono::seconds(0));
}

TEST(RouterConfigLoad, MalformedEdit) {
    LoadOptions opts = hermetic();
    opts.overrides["edits"] = Value::array({Value{{"action", "replace"}, {"key", "spec.replicas"}}});
    EXPECT_THROW(RouterConfig::load(opts), ConfigError);
}

// ============================================================================
// Edits
// ============================================================================

TEST(Edit, FromJson) {
    Edit edit = Edit::from_json(Value{
        {"action", "Update"},
        {"key", "spec.template.spec.containers[0].env"},
        {"value", {{"name", "ROUTER_TCP_BALANCE_SCHEME"}, {"value", "roundrobin"}}},
        {"index", 2},
        {"value_type", "str"}
    });

    EXPECT_EQ(edit.action, Edit::Action::Update);
    EXPECT_EQ(edit.key, "spec.template.spec.containers[0].env");
    EXPECT_EQ(edit.value["name"], "ROUTER_TCP_BALANCE_SCHEME");
    ASSERT_TRUE(edit.index.has_value());
    EXPECT_EQ(*edit.index, 2);
    EXPECT_FALSE(edit.curr_value.has_value());
    EXPECT_EQ(edit.value_type, "str");
}

TEST(Edit, CurrentValue) {
    Edit edit = Edit::from_json(Value{
        {"action", "update"},
        {"key", "spec.template.spec.nodeSelector.region"},
        {"value", "infra"},
        {"curr_value", "primary"}
    });
    ASSERT_TRUE(edit.curr_value.has_value());
    EXPECT_EQ(edit.curr_value.value(), "primary");
    EXPECT_FALSE(edit.index.has_value());
}

TEST(Edit, Malformed) {
    EXPECT_THROW(Edit::from_json(Value("put")), ConfigError);
    EXPECT_THROW(Edit::from_json(Value{{"key", "spec.replicas"}}), ConfigError);
    EXPECT_THROW(Edit::from_json(Value{{"action", "put"}}), ConfigError);
    EXPECT_THROW(Edit::from_json(Value{{"action", "put"}, {"key", "a"}, {"index", "1"}}), ConfigError);
}

TEST(Edit, ToJson) {
    Edit edit;
    edit.action = Edit::Action::Append;
    edit.key = "spec.template.spec.volumes";
    edit.value = Value{{"name", "certs"}};

    EXPECT_EQ(edit.to_json(), (Value{
        {"action", "append"},
        {"key", "spec.template.spec.volumes"},
        {"value", {{"name", "certs"}}}
    }));
}
