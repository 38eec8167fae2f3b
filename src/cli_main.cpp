#include <cxxopts.hpp>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "routerkit/ClusterClient.hpp"
#include "routerkit/Errors.hpp"
#include "routerkit/Parse.hpp"
#include "routerkit/Router.hpp"
#include "routerkit/RouterConfig.hpp"
#include "routerkit/Status.hpp"

using nlohmann::json;
using namespace routerkit;

namespace {
    // Logs go to stderr; stdout carries only the status JSON
    void init_logging(bool debug) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("routerctl", sink);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::info);
    }

    // "key=value" with the value decoded by parse_value
    std::pair<std::string, json> parse_assignment(const std::string& text) {
        const auto pos = text.find('=');
        if (pos == std::string::npos || pos == 0) {
            throw ConfigError("--set expects key=value, got '" + text + "'");
        }
        return {text.substr(0, pos), parse_value(text.substr(pos + 1))};
    }

    json parse_edit(const std::string& text) {
        try {
            json edit = json::parse(text);
            // validates the shape before any cluster call
            (void)Edit::from_json(edit);
            return edit;
        } catch (const json::parse_error& e) {
            throw ConfigError("--edit expects a JSON object: " + std::string(e.what()));
        }
    }
}

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("routerctl", "Reconcile an OpenShift router with its declared configuration");

        options.add_options()
            ("c,config", "Path to JSON/TOML/YAML config", cxxopts::value<std::string>())
            ("s,state", "Desired state: present | absent", cxxopts::value<std::string>())
            ("n,name", "Router name", cxxopts::value<std::string>())
            ("namespace", "Target namespace", cxxopts::value<std::string>())
            ("kubeconfig", "Path to the kubeconfig", cxxopts::value<std::string>())
            ("set", "Option override key=value (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("edit", "Deployment edit as a JSON object (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("prefix", "Env-var prefix for overrides", cxxopts::value<std::string>()->default_value("ROUTERCTL"))
            ("check", "Report what would change without changing anything")
            ("d,debug", "Debug logging")
            ("settle-seconds", "Wait between delete and create on update", cxxopts::value<long>())
            ("oc", "Path to the oc binary", cxxopts::value<std::string>())
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        // Prepare LoadOptions
        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();

        if (result.count("set")) {
            for (const auto& text : result["set"].as<std::vector<std::string>>()) {
                auto [key, value] = parse_assignment(text);
                load.overrides[key] = value;
            }
        }
        if (result.count("state")) load.overrides["state"] = result["state"].as<std::string>();
        if (result.count("name")) load.overrides["name"] = result["name"].as<std::string>();
        if (result.count("namespace")) load.overrides["namespace"] = result["namespace"].as<std::string>();
        if (result.count("kubeconfig")) load.overrides["kubeconfig"] = result["kubeconfig"].as<std::string>();
        if (result.count("oc")) load.overrides["oc"] = result["oc"].as<std::string>();
        if (result.count("settle-seconds")) load.overrides["settle_seconds"] = result["settle-seconds"].as<long>();
        if (result.count("debug")) load.overrides["debug"] = true;

        if (result.count("edit")) {
            json edits = json::array();
            for (const auto& text : result["edit"].as<std::vector<std::string>>()) {
                edits.push_back(parse_edit(text));
            }
            load.overrides["edits"] = edits;
        }

        RouterConfig cfg = RouterConfig::load(load);
        init_logging(cfg.debug());
        spdlog::debug("configuration: {}", cfg.to_json_string(-1));

        ClientOptions client_options;
        client_options.namespace_name = cfg.namespace_name();
        client_options.kubeconfig = cfg.kubeconfig();
        client_options.oc_binary = cfg.oc_binary();
        client_options.verbose = cfg.debug();

        OcClient client(client_options, std::make_unique<ProcessRunner>());
        Router router(cfg, client);

        Status status = router.run(result.count("check") > 0);
        return report(std::cout, status);

    } catch (const MissingMandatoryConfig& mmc) {
        std::cerr << "Error: " << mmc.what() << "\n";
        return report(std::cout, Status::failure(mmc.what()));
    } catch (const ConfigError& ce) {
        std::cerr << "Error: " << ce.what() << "\n";
        return report(std::cout, Status::failure(ce.what()));
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return report(std::cout, Status::failure(ex.what()));
    }
}
