#include <chrono>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/deploy_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "test_support.hpp"

namespace {

using agentrt::core::config::DeployConfig;
using agentrt::core::config::DeploymentMode;
using agentrt::core::config::ResponseType;
using agentrt::core::config::deploy_config_from_json;
using agentrt::core::config::load_deploy_config;
using agentrt::core::config::validate;
using agentrt::core::errors::ErrorCategory;
using agentrt::core::errors::get_error;
using agentrt::core::errors::get_value;
using agentrt::core::errors::is_error;
using agentrt::testing::TempDir;
using nlohmann::json;

TEST(DeployConfigTest, DefaultsAreValid) {
    const DeployConfig config;
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.mode, DeploymentMode::DaemonThread);
    EXPECT_EQ(config.endpoint_path, "/process");
    EXPECT_EQ(config.response_type, ResponseType::Sse);
    EXPECT_FALSE(is_error(validate(config)));
}

TEST(DeployConfigTest, ValidateRejectsBadValues) {
    DeployConfig bad_port;
    bad_port.port = 70000;
    ASSERT_TRUE(is_error(validate(bad_port)));
    EXPECT_EQ(get_error(validate(bad_port)).code, "invalid_config");

    DeployConfig bad_endpoint;
    bad_endpoint.endpoint_path = "process";
    EXPECT_TRUE(is_error(validate(bad_endpoint)));

    DeployConfig bad_timeout;
    bad_timeout.deploy_timeout = std::chrono::milliseconds(0);
    EXPECT_TRUE(is_error(validate(bad_timeout)));

    DeployConfig empty_host;
    empty_host.host.clear();
    EXPECT_TRUE(is_error(validate(empty_host)));
}

TEST(DeployConfigTest, ReadsJsonOverBase) {
    DeployConfig base;
    base.port = 9001;
    json payload{{"mode", "detached_process"},
                 {"response_type", "json"},
                 {"deploy_timeout", 2.5},
                 {"environment", {{"API_KEY", "k"}}},
                 {"requirements", {"numpy"}}};

    const auto result = deploy_config_from_json(payload, base);
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    EXPECT_EQ(config.port, 9001);
    EXPECT_EQ(config.mode, DeploymentMode::DetachedProcess);
    EXPECT_EQ(config.response_type, ResponseType::Json);
    EXPECT_EQ(config.deploy_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(config.environment.at("API_KEY"), "k");
    ASSERT_EQ(config.requirements.size(), 1u);
}

TEST(DeployConfigTest, RejectsUnknownMode) {
    const auto result = deploy_config_from_json(json{{"mode", "cloud"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(DeployConfigTest, RejectsWrongTypes) {
    EXPECT_TRUE(is_error(deploy_config_from_json(json{{"port", "8000"}})));
    EXPECT_TRUE(is_error(deploy_config_from_json(json{{"stream", 1}})));
    EXPECT_TRUE(is_error(deploy_config_from_json(json{{"environment", {{"A", 1}}}})));
    EXPECT_TRUE(is_error(deploy_config_from_json(json{{"shutdown_timeout", -1}})));
}

TEST(DeployConfigTest, RejectsPortOutsideRangeWithoutWrapping) {
    const auto huge = deploy_config_from_json(json::parse(R"({"port": 4294975296})"));
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "invalid_config");
    EXPECT_TRUE(is_error(deploy_config_from_json(json{{"port", -5}})));
    EXPECT_TRUE(is_error(deploy_config_from_json(json{{"port", 70000}})));
}

TEST(DeployConfigTest, LoadsFile) {
    TempDir dir("deploy_config");
    const auto path = dir.root() / "deploy.json";
    {
        std::ofstream out(path);
        out << R"({"host": "0.0.0.0", "port": 8123, "endpoint_path": "/agent"})";
    }

    const auto result = load_deploy_config(path);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).host, "0.0.0.0");
    EXPECT_EQ(get_value(result).port, 8123);
    EXPECT_EQ(get_value(result).endpoint_path, "/agent");
}

TEST(DeployConfigTest, LoadReportsMissingAndMalformedFiles) {
    TempDir dir("deploy_config");
    EXPECT_TRUE(is_error(load_deploy_config(dir.root() / "absent.json")));

    const auto path = dir.root() / "broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    const auto result = load_deploy_config(path);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(DeployConfigTest, WritesSecondsBack) {
    DeployConfig config;
    config.shutdown_timeout = std::chrono::milliseconds(1500);
    const json payload = agentrt::core::config::deploy_config_to_json(config);
    EXPECT_EQ(payload["mode"], "daemon_thread");
    EXPECT_DOUBLE_EQ(payload["shutdown_timeout"].get<double>(), 1.5);

    const auto reread = deploy_config_from_json(payload);
    ASSERT_FALSE(is_error(reread));
    EXPECT_EQ(get_value(reread).shutdown_timeout, std::chrono::milliseconds(1500));
}

}  // namespace
