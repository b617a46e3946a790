#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace agentrt::core::config {

    enum class DeploymentMode {
        DaemonThread,     // Server on a worker thread of this process
        DetachedProcess,  // Server in a child process with its own session
        Standalone        // Server on the calling thread, blocking
    };

    enum class ResponseType {
        Sse,
        Json
    };

    std::string to_string(DeploymentMode mode);
    std::string to_string(ResponseType type);
    std::optional<DeploymentMode> parse_deployment_mode(const std::string& text);
    std::optional<ResponseType> parse_response_type(const std::string& text);

    // Everything a deploy() call needs to know about the target service
    struct DeployConfig {
        std::string host = "127.0.0.1";
        int port = 8000;
        DeploymentMode mode = DeploymentMode::DaemonThread;
        std::string endpoint_path = "/process";
        ResponseType response_type = ResponseType::Sse;
        bool stream = true;

        // Opaque to the runtime, handed to the ProjectPackager
        std::vector<std::string> requirements;
        std::vector<std::string> extra_packages;

        std::map<std::string, std::string> environment;  // Exported in the child process

        std::chrono::milliseconds deploy_timeout{30000};
        std::chrono::milliseconds shutdown_timeout{10000};
        std::chrono::milliseconds probe_interval{100};
        std::chrono::milliseconds probe_timeout{100};
        bool health_check = true;

        std::filesystem::path pid_dir = std::filesystem::temp_directory_path() / "agentrt";
        bool handle_signals = false;
    };

    core::errors::Result<bool> validate(const DeployConfig& config);

    // Keys absent from `payload` keep the value they have in `base`.
    core::errors::Result<DeployConfig> deploy_config_from_json(const nlohmann::json& payload,
                                                               const DeployConfig& base = {});
    core::errors::Result<DeployConfig> load_deploy_config(const std::filesystem::path& path,
                                                          const DeployConfig& base = {});

    nlohmann::json deploy_config_to_json(const DeployConfig& config);

} // namespace agentrt::core::config
