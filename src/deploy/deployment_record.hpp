#pragma once

#include <optional>
#include <string>
#include <sys/types.h>
#include "core/config/deploy_config.hpp"

namespace agentrt::deploy {

// Lifecycle of one deployment manager:
// not_running -> starting -> running -> stopping -> not_running
enum class ServiceState {
    NotRunning,
    Starting,
    Running,
    Stopping
};

inline std::string to_string(const ServiceState state) {
    switch (state) {
        case ServiceState::NotRunning:
            return "not_running";
        case ServiceState::Starting:
            return "starting";
        case ServiceState::Running:
            return "running";
        case ServiceState::Stopping:
            return "stopping";
        default:
            return "unknown";
    }
}

struct DeploymentRecord {
    std::string deploy_id;
    core::config::DeploymentMode mode = core::config::DeploymentMode::DaemonThread;
    std::string host;
    int port = 0;
    std::optional<pid_t> pid;  // Only for detached_process
    std::string url;
};

inline std::string make_service_url(const std::string& host, const int port) {
    return "http://" + host + ":" + std::to_string(port);
}

// "<mode>_<host>_<port>", or "detached_process_<pid>" once a child exists.
inline std::string make_deploy_id(const core::config::DeploymentMode mode,
                                  const std::string& host, const int port,
                                  const std::optional<pid_t> pid = std::nullopt) {
    if (mode == core::config::DeploymentMode::DetachedProcess && pid.has_value()) {
        return core::config::to_string(mode) + "_" + std::to_string(pid.value());
    }
    return core::config::to_string(mode) + "_" + host + "_" + std::to_string(port);
}

}  // namespace agentrt::deploy
