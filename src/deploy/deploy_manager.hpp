#pragma once

#include <optional>
#include <string>
#include "core/config/deploy_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "deploy/deployment_record.hpp"

namespace agentrt::runtime {
class Runner;
}

namespace agentrt::deploy {

// How a Runner becomes a reachable service and how that service is stopped.
// A manager serves at most one deployment at a time.
class DeployManager {
public:
    virtual ~DeployManager() = default;

    // Fails with already_running while a previous deployment is active.
    virtual core::errors::Result<DeploymentRecord> deploy(
        runtime::Runner& runner, const core::config::DeployConfig& config) = 0;

    // Idempotent; returns ServiceState::NotRunning when the call completes.
    virtual core::errors::Result<ServiceState> stop() = 0;

    virtual bool is_running() const = 0;
    virtual std::optional<std::string> service_url() const = 0;
    virtual ServiceState state() const = 0;

    // Blocks until nothing started by deploy() still uses the runner. Called
    // by the Runner before it is destroyed.
    virtual void wait_released() {}
};

}  // namespace agentrt::deploy
