#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "core/config/deploy_config.hpp"
#include "core/errors/agent_errors.hpp"

namespace agentrt::deploy {

// What the detached child executes.
struct LaunchPlan {
    std::vector<std::string> argv;
    std::filesystem::path working_directory;
};

// Turns a deployment configuration (requirements, extra packages, ...) into a
// runnable command. The child gets AGENTRT_HOST, AGENTRT_PORT and
// AGENTRT_ENDPOINT_PATH in its environment and must serve on them.
class ProjectPackager {
public:
    virtual ~ProjectPackager() = default;

    virtual core::errors::Result<LaunchPlan> package(const core::config::DeployConfig& config) = 0;
};

// Runs a fixed command line for every configuration.
class CommandPackager : public ProjectPackager {
public:
    explicit CommandPackager(LaunchPlan plan) : plan_(std::move(plan)) {}

    core::errors::Result<LaunchPlan> package(const core::config::DeployConfig&) override {
        if (plan_.argv.empty()) {
            return core::errors::AgentError{core::errors::ErrorCategory::Validation,
                                            "Launch plan has no command.", "launch_failed"};
        }
        return plan_;
    }

private:
    LaunchPlan plan_;
};

// Re-runs a program with the `serve` command line (agentrt_serve, or an
// application that parses the same flags) as the detached child:
// `<program> serve --mode detached_process --foreground --host ... --port ...`.
class ServeCommandPackager : public ProjectPackager {
public:
    // An empty program means the running executable.
    explicit ServeCommandPackager(std::filesystem::path program = {});

    core::errors::Result<LaunchPlan> package(const core::config::DeployConfig& config) override;

private:
    std::filesystem::path program_;
};

}  // namespace agentrt::deploy
