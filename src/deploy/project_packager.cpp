#include "deploy/project_packager.hpp"

#include <system_error>
#include <utility>

namespace agentrt::deploy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

ServeCommandPackager::ServeCommandPackager(std::filesystem::path program)
    : program_(std::move(program)) {}

core::errors::Result<LaunchPlan> ServeCommandPackager::package(
    const core::config::DeployConfig& config) {
    std::filesystem::path program = program_;
    std::error_code ec;
    if (program.empty()) {
        program = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec) {
            return AgentError{ErrorCategory::Internal,
                              "Cannot resolve the running executable: " + ec.message(),
                              "launch_failed", "Configure a packager with an explicit program."};
        }
    }

    LaunchPlan plan;
    plan.argv = {program.string(),
                 "serve",
                 "--mode",
                 core::config::to_string(core::config::DeploymentMode::DetachedProcess),
                 "--foreground",
                 "--host",
                 config.host,
                 "--port",
                 std::to_string(config.port),
                 "--endpoint",
                 config.endpoint_path,
                 "--response-type",
                 core::config::to_string(config.response_type)};
    plan.working_directory = std::filesystem::current_path(ec);
    if (ec) {
        plan.working_directory.clear();
    }
    return plan;
}

}  // namespace agentrt::deploy
