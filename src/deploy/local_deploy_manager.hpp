#pragma once

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>
#include "core/logging/logger.hpp"
#include "deploy/deploy_manager.hpp"
#include "deploy/project_packager.hpp"
#include "runtime/process_manager.hpp"

namespace agentrt::service {
class ServiceApp;
}

namespace agentrt::deploy {

struct LocalDeployOptions {
    std::shared_ptr<core::logging::Logger> logger;
    // detached_process only; defaults to a ServeCommandPackager that re-runs
    // the current executable.
    std::shared_ptr<ProjectPackager> packager;
};

// Runs the service on this machine as a worker thread, a detached child
// process, or on the calling thread.
class LocalDeployManager : public DeployManager {
public:
    explicit LocalDeployManager(LocalDeployOptions options = {});
    ~LocalDeployManager() override;

    LocalDeployManager(const LocalDeployManager&) = delete;
    LocalDeployManager& operator=(const LocalDeployManager&) = delete;

    core::errors::Result<DeploymentRecord> deploy(
        runtime::Runner& runner, const core::config::DeployConfig& config) override;
    core::errors::Result<ServiceState> stop() override;

    bool is_running() const override;
    std::optional<std::string> service_url() const override;
    ServiceState state() const override;

    // Joins server threads that outlived their shutdown_timeout.
    void wait_released() override;

    std::optional<DeploymentRecord> record() const;

private:
    core::errors::Result<DeploymentRecord> deploy_daemon(runtime::Runner& runner,
                                                         const core::config::DeployConfig& config);
    core::errors::Result<DeploymentRecord> deploy_detached(const core::config::DeployConfig& config);
    core::errors::Result<DeploymentRecord> deploy_standalone(
        runtime::Runner& runner, const core::config::DeployConfig& config);

    void stop_daemon(const core::config::DeployConfig& config);
    void stop_detached(const core::config::DeployConfig& config);
    void stop_standalone(const core::config::DeployConfig& config);

    // Signals the worker and waits for it up to shutdown_timeout. A worker
    // still running after that is parked in lingering_ until wait_released().
    void release_worker(std::shared_ptr<service::ServiceApp> app, std::thread worker,
                        std::future<void> worker_done, std::chrono::milliseconds timeout);

    // Caller must hold mutex_.
    void transition_locked(ServiceState next);
    void go_idle();

    std::shared_ptr<core::logging::Logger> logger_;
    std::shared_ptr<ProjectPackager> packager_;
    runtime::ProcessManager processes_;

    mutable std::mutex mutex_;
    std::condition_variable state_changed_;
    ServiceState state_ = ServiceState::NotRunning;
    core::config::DeployConfig config_;
    std::optional<DeploymentRecord> record_;

    // daemon_thread and standalone
    std::shared_ptr<service::ServiceApp> app_;
    std::thread worker_;
    std::future<void> worker_done_;
    std::vector<std::thread> lingering_;

    // detached_process
    std::optional<pid_t> child_pid_;
};

}  // namespace agentrt::deploy
