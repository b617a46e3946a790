#include "deploy/local_deploy_manager.hpp"

#include <chrono>
#include <filesystem>
#include <utility>
#include "deploy/pid_file.hpp"
#include "deploy/readiness_probe.hpp"
#include "runtime/runner.hpp"
#include "service/service_app.hpp"
#include "service/service_host.hpp"

namespace agentrt::deploy {

using core::config::DeployConfig;
using core::config::DeploymentMode;
using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

std::string seconds_text(const std::chrono::milliseconds duration) {
    const auto tenths = duration.count() / 100;
    return std::to_string(tenths / 10) + "." + std::to_string(tenths % 10) + "s";
}

ProbeTarget probe_target(const DeployConfig& config) {
    ProbeTarget target;
    target.host = config.host;
    target.port = config.port;
    target.connect_timeout = config.probe_timeout;
    target.health_check = config.health_check;
    return target;
}

AgentError deployment_timeout(const DeployConfig& config, const std::string& detail) {
    return AgentError{ErrorCategory::Deployment,
                      "Service on " + make_service_url(config.host, config.port) +
                          " did not become ready within " + seconds_text(config.deploy_timeout) +
                          ": " + detail,
                      core::errors::codes::kDeploymentTimeout,
                      "Check that the port is free and the init hook completes in time."};
}

}  // namespace

LocalDeployManager::LocalDeployManager(LocalDeployOptions options)
    : logger_(options.logger ? std::move(options.logger)
                             : core::logging::Logger::make_default("deploy")),
      packager_(options.packager ? std::move(options.packager)
                                 : std::make_shared<ServeCommandPackager>()) {}

LocalDeployManager::~LocalDeployManager() {
    if (is_running()) {
        auto stopped = stop();
        if (core::errors::is_error(stopped)) {
            AGENTRT_LOG_WARN(logger_, "LocalDeployManager: stop on destruction failed: " +
                                          core::errors::get_error(stopped).message);
        }
    }
    wait_released();
}

void LocalDeployManager::wait_released() {
    std::vector<std::thread> lingering;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lingering.swap(lingering_);
    }
    for (auto& worker : lingering) {
        if (worker.joinable()) {
            AGENTRT_LOG_INFO(logger_, "LocalDeployManager: waiting for a lingering server thread");
            worker.join();
        }
    }
}

void LocalDeployManager::transition_locked(const ServiceState next) {
    AGENTRT_LOG_INFO(logger_, "LocalDeployManager: transition " + to_string(state_) + " -> " +
                                  to_string(next));
    state_ = next;
    state_changed_.notify_all();
}

void LocalDeployManager::go_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    record_.reset();
    app_.reset();
    child_pid_.reset();
    if (state_ != ServiceState::NotRunning) {
        transition_locked(ServiceState::NotRunning);
    }
}

bool LocalDeployManager::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ServiceState::Running;
}

std::optional<std::string> LocalDeployManager::service_url() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ServiceState::Running || !record_.has_value()) {
        return std::nullopt;
    }
    return record_->url;
}

ServiceState LocalDeployManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<DeploymentRecord> LocalDeployManager::record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

core::errors::Result<DeploymentRecord> LocalDeployManager::deploy(runtime::Runner& runner,
                                                                  const DeployConfig& config) {
    auto valid = core::config::validate(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ServiceState::NotRunning) {
            const std::string where = record_.has_value() ? record_->url : to_string(state_);
            return AgentError{ErrorCategory::Deployment,
                              "A deployment is already active (" + where + ").",
                              core::errors::codes::kAlreadyRunning,
                              "Call stop() before deploying again."};
        }
        config_ = config;
        transition_locked(ServiceState::Starting);
    }

    AGENTRT_LOG_INFO(logger_, "LocalDeployManager: deploying " + core::config::to_string(config.mode) +
                                  " on " + make_service_url(config.host, config.port));
    switch (config.mode) {
        case DeploymentMode::DaemonThread:
            return deploy_daemon(runner, config);
        case DeploymentMode::DetachedProcess:
            return deploy_detached(config);
        case DeploymentMode::Standalone:
            return deploy_standalone(runner, config);
        default:
            go_idle();
            return AgentError{ErrorCategory::Validation,
                              "Unsupported deployment mode: " + core::config::to_string(config.mode),
                              "unsupported_mode"};
    }
}

core::errors::Result<DeploymentRecord> LocalDeployManager::deploy_daemon(runtime::Runner& runner,
                                                                         const DeployConfig& config) {
    service::ServiceOptions options;
    options.config = config;
    options.logger = logger_;
    auto app = std::make_shared<service::ServiceApp>(runner, std::move(options));

    std::promise<void> done_promise;
    std::future<void> done = done_promise.get_future();
    std::thread worker([app, &runner, logger = logger_, done_promise = std::move(done_promise)]() mutable {
        auto bound = app->bind();
        if (core::errors::is_error(bound)) {
            AGENTRT_LOG_ERROR(logger, "LocalDeployManager: " + core::errors::get_error(bound).message);
            done_promise.set_value();
            return;
        }
        service::HostOptions host_options;
        host_options.logger = logger;
        auto served = service::run_service(runner, *app, host_options);
        if (core::errors::is_error(served)) {
            AGENTRT_LOG_ERROR(logger, "LocalDeployManager: " + core::errors::get_error(served).message);
        }
        done_promise.set_value();
    });

    const ProbeTarget target = probe_target(config);
    const auto deadline = std::chrono::steady_clock::now() + config.deploy_timeout;
    bool ready = false;
    bool exited = false;
    while (std::chrono::steady_clock::now() < deadline) {
        if (done.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            exited = true;
            break;
        }
        if (app->is_running() && probe_once(target)) {
            ready = true;
            break;
        }
        std::this_thread::sleep_for(config.probe_interval);
    }

    if (!ready) {
        AGENTRT_LOG_ERROR(logger_, "LocalDeployManager: server thread never became ready");
        release_worker(app, std::move(worker), std::move(done), config.shutdown_timeout);
        go_idle();
        return deployment_timeout(config, exited ? "the server thread exited before accepting"
                                                 : "readiness probe kept failing");
    }

    DeploymentRecord record;
    record.deploy_id = make_deploy_id(config.mode, config.host, config.port);
    record.mode = config.mode;
    record.host = config.host;
    record.port = config.port;
    record.url = make_service_url(config.host, config.port);

    std::lock_guard<std::mutex> lock(mutex_);
    app_ = std::move(app);
    worker_ = std::move(worker);
    worker_done_ = std::move(done);
    record_ = record;
    transition_locked(ServiceState::Running);
    return record;
}

core::errors::Result<DeploymentRecord> LocalDeployManager::deploy_detached(
    const DeployConfig& config) {
    const PidFileStore store(config.pid_dir);

    runtime::LaunchSpec spec;
    spec.environment = config.environment;
    spec.environment["AGENTRT_HOST"] = config.host;
    spec.environment["AGENTRT_PORT"] = std::to_string(config.port);
    spec.environment["AGENTRT_ENDPOINT_PATH"] = config.endpoint_path;

    auto log_path = store.log_path(core::config::to_string(config.mode) + "_{pid}");
    if (core::errors::is_error(log_path)) {
        go_idle();
        return core::errors::get_error(log_path);
    }
    spec.log_path = core::errors::get_value(log_path);

    auto plan = packager_->package(config);
    if (core::errors::is_error(plan)) {
        go_idle();
        return core::errors::get_error(plan);
    }
    spec.argv = core::errors::get_value(plan).argv;
    spec.working_directory = core::errors::get_value(plan).working_directory;

    auto started = processes_.start_detached(spec);
    if (core::errors::is_error(started)) {
        go_idle();
        return core::errors::get_error(started);
    }
    const pid_t pid = core::errors::get_value(started);

    DeploymentRecord record;
    record.deploy_id = make_deploy_id(config.mode, config.host, config.port, pid);
    record.mode = config.mode;
    record.host = config.host;
    record.port = config.port;
    record.pid = pid;
    record.url = make_service_url(config.host, config.port);

    auto written = store.write(record);
    if (core::errors::is_error(written)) {
        auto terminated = processes_.terminate(pid, config.shutdown_timeout);
        if (core::errors::is_error(terminated)) {
            AGENTRT_LOG_WARN(logger_, "LocalDeployManager: " + core::errors::get_error(terminated).message);
        }
        go_idle();
        return core::errors::get_error(written);
    }
    AGENTRT_LOG_INFO(logger_, "LocalDeployManager: started child " + std::to_string(pid) +
                                  ", pid file " + core::errors::get_value(written).string());

    // Kills the child and forgets it; used on every failed start.
    auto abandon = [&]() {
        auto terminated = processes_.terminate(pid, config.shutdown_timeout);
        if (core::errors::is_error(terminated)) {
            AGENTRT_LOG_WARN(logger_, "LocalDeployManager: " + core::errors::get_error(terminated).message);
        }
        auto removed = store.remove(record.deploy_id);
        if (core::errors::is_error(removed)) {
            AGENTRT_LOG_WARN(logger_, "LocalDeployManager: " + core::errors::get_error(removed).message);
        }
        go_idle();
    };

    ProbeTarget target = probe_target(config);
    target.expected_pid = static_cast<long>(pid);
    const auto deadline = std::chrono::steady_clock::now() + config.deploy_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!processes_.is_alive(pid)) {
            abandon();
            return AgentError{ErrorCategory::Deployment,
                              "Process " + std::to_string(pid) + " exited before becoming ready.",
                              core::errors::codes::kProcessNotResponding,
                              "See the child log at " + runtime::expand_pid_token(spec.log_path, pid) + "."};
        }
        if (probe_once(target) && processes_.is_alive(pid)) {
            std::lock_guard<std::mutex> lock(mutex_);
            child_pid_ = pid;
            record_ = record;
            transition_locked(ServiceState::Running);
            return record;
        }
        std::this_thread::sleep_for(config.probe_interval);
    }

    abandon();
    return deployment_timeout(config, "process " + std::to_string(pid) + " is not answering");
}

core::errors::Result<DeploymentRecord> LocalDeployManager::deploy_standalone(
    runtime::Runner& runner, const DeployConfig& config) {
    service::ServiceOptions options;
    options.config = config;
    options.logger = logger_;
    auto app = std::make_shared<service::ServiceApp>(runner, std::move(options));

    auto bound = app->bind();
    if (core::errors::is_error(bound)) {
        go_idle();
        return core::errors::get_error(bound);
    }

    DeploymentRecord record;
    record.deploy_id = make_deploy_id(config.mode, config.host, config.port);
    record.mode = config.mode;
    record.host = config.host;
    record.port = config.port;
    record.url = make_service_url(config.host, config.port);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        app_ = app;
        record_ = record;
        transition_locked(ServiceState::Running);
    }

    service::HostOptions host_options;
    host_options.handle_signals = config.handle_signals;
    host_options.logger = logger_;
    auto served = service::run_service(runner, *app, host_options);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // stop() may have given up waiting and released this deployment already.
        if (app_ == app) {
            if (state_ == ServiceState::Running) {
                transition_locked(ServiceState::Stopping);
            }
            app_.reset();
            record_.reset();
            transition_locked(ServiceState::NotRunning);
        }
    }

    if (core::errors::is_error(served)) {
        return core::errors::get_error(served);
    }
    return record;
}

core::errors::Result<ServiceState> LocalDeployManager::stop() {
    DeployConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ServiceState::NotRunning) {
            AGENTRT_LOG_INFO(logger_, "LocalDeployManager: stop requested but service is not running");
            return ServiceState::NotRunning;
        }
        if (state_ != ServiceState::Running) {
            return AgentError{ErrorCategory::Deployment,
                              "Cannot stop while the service is " + to_string(state_) + ".",
                              "deployment_busy"};
        }
        config = config_;
        transition_locked(ServiceState::Stopping);
    }

    switch (config.mode) {
        case DeploymentMode::DaemonThread:
            stop_daemon(config);
            break;
        case DeploymentMode::DetachedProcess:
            stop_detached(config);
            break;
        case DeploymentMode::Standalone:
            stop_standalone(config);
            break;
        default:
            go_idle();
            break;
    }
    return ServiceState::NotRunning;
}

void LocalDeployManager::stop_daemon(const DeployConfig& config) {
    std::shared_ptr<service::ServiceApp> app;
    std::thread worker;
    std::future<void> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        app = app_;
        worker = std::move(worker_);
        done = std::move(worker_done_);
    }
    release_worker(std::move(app), std::move(worker), std::move(done), config.shutdown_timeout);
    go_idle();
}

void LocalDeployManager::stop_detached(const DeployConfig& config) {
    std::optional<pid_t> pid;
    std::string deploy_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid = child_pid_;
        deploy_id = record_.has_value() ? record_->deploy_id : "";
    }

    if (pid.has_value()) {
        auto terminated = processes_.terminate(pid.value(), config.shutdown_timeout);
        if (core::errors::is_error(terminated)) {
            AGENTRT_LOG_ERROR(logger_, "LocalDeployManager: " + core::errors::get_error(terminated).message);
        } else if (!core::errors::get_value(terminated)) {
            AGENTRT_LOG_WARN(logger_, "LocalDeployManager: process " + std::to_string(pid.value()) +
                                          " ignored SIGTERM for " + seconds_text(config.shutdown_timeout) +
                                          " (" + core::errors::codes::kShutdownTimeout +
                                          "), sent SIGKILL");
        }
    }

    if (!deploy_id.empty()) {
        const PidFileStore store(config.pid_dir);
        auto removed = store.remove(deploy_id);
        if (core::errors::is_error(removed)) {
            AGENTRT_LOG_WARN(logger_, "LocalDeployManager: " + core::errors::get_error(removed).message);
        }
    }
    go_idle();
}

void LocalDeployManager::stop_standalone(const DeployConfig& config) {
    std::shared_ptr<service::ServiceApp> app;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        app = app_;
    }
    if (app) {
        app->stop();
    }

    // The blocked deploy() call finishes the transition once run_service returns.
    std::unique_lock<std::mutex> lock(mutex_);
    const bool idle = state_changed_.wait_for(lock, config.shutdown_timeout, [this]() {
        return state_ == ServiceState::NotRunning;
    });
    if (!idle) {
        AGENTRT_LOG_WARN(logger_, "LocalDeployManager: standalone server did not stop within " +
                                      seconds_text(config.shutdown_timeout) + " (" +
                                      core::errors::codes::kShutdownTimeout + ")");
        app_.reset();
        record_.reset();
        transition_locked(ServiceState::NotRunning);
    }
}

void LocalDeployManager::release_worker(std::shared_ptr<service::ServiceApp> app,
                                        std::thread worker, std::future<void> worker_done,
                                        const std::chrono::milliseconds timeout) {
    if (app) {
        app->stop();
    }
    const bool finished =
        !worker_done.valid() || worker_done.wait_for(timeout) == std::future_status::ready;
    if (finished) {
        if (worker.joinable()) {
            worker.join();
        }
        return;
    }
    AGENTRT_LOG_WARN(logger_, "LocalDeployManager: server thread did not stop within " +
                                  seconds_text(timeout) + " (" +
                                  core::errors::codes::kShutdownTimeout + "), leaving it to finish");
    if (worker.joinable()) {
        std::lock_guard<std::mutex> lock(mutex_);
        lingering_.push_back(std::move(worker));
    }
}

}  // namespace agentrt::deploy
