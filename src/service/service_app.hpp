#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "core/config/deploy_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"

namespace agentrt::runtime {
class Runner;
}

namespace agentrt::service {

struct ServiceOptions {
    core::config::DeployConfig config;
    std::string service_name = "agent-service";
    std::shared_ptr<core::logging::Logger> logger;

    // Invoked by POST /admin/shutdown. Defaults to SIGTERM to this process
    // after shutdown_delay.
    std::function<void()> shutdown_action;
    std::chrono::milliseconds shutdown_delay{1000};
};

// HTTP front of one Runner: the query endpoint, health probes and the
// mode-specific admin routes.
class ServiceApp {
public:
    ServiceApp(runtime::Runner& runner, ServiceOptions options);
    ~ServiceApp();

    ServiceApp(const ServiceApp&) = delete;
    ServiceApp& operator=(const ServiceApp&) = delete;

    // Binds config.host:config.port; port 0 picks a free port. Returns the bound port.
    core::errors::Result<int> bind();

    // Serves on the calling thread until stop(). Requires a successful bind().
    core::errors::Result<bool> listen();

    // Safe from any thread, also before listen() has started. An app is
    // single-use: once stopped it does not listen again.
    void stop();

    bool is_running() const;
    int port() const { return port_.load(); }

    // Reported by /readiness; flipped once the Runner is started.
    void set_ready(bool ready) { ready_.store(ready); }
    bool ready() const { return ready_.load(); }

    void set_healthy(bool healthy) { healthy_.store(healthy); }

    nlohmann::json health_payload() const;
    nlohmann::json root_payload() const;
    nlohmann::json config_payload() const;
    nlohmann::json status_payload() const;

private:
    void configure_routes();
    void handle_query(const httplib::Request& req, httplib::Response& res);

    runtime::Runner& runner_;
    ServiceOptions options_;
    std::shared_ptr<core::logging::Logger> logger_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<int> port_{0};
    std::atomic<bool> bound_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> listen_pending_{false};
    std::atomic<bool> ready_{false};
    std::atomic<bool> healthy_{true};
};

}  // namespace agentrt::service
