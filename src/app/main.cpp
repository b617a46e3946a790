#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "deploy/local_deploy_manager.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/query_handler.hpp"
#include "runtime/runner.hpp"
#include "service/service_app.hpp"
#include "service/service_host.hpp"
#include "service/signal_watcher.hpp"

namespace {

using agentrt::protocol::Message;
using agentrt::protocol::Role;

// Streams the last user message back word by word, then the whole reply.
agentrt::runtime::MessageGenerator echo_agent(agentrt::runtime::Runner&,
                                              const agentrt::protocol::AgentRequest& request) {
    const std::string reply = "echo: " + request.last_user_text();
    std::vector<std::string> words;
    std::istringstream in(reply);
    for (std::string word; in >> word;) {
        words.push_back(word);
    }

    std::size_t next = 0;
    bool finished = false;
    return [words, reply, next, finished]() mutable -> std::optional<Message> {
        if (next < words.size()) {
            Message delta = Message::text(Role::Assistant, words[next++] + " ");
            delta.status = agentrt::protocol::RunStatus::InProgress;
            delta.content.front().delta = true;
            return delta;
        }
        if (!finished) {
            finished = true;
            return Message::text(Role::Assistant, reply);
        }
        return std::nullopt;
    };
}

// Blocks until SIGINT or SIGTERM arrives.
class ShutdownLatch {
public:
    explicit ShutdownLatch(std::shared_ptr<agentrt::core::logging::Logger> logger)
        : watcher_([this](int) { release(); }, std::move(logger)) {}

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        released_cv_.wait(lock, [this]() { return released_; });
    }

private:
    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        released_cv_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable released_cv_;
    bool released_ = false;
    agentrt::service::SignalWatcher watcher_;
};

}  // namespace

int main(int argc, char* argv[]) {
    auto logger = agentrt::core::logging::Logger::make_default("agentrt_serve");

    // 1. Parse CLI input and return normalized input errors
    auto parsed = agentrt::app::cli::parse_and_validate(argc, argv);
    if (agentrt::core::errors::is_error(parsed)) {
        const auto& err = agentrt::core::errors::get_error(parsed);
        AGENTRT_LOG_ERROR(logger, "Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            AGENTRT_LOG_INFO(logger, "Hint: " + err.hint);
        }
        return 2;
    }

    auto cmd = agentrt::core::errors::get_value(parsed);
    if (cmd.verbose) {
        logger->set_level(agentrt::core::logging::LogLevel::DEBUG);
    }
    if (cmd.config_file) {
        AGENTRT_LOG_INFO(logger, "Loaded configuration from " + cmd.config_file.value());
    }

    // 2. The runner and the manager that will host it
    agentrt::runtime::RunnerOptions runner_options;
    runner_options.logger = logger;
    runner_options.init_hook = agentrt::runtime::SyncHook(
        [](agentrt::runtime::Runner& runner) { AGENTRT_LOG_INFO(runner.logger(), "Echo agent ready"); });
    runner_options.shutdown_hook = agentrt::runtime::SyncHook(
        [](agentrt::runtime::Runner& runner) { AGENTRT_LOG_INFO(runner.logger(), "Echo agent stopped"); });
    agentrt::runtime::Runner runner(agentrt::runtime::make_generator_handler(echo_agent),
                                    std::move(runner_options));

    // 3. A detached deployment's child: serve right here until signalled
    if (cmd.foreground && cmd.config.mode == agentrt::core::config::DeploymentMode::DetachedProcess) {
        agentrt::service::ServiceOptions service_options;
        service_options.config = cmd.config;
        service_options.logger = logger;
        agentrt::service::ServiceApp app(runner, std::move(service_options));
        auto bound = app.bind();
        if (agentrt::core::errors::is_error(bound)) {
            const auto& err = agentrt::core::errors::get_error(bound);
            AGENTRT_LOG_ERROR(logger, "Bind failed [" + err.code + "]: " + err.message);
            return 3;
        }
        agentrt::service::HostOptions host_options;
        host_options.handle_signals = true;
        host_options.logger = logger;
        auto served = agentrt::service::run_service(runner, app, host_options);
        if (agentrt::core::errors::is_error(served)) {
            const auto& err = agentrt::core::errors::get_error(served);
            AGENTRT_LOG_ERROR(logger, "Service failed [" + err.code + "]: " + err.message);
            return 3;
        }
        return 0;
    }

    agentrt::deploy::LocalDeployOptions deploy_options;
    deploy_options.logger = logger;
    auto manager = std::make_shared<agentrt::deploy::LocalDeployManager>(std::move(deploy_options));

    // 4. Standalone blocks here until a signal stops the server
    if (cmd.config.mode == agentrt::core::config::DeploymentMode::Standalone) {
        cmd.config.handle_signals = true;
        auto served = runner.deploy(manager, cmd.config);
        if (agentrt::core::errors::is_error(served)) {
            const auto& err = agentrt::core::errors::get_error(served);
            AGENTRT_LOG_ERROR(logger, "Deployment failed [" + err.code + "]: " + err.message);
            return 3;
        }
        return 0;
    }

    // 5. Background modes: deploy, then stay in the foreground until signalled
    ShutdownLatch latch(logger);
    auto deployed = runner.deploy(manager, cmd.config);
    if (agentrt::core::errors::is_error(deployed)) {
        const auto& err = agentrt::core::errors::get_error(deployed);
        AGENTRT_LOG_ERROR(logger, "Deployment failed [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            AGENTRT_LOG_INFO(logger, "Hint: " + err.hint);
        }
        return 3;
    }

    const auto& record = agentrt::core::errors::get_value(deployed);
    AGENTRT_LOG_INFO(logger, "Serving " + record.deploy_id + " at " + record.url +
                                 (record.pid ? " (pid " + std::to_string(record.pid.value()) + ")" : ""));
    latch.wait();

    auto stopped = runner.stop(record.deploy_id);
    if (agentrt::core::errors::is_error(stopped)) {
        const auto& err = agentrt::core::errors::get_error(stopped);
        AGENTRT_LOG_ERROR(logger, "Stop failed [" + err.code + "]: " + err.message);
        return 3;
    }
    return 0;
}
