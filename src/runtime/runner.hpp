#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/deploy_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "deploy/deployment_record.hpp"
#include "protocol/agent_request.hpp"
#include "protocol/event_contract.hpp"
#include "runtime/query_handler.hpp"
#include "runtime/sequencer.hpp"

namespace agentrt::deploy {
class DeployManager;
}

namespace agentrt::runtime {

class Runner;

using SyncHook = std::function<void(Runner&)>;
using AsyncHook = std::function<std::future<void>(Runner&)>;
using LifecycleHook = std::variant<std::monostate, SyncHook, AsyncHook>;

struct RunnerOptions {
    LifecycleHook init_hook;
    LifecycleHook shutdown_hook;
    std::shared_ptr<core::logging::Logger> logger;  // Defaults to a stdout logger
};

// Event stream of one stream_query() call. Pull with next() until it returns
// std::nullopt; the last event is always the terminal envelope.
class QueryStream {
public:
    QueryStream(QueryStream&&) noexcept = default;
    QueryStream& operator=(QueryStream&&) noexcept = default;
    QueryStream(const QueryStream&) = delete;
    QueryStream& operator=(const QueryStream&) = delete;

    std::optional<protocol::Event> next();

    // Pulls everything that is left and returns the terminal envelope.
    protocol::AgentResponse drain();

    const protocol::AgentRequest& request() const { return request_; }
    const protocol::AgentResponse& envelope() const { return envelope_; }
    bool finished() const { return phase_ == Phase::Done; }

private:
    friend class Runner;

    enum class Phase {
        Created,
        InProgress,
        Handler,
        Done
    };

    QueryStream(Runner& runner, std::shared_ptr<QueryHandler> handler,
                protocol::AgentRequest request,
                std::shared_ptr<core::logging::Logger> logger);

    protocol::Event envelope_event();
    protocol::Event finish_failed(const std::string& message);

    Runner* runner_;
    std::shared_ptr<QueryHandler> handler_;
    protocol::AgentRequest request_;
    std::shared_ptr<core::logging::Logger> logger_;
    std::unique_ptr<EventSource> source_;
    protocol::AgentResponse envelope_;
    Sequencer sequencer_;
    Phase phase_ = Phase::Created;
};

// Owns one handler and drives it per request. Also the unit that gets
// deployed: deploy() hands itself to a DeployManager and tracks it.
class Runner {
public:
    explicit Runner(std::shared_ptr<QueryHandler> handler, RunnerOptions options = {});
    ~Runner();

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    core::errors::Result<QueryStream> stream_query(
        protocol::AgentRequest request,
        const std::optional<std::string>& user_id = std::nullopt);

    // Validates raw wire data first; malformed input yields a Validation error.
    core::errors::Result<QueryStream> stream_query(
        const nlohmann::json& payload,
        const std::optional<std::string>& user_id = std::nullopt);

    core::errors::Result<deploy::DeploymentRecord> deploy(
        std::shared_ptr<deploy::DeployManager> manager,
        const core::config::DeployConfig& config);

    // false when nothing is tracked under deploy_id.
    core::errors::Result<bool> stop(const std::string& deploy_id);

    std::vector<std::string> deployment_ids() const;

    // Runs the init hook; exceptions from the hook propagate.
    void start();
    // Runs the shutdown hook; exceptions from the hook are logged.
    void shutdown() noexcept;

    const std::shared_ptr<core::logging::Logger>& logger() const { return logger_; }
    const QueryHandler& handler() const { return *handler_; }

    // Init hook on construction, shutdown hook on destruction, once each.
    // A throwing init hook still gets the shutdown hook before rethrowing.
    class Scope {
    public:
        explicit Scope(Runner& runner);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        Runner& runner() { return runner_; }

    private:
        Runner& runner_;
    };

private:
    void run_hook(const LifecycleHook& hook);

    std::shared_ptr<QueryHandler> handler_;
    RunnerOptions options_;
    std::shared_ptr<core::logging::Logger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<deploy::DeployManager>> deployments_;
};

}  // namespace agentrt::runtime
