#include "runtime/runner.hpp"

#include <exception>
#include <stdexcept>
#include <utility>
#include "core/config/ids.hpp"
#include "deploy/deploy_manager.hpp"
#include "protocol/json_codec.hpp"

namespace agentrt::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::AgentRequest;
using protocol::AgentResponse;
using protocol::Event;
using protocol::Message;
using protocol::MessageType;
using protocol::RunStatus;

namespace {

bool accumulates(const Message& message) {
    return message.type == MessageType::Message && message.status == RunStatus::Completed;
}

}  // namespace

QueryStream::QueryStream(Runner& runner, std::shared_ptr<QueryHandler> handler,
                         AgentRequest request,
                         std::shared_ptr<core::logging::Logger> logger)
    : runner_(&runner),
      handler_(std::move(handler)),
      request_(std::move(request)),
      logger_(std::move(logger)) {
    envelope_.session_id = request_.session_id.value_or("");
}

Event QueryStream::envelope_event() {
    Event event;
    event.sequence_number = sequencer_.next();
    event.body = envelope_;
    return event;
}

Event QueryStream::finish_failed(const std::string& message) {
    source_.reset();
    envelope_.failed(protocol::ErrorInfo{core::errors::codes::kHandler, message});
    phase_ = Phase::Done;
    AGENTRT_LOG_WARN(logger_, "Runner: response " + envelope_.id + " failed: " + message);
    return envelope_event();
}

std::optional<Event> QueryStream::next() {
    switch (phase_) {
        case Phase::Created:
            phase_ = Phase::InProgress;
            return envelope_event();
        case Phase::InProgress:
            envelope_.in_progress();
            phase_ = Phase::Handler;
            return envelope_event();
        case Phase::Handler:
            break;
        case Phase::Done:
        default:
            return std::nullopt;
    }

    try {
        if (!source_) {
            source_ = handler_->open(*runner_, request_);
        }
        while (true) {
            std::optional<Message> message = source_->next();
            if (!message.has_value()) {
                source_.reset();
                envelope_.completed();
                phase_ = Phase::Done;
                AGENTRT_LOG_DEBUG(logger_, "Runner: response " + envelope_.id + " completed after " +
                                               std::to_string(sequencer_.issued() + 1) + " events");
                return envelope_event();
            }

            if (accumulates(*message)) {
                envelope_.add_message(*message);
                // A one-shot result travels inside the terminal envelope only.
                if (handler_->yields_single_result()) {
                    continue;
                }
            }

            Event event;
            event.sequence_number = sequencer_.next();
            event.body = std::move(message.value());
            return event;
        }
    } catch (const std::exception& e) {
        return finish_failed(e.what());
    } catch (...) {
        return finish_failed("unknown handler error");
    }
}

AgentResponse QueryStream::drain() {
    while (next().has_value()) {
    }
    return envelope_;
}

Runner::Runner(std::shared_ptr<QueryHandler> handler, RunnerOptions options)
    : handler_(std::move(handler)), options_(std::move(options)) {
    if (!handler_) {
        throw std::invalid_argument("Runner requires a query handler");
    }
    logger_ = options_.logger ? options_.logger : core::logging::Logger::make_default("runner");
}

Runner::~Runner() {
    std::unordered_map<std::string, std::shared_ptr<deploy::DeployManager>> deployments;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deployments.swap(deployments_);
    }
    for (auto& [deploy_id, manager] : deployments) {
        if (manager->is_running()) {
            auto stopped = manager->stop();
            if (core::errors::is_error(stopped)) {
                AGENTRT_LOG_WARN(logger_, "Runner: failed to stop deployment " + deploy_id + ": " +
                                              core::errors::get_error(stopped).message);
            } else {
                AGENTRT_LOG_INFO(logger_, "Runner: stopped deployment " + deploy_id);
            }
        }
        manager->wait_released();
    }
}

core::errors::Result<QueryStream> Runner::stream_query(
    AgentRequest request, const std::optional<std::string>& user_id) {
    if (!request.session_id.has_value() || request.session_id->empty()) {
        request.session_id = core::config::generate_session_id();
    }
    if (user_id.has_value()) {
        request.user_id = user_id;
    } else if (!request.user_id.has_value()) {
        request.user_id = std::string();
    }

    AGENTRT_LOG_DEBUG(logger_, "Runner: stream_query session=" + request.session_id.value() +
                                   " handler=" + to_string(handler_->shape()));
    return QueryStream(*this, handler_, std::move(request), logger_);
}

core::errors::Result<QueryStream> Runner::stream_query(
    const nlohmann::json& payload, const std::optional<std::string>& user_id) {
    auto parsed = protocol::parse_agent_request(payload);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    return stream_query(std::move(core::errors::get_value(parsed)), user_id);
}

core::errors::Result<deploy::DeploymentRecord> Runner::deploy(
    std::shared_ptr<deploy::DeployManager> manager,
    const core::config::DeployConfig& config) {
    if (!manager) {
        return AgentError{ErrorCategory::Validation, "Deployment manager cannot be null.",
                          core::errors::codes::kValidation};
    }

    auto deployed = manager->deploy(*this, config);
    if (core::errors::is_error(deployed)) {
        return core::errors::get_error(deployed);
    }

    const auto& record = core::errors::get_value(deployed);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deployments_[record.deploy_id] = std::move(manager);
    }
    AGENTRT_LOG_INFO(logger_, "Runner: tracking deployment " + record.deploy_id + " at " + record.url);
    return record;
}

core::errors::Result<bool> Runner::stop(const std::string& deploy_id) {
    std::shared_ptr<deploy::DeployManager> manager;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = deployments_.find(deploy_id);
        if (it == deployments_.end()) {
            AGENTRT_LOG_DEBUG(logger_, "Runner: no deployment tracked under " + deploy_id);
            return false;
        }
        manager = it->second;
    }

    auto stopped = manager->stop();
    if (core::errors::is_error(stopped)) {
        return core::errors::get_error(stopped);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    deployments_.erase(deploy_id);
    return true;
}

std::vector<std::string> Runner::deployment_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(deployments_.size());
    for (const auto& entry : deployments_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void Runner::run_hook(const LifecycleHook& hook) {
    if (const auto* sync_hook = std::get_if<SyncHook>(&hook)) {
        if (*sync_hook) {
            (*sync_hook)(*this);
        }
    } else if (const auto* async_hook = std::get_if<AsyncHook>(&hook)) {
        if (*async_hook) {
            (*async_hook)(*this).get();
        }
    }
}

void Runner::start() {
    AGENTRT_LOG_DEBUG(logger_, "Runner: running init hook");
    run_hook(options_.init_hook);
}

void Runner::shutdown() noexcept {
    try {
        AGENTRT_LOG_DEBUG(logger_, "Runner: running shutdown hook");
        run_hook(options_.shutdown_hook);
    } catch (const std::exception& e) {
        AGENTRT_LOG_ERROR(logger_, std::string("Runner: shutdown hook failed: ") + e.what());
    } catch (...) {
        AGENTRT_LOG_ERROR(logger_, "Runner: shutdown hook failed with a non-standard exception");
    }
}

Runner::Scope::Scope(Runner& runner) : runner_(runner) {
    try {
        runner_.start();
    } catch (...) {
        runner_.shutdown();
        throw;
    }
}

Runner::Scope::~Scope() { runner_.shutdown(); }

}  // namespace agentrt::runtime
