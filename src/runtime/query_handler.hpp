#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include "protocol/agent_request.hpp"
#include "protocol/message_contract.hpp"

namespace agentrt::runtime {

class Runner;

enum class HandlerShape {
    Function,
    AsyncFunction,
    Generator,
    AsyncGenerator
};

std::string to_string(HandlerShape shape);

// Lazy, finite, single-pass sequence of handler output.
class EventSource {
public:
    virtual ~EventSource() = default;

    // std::nullopt once exhausted. Exceptions thrown by the wrapped routine
    // pass through unchanged.
    virtual std::optional<protocol::Message> next() = 0;
};

class QueryHandler {
public:
    virtual ~QueryHandler() = default;

    virtual std::unique_ptr<EventSource> open(Runner& runner,
                                              const protocol::AgentRequest& request) = 0;
    virtual HandlerShape shape() const = 0;

    // Function shapes yield exactly one result.
    bool yields_single_result() const {
        return shape() == HandlerShape::Function || shape() == HandlerShape::AsyncFunction;
    }
};

using SyncFunction =
    std::function<protocol::Message(Runner&, const protocol::AgentRequest&)>;
using AsyncFunction =
    std::function<std::future<protocol::Message>(Runner&, const protocol::AgentRequest&)>;

using MessageGenerator = std::function<std::optional<protocol::Message>()>;
using SyncGeneratorFunction =
    std::function<MessageGenerator(Runner&, const protocol::AgentRequest&)>;

using AsyncMessageGenerator = std::function<std::future<std::optional<protocol::Message>>()>;
using AsyncGeneratorFunction =
    std::function<AsyncMessageGenerator(Runner&, const protocol::AgentRequest&)>;

std::shared_ptr<QueryHandler> make_function_handler(SyncFunction fn);
std::shared_ptr<QueryHandler> make_async_function_handler(AsyncFunction fn);
std::shared_ptr<QueryHandler> make_generator_handler(SyncGeneratorFunction fn);
std::shared_ptr<QueryHandler> make_async_generator_handler(AsyncGeneratorFunction fn);

}  // namespace agentrt::runtime
