#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "deploy/deploy_manager.hpp"
#include "protocol/event_contract.hpp"
#include "runtime/runner.hpp"

namespace {

using agentrt::core::config::DeployConfig;
using agentrt::core::errors::ErrorCategory;
using agentrt::core::errors::get_error;
using agentrt::core::errors::get_value;
using agentrt::core::errors::is_error;
using agentrt::core::errors::Result;
using agentrt::deploy::DeploymentRecord;
using agentrt::deploy::ServiceState;
using agentrt::protocol::AgentRequest;
using agentrt::protocol::Event;
using agentrt::protocol::Message;
using agentrt::protocol::Role;
using agentrt::protocol::RunStatus;
using agentrt::runtime::MessageGenerator;
using agentrt::runtime::QueryStream;
using agentrt::runtime::Runner;
using agentrt::runtime::RunnerOptions;

AgentRequest hello_request() {
    AgentRequest request;
    request.input.push_back(Message::text(Role::User, "hello"));
    return request;
}

MessageGenerator texts(std::vector<std::string> items) {
    std::size_t index = 0;
    return [items, index]() mutable -> std::optional<Message> {
        if (index >= items.size()) {
            return std::nullopt;
        }
        return Message::text(Role::Assistant, items[index++]);
    };
}

std::vector<Event> collect(QueryStream& stream) {
    std::vector<Event> events;
    while (auto event = stream.next()) {
        events.push_back(std::move(event.value()));
    }
    return events;
}

std::vector<Event> run(Runner& runner, AgentRequest request = hello_request()) {
    auto opened = runner.stream_query(std::move(request));
    if (is_error(opened)) {
        ADD_FAILURE() << get_error(opened).message;
        return {};
    }
    return collect(get_value(opened));
}

// Records deploy/stop calls instead of serving anything.
class FakeDeployManager : public agentrt::deploy::DeployManager {
public:
    Result<DeploymentRecord> deploy(Runner&, const DeployConfig& config) override {
        ++deploy_calls;
        if (running_) {
            return agentrt::core::errors::AgentError{agentrt::core::errors::ErrorCategory::Deployment,
                                                     "busy", "already_running"};
        }
        running_ = true;
        DeploymentRecord record;
        record.deploy_id = "fake_" + std::to_string(config.port);
        record.port = config.port;
        record.url = "http://fake:" + std::to_string(config.port);
        return record;
    }

    Result<ServiceState> stop() override {
        ++stop_calls;
        running_ = false;
        return ServiceState::NotRunning;
    }

    bool is_running() const override { return running_; }
    std::optional<std::string> service_url() const override { return std::nullopt; }
    ServiceState state() const override {
        return running_ ? ServiceState::Running : ServiceState::NotRunning;
    }

    int deploy_calls = 0;
    int stop_calls = 0;

private:
    bool running_ = false;
};

TEST(RunnerTest, FunctionResultFoldsIntoTerminalEnvelope) {
    Runner runner(agentrt::runtime::make_function_handler(
        [](Runner&, const AgentRequest&) { return Message::text(Role::Assistant, "ok"); }));

    const auto events = run(runner);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].status(), RunStatus::Created);
    EXPECT_EQ(events[1].status(), RunStatus::InProgress);
    EXPECT_EQ(events[2].status(), RunStatus::Completed);
    for (const auto& event : events) {
        EXPECT_TRUE(event.is_response());
    }
    EXPECT_EQ(events[2].response()->output_texts(), std::vector<std::string>{"ok"});
    EXPECT_TRUE(events[2].response()->completed_at.has_value());
}

TEST(RunnerTest, GeneratorMessagesStreamBetweenEnvelopes) {
    Runner runner(agentrt::runtime::make_generator_handler(
        [](Runner&, const AgentRequest&) { return texts({"a", "b"}); }));

    const auto events = run(runner);
    ASSERT_EQ(events.size(), 5u);
    for (std::size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].sequence_number, static_cast<std::int64_t>(i));
    }
    EXPECT_EQ(events[2].message()->joined_text(), "a");
    EXPECT_EQ(events[3].message()->joined_text(), "b");
    EXPECT_EQ(events[4].status(), RunStatus::Completed);
    EXPECT_EQ(events[4].response()->output_texts(), (std::vector<std::string>{"a", "b"}));
}

TEST(RunnerTest, IncompleteMessagesAreNotAccumulated) {
    Runner runner(agentrt::runtime::make_generator_handler([](Runner&, const AgentRequest&) {
        int step = 0;
        return MessageGenerator([step]() mutable -> std::optional<Message> {
            ++step;
            if (step == 1) {
                Message delta = Message::text(Role::Assistant, "par");
                delta.status = RunStatus::InProgress;
                return delta;
            }
            if (step == 2) {
                return Message::reasoning("thinking");
            }
            if (step == 3) {
                return Message::text(Role::Assistant, "partial");
            }
            return std::nullopt;
        });
    }));

    const auto events = run(runner);
    ASSERT_EQ(events.size(), 6u);
    EXPECT_EQ(events[2].status(), RunStatus::InProgress);
    EXPECT_EQ(events[5].response()->output_texts(), std::vector<std::string>{"partial"});
}

TEST(RunnerTest, HandlerExceptionBecomesFailedEnvelope) {
    Runner runner(agentrt::runtime::make_generator_handler([](Runner&, const AgentRequest&) {
        int step = 0;
        return MessageGenerator([step]() mutable -> std::optional<Message> {
            if (step++ == 0) {
                return Message::text(Role::Assistant, "a");
            }
            throw std::runtime_error("boom");
        });
    }));

    auto opened = runner.stream_query(hello_request());
    ASSERT_FALSE(is_error(opened));
    auto& stream = get_value(opened);
    const auto events = collect(stream);

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[2].message()->joined_text(), "a");
    const auto* terminal = events[3].response();
    ASSERT_NE(terminal, nullptr);
    EXPECT_EQ(terminal->status, RunStatus::Failed);
    ASSERT_TRUE(terminal->error.has_value());
    EXPECT_EQ(terminal->error->code, "handler_error");
    EXPECT_EQ(terminal->error->message, "boom");
    EXPECT_EQ(terminal->output_texts(), std::vector<std::string>{"a"});

    EXPECT_TRUE(stream.finished());
    EXPECT_FALSE(stream.next().has_value());
}

TEST(RunnerTest, AsyncGeneratorFailureEndsStream) {
    Runner runner(agentrt::runtime::make_async_generator_handler(
        [](Runner&, const AgentRequest&) -> agentrt::runtime::AsyncMessageGenerator {
            auto step = std::make_shared<int>(0);
            return [step]() {
                return std::async(std::launch::async, [step]() -> std::optional<Message> {
                    if ((*step)++ == 0) {
                        return Message::text(Role::Assistant, "a");
                    }
                    throw std::runtime_error("boom");
                });
            };
        }));

    const auto events = run(runner);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].status(), RunStatus::Created);
    EXPECT_EQ(events[1].status(), RunStatus::InProgress);
    EXPECT_EQ(events[2].message()->joined_text(), "a");
    EXPECT_EQ(events[3].status(), RunStatus::Failed);
    EXPECT_NE(events[3].response()->error->message.find("boom"), std::string::npos);
}

TEST(RunnerTest, FunctionExceptionFailsWithoutOutput) {
    Runner runner(agentrt::runtime::make_function_handler(
        [](Runner&, const AgentRequest&) -> Message { throw std::logic_error("bad input"); }));

    const auto events = run(runner);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[2].status(), RunStatus::Failed);
    EXPECT_TRUE(events[2].response()->output.empty());
}

TEST(RunnerTest, ExactlyOneTerminalEventPerStream) {
    Runner runner(agentrt::runtime::make_generator_handler(
        [](Runner&, const AgentRequest&) { return texts({"x", "y", "z"}); }));

    const auto events = run(runner);
    int terminal = 0;
    for (const auto& event : events) {
        if (event.is_response() && agentrt::protocol::is_terminal(event.status())) {
            ++terminal;
        }
    }
    EXPECT_EQ(terminal, 1);
    EXPECT_TRUE(events.back().is_response());
}

TEST(RunnerTest, DrainReturnsTerminalEnvelope) {
    Runner runner(agentrt::runtime::make_generator_handler(
        [](Runner&, const AgentRequest&) { return texts({"one"}); }));
    auto opened = runner.stream_query(hello_request());
    ASSERT_FALSE(is_error(opened));
    const auto envelope = get_value(opened).drain();
    EXPECT_EQ(envelope.status, RunStatus::Completed);
    EXPECT_EQ(envelope.output_texts(), std::vector<std::string>{"one"});
}

TEST(RunnerTest, BackfillsSessionIdOnce) {
    std::string seen_session;
    Runner runner(agentrt::runtime::make_function_handler(
        [&seen_session](Runner&, const AgentRequest& request) {
            seen_session = request.session_id.value_or("");
            return Message::text(Role::Assistant, "ok");
        }));

    auto opened = runner.stream_query(hello_request());
    ASSERT_FALSE(is_error(opened));
    auto& stream = get_value(opened);
    const std::string session = stream.request().session_id.value_or("");
    EXPECT_FALSE(session.empty());
    EXPECT_EQ(stream.request().user_id.value_or("missing"), "");

    const auto events = collect(stream);
    EXPECT_EQ(seen_session, session);
    for (const auto& event : events) {
        if (event.is_response()) {
            EXPECT_EQ(event.response()->session_id, session);
        }
    }
}

TEST(RunnerTest, KeepsCallerSessionAndExplicitUser) {
    Runner runner(agentrt::runtime::make_function_handler(
        [](Runner&, const AgentRequest&) { return Message::text(Role::Assistant, "ok"); }));

    AgentRequest request = hello_request();
    request.session_id = "session-7";
    request.user_id = "from-body";
    auto opened = runner.stream_query(request, std::string("explicit"));
    ASSERT_FALSE(is_error(opened));
    EXPECT_EQ(get_value(opened).request().session_id.value(), "session-7");
    EXPECT_EQ(get_value(opened).request().user_id.value(), "explicit");
}

TEST(RunnerTest, RejectsMalformedWireRequest) {
    Runner runner(agentrt::runtime::make_function_handler(
        [](Runner&, const AgentRequest&) { return Message::text(Role::Assistant, "ok"); }));

    auto opened = runner.stream_query(nlohmann::json{{"input", 42}});
    ASSERT_TRUE(is_error(opened));
    EXPECT_EQ(get_error(opened).category, ErrorCategory::Validation);
}

TEST(RunnerTest, RequiresHandler) {
    EXPECT_THROW(Runner(nullptr), std::invalid_argument);
}

TEST(RunnerTest, ScopeRunsHooksOnce) {
    int started = 0;
    int stopped = 0;
    RunnerOptions options;
    options.init_hook = agentrt::runtime::SyncHook([&started](Runner&) { ++started; });
    options.shutdown_hook = agentrt::runtime::AsyncHook([&stopped](Runner&) {
        return std::async(std::launch::async, [&stopped]() { ++stopped; });
    });
    Runner runner(agentrt::runtime::make_function_handler(
                      [](Runner&, const AgentRequest&) { return Message::text(Role::Assistant, ""); }),
                  options);

    {
        Runner::Scope scope(runner);
        EXPECT_EQ(started, 1);
        EXPECT_EQ(stopped, 0);
    }
    EXPECT_EQ(started, 1);
    EXPECT_EQ(stopped, 1);
}

TEST(RunnerTest, ScopeRunsShutdownWhenInitThrows) {
    int stopped = 0;
    RunnerOptions options;
    options.init_hook = agentrt::runtime::SyncHook([](Runner&) { throw std::runtime_error("init"); });
    options.shutdown_hook = agentrt::runtime::SyncHook([&stopped](Runner&) { ++stopped; });
    Runner runner(agentrt::runtime::make_function_handler(
                      [](Runner&, const AgentRequest&) { return Message::text(Role::Assistant, ""); }),
                  options);

    EXPECT_THROW({ Runner::Scope scope(runner); }, std::runtime_error);
    EXPECT_EQ(stopped, 1);
}

TEST(RunnerTest, ShutdownSwallowsHookFailure) {
    RunnerOptions options;
    options.shutdown_hook = agentrt::runtime::SyncHook([](Runner&) { throw std::runtime_error("late"); });
    Runner runner(agentrt::runtime::make_function_handler(
                      [](Runner&, const AgentRequest&) { return Message::text(Role::Assistant, ""); }),
                  options);
    EXPECT_NO_THROW(runner.shutdown());
}

TEST(RunnerTest, TracksAndStopsDeployments) {
    Runner runner(agentrt::runtime::make_function_handler(
        [](Runner&, const AgentRequest&) { return Message::text(Role::Assistant, ""); }));
    auto manager = std::make_shared<FakeDeployManager>();
    DeployConfig config;
    config.port = 9100;

    auto deployed = runner.deploy(manager, config);
    ASSERT_FALSE(is_error(deployed));
    EXPECT_EQ(get_value(deployed).deploy_id, "fake_9100");
    EXPECT_EQ(runner.deployment_ids(), std::vector<std::string>{"fake_9100"});

    auto again = runner.deploy(manager, config);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "already_running");

    auto stopped = runner.stop("fake_9100");
    ASSERT_FALSE(is_error(stopped));
    EXPECT_TRUE(get_value(stopped));
    EXPECT_TRUE(runner.deployment_ids().empty());

    auto unknown = runner.stop("fake_9100");
    ASSERT_FALSE(is_error(unknown));
    EXPECT_FALSE(get_value(unknown));
    EXPECT_EQ(manager->stop_calls, 1);
}

TEST(RunnerTest, DestructionStopsRunningDeployments) {
    auto manager = std::make_shared<FakeDeployManager>();
    {
        Runner runner(agentrt::runtime::make_function_handler(
            [](Runner&, const AgentRequest&) { return Message::text(Role::Assistant, ""); }));
        auto deployed = runner.deploy(manager, DeployConfig{});
        ASSERT_FALSE(is_error(deployed));
    }
    EXPECT_EQ(manager->stop_calls, 1);
    EXPECT_FALSE(manager->is_running());
}

TEST(RunnerTest, RejectsNullManager) {
    Runner runner(agentrt::runtime::make_function_handler(
        [](Runner&, const AgentRequest&) { return Message::text(Role::Assistant, ""); }));
    auto deployed = runner.deploy(nullptr, DeployConfig{});
    ASSERT_TRUE(is_error(deployed));
    EXPECT_EQ(get_error(deployed).category, ErrorCategory::Validation);
}

}  // namespace
