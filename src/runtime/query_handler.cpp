#include "runtime/query_handler.hpp"

#include <stdexcept>
#include <utility>

namespace agentrt::runtime {

using protocol::AgentRequest;
using protocol::Message;

namespace {

// Calls the routine on the first pull and hands out its single result.
template <typename Invoke>
class SingleResultSource final : public EventSource {
public:
    explicit SingleResultSource(Invoke invoke) : invoke_(std::move(invoke)) {}

    std::optional<Message> next() override {
        if (consumed_) {
            return std::nullopt;
        }
        consumed_ = true;
        return invoke_();
    }

private:
    Invoke invoke_;
    bool consumed_ = false;
};

template <typename Invoke>
std::unique_ptr<EventSource> make_single_result_source(Invoke invoke) {
    return std::make_unique<SingleResultSource<Invoke>>(std::move(invoke));
}

// Obtains the generator on the first pull, then steps it until exhausted.
template <typename Generator, typename Step>
class GeneratorSource final : public EventSource {
public:
    GeneratorSource(std::function<Generator()> start, Step step)
        : start_(std::move(start)), step_(std::move(step)) {}

    std::optional<Message> next() override {
        if (exhausted_) {
            return std::nullopt;
        }
        if (!generator_) {
            generator_ = start_();
            if (!generator_) {
                exhausted_ = true;
                return std::nullopt;
            }
        }
        std::optional<Message> message = step_(generator_);
        if (!message.has_value()) {
            exhausted_ = true;
        }
        return message;
    }

private:
    std::function<Generator()> start_;
    Step step_;
    Generator generator_;
    bool exhausted_ = false;
};

template <typename Generator, typename Step>
std::unique_ptr<EventSource> make_generator_source(std::function<Generator()> start,
                                                   Step step) {
    return std::make_unique<GeneratorSource<Generator, Step>>(std::move(start),
                                                              std::move(step));
}

class FunctionHandler final : public QueryHandler {
public:
    explicit FunctionHandler(SyncFunction fn) : fn_(std::move(fn)) {}

    std::unique_ptr<EventSource> open(Runner& runner, const AgentRequest& request) override {
        return make_single_result_source(
            [fn = fn_, runner = &runner, request]() { return fn(*runner, request); });
    }

    HandlerShape shape() const override { return HandlerShape::Function; }

private:
    SyncFunction fn_;
};

class AsyncFunctionHandler final : public QueryHandler {
public:
    explicit AsyncFunctionHandler(AsyncFunction fn) : fn_(std::move(fn)) {}

    std::unique_ptr<EventSource> open(Runner& runner, const AgentRequest& request) override {
        return make_single_result_source([fn = fn_, runner = &runner, request]() {
            std::future<Message> pending = fn(*runner, request);
            return pending.get();
        });
    }

    HandlerShape shape() const override { return HandlerShape::AsyncFunction; }

private:
    AsyncFunction fn_;
};

class GeneratorHandler final : public QueryHandler {
public:
    explicit GeneratorHandler(SyncGeneratorFunction fn) : fn_(std::move(fn)) {}

    std::unique_ptr<EventSource> open(Runner& runner, const AgentRequest& request) override {
        std::function<MessageGenerator()> start = [fn = fn_, runner = &runner, request]() {
            return fn(*runner, request);
        };
        return make_generator_source(std::move(start),
                                     [](MessageGenerator& generator) { return generator(); });
    }

    HandlerShape shape() const override { return HandlerShape::Generator; }

private:
    SyncGeneratorFunction fn_;
};

class AsyncGeneratorHandler final : public QueryHandler {
public:
    explicit AsyncGeneratorHandler(AsyncGeneratorFunction fn) : fn_(std::move(fn)) {}

    std::unique_ptr<EventSource> open(Runner& runner, const AgentRequest& request) override {
        std::function<AsyncMessageGenerator()> start = [fn = fn_, runner = &runner, request]() {
            return fn(*runner, request);
        };
        return make_generator_source(std::move(start), [](AsyncMessageGenerator& generator) {
            std::future<std::optional<Message>> step = generator();
            return step.get();
        });
    }

    HandlerShape shape() const override { return HandlerShape::AsyncGenerator; }

private:
    AsyncGeneratorFunction fn_;
};

template <typename Fn>
void require_callable(const Fn& fn, const char* factory) {
    if (!fn) {
        throw std::invalid_argument(std::string(factory) + ": handler routine is empty");
    }
}

}  // namespace

std::string to_string(const HandlerShape shape) {
    switch (shape) {
        case HandlerShape::Function:
            return "function";
        case HandlerShape::AsyncFunction:
            return "async_function";
        case HandlerShape::Generator:
            return "generator";
        case HandlerShape::AsyncGenerator:
            return "async_generator";
        default:
            return "unknown";
    }
}

std::shared_ptr<QueryHandler> make_function_handler(SyncFunction fn) {
    require_callable(fn, "make_function_handler");
    return std::make_shared<FunctionHandler>(std::move(fn));
}

std::shared_ptr<QueryHandler> make_async_function_handler(AsyncFunction fn) {
    require_callable(fn, "make_async_function_handler");
    return std::make_shared<AsyncFunctionHandler>(std::move(fn));
}

std::shared_ptr<QueryHandler> make_generator_handler(SyncGeneratorFunction fn) {
    require_callable(fn, "make_generator_handler");
    return std::make_shared<GeneratorHandler>(std::move(fn));
}

std::shared_ptr<QueryHandler> make_async_generator_handler(AsyncGeneratorFunction fn) {
    require_callable(fn, "make_async_generator_handler");
    return std::make_shared<AsyncGeneratorHandler>(std::move(fn));
}

}  // namespace agentrt::runtime
