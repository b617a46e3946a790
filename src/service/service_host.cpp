#include "service/service_host.hpp"

#include <exception>
#include <string>
#include "runtime/runner.hpp"
#include "service/signal_watcher.hpp"

namespace agentrt::service {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

AgentError startup_failed(const std::string& detail) {
    return AgentError{ErrorCategory::Handler, "Runner init hook failed: " + detail,
                      "startup_failed"};
}

}  // namespace

core::errors::Result<bool> run_service(runtime::Runner& runner, ServiceApp& app,
                                       const HostOptions& options) {
    const auto logger = options.logger ? options.logger : runner.logger();

    std::unique_ptr<SignalWatcher> watcher;
    if (options.handle_signals) {
        watcher = std::make_unique<SignalWatcher>(
            [&app, logger](int) {
                AGENTRT_LOG_INFO(logger, "ServiceHost: stopping on signal");
                app.stop();
            },
            logger);
    }

    try {
        runtime::Runner::Scope scope(runner);
        app.set_ready(true);
        auto served = app.listen();
        app.set_ready(false);
        return served;
    } catch (const std::exception& e) {
        AGENTRT_LOG_ERROR(logger, std::string("ServiceHost: ") + e.what());
        app.stop();
        return startup_failed(e.what());
    } catch (...) {
        AGENTRT_LOG_ERROR(logger, "ServiceHost: init hook threw a non-standard exception");
        app.stop();
        return startup_failed("non-standard exception");
    }
}

}  // namespace agentrt::service
