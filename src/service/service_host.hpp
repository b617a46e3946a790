#pragma once

#include <memory>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "service/service_app.hpp"

namespace agentrt::runtime {
class Runner;
}

namespace agentrt::service {

struct HostOptions {
    bool handle_signals = false;  // SIGINT/SIGTERM stop the service
    std::shared_ptr<core::logging::Logger> logger;
};

// Serves a bound ServiceApp on the calling thread until it stops. The Runner's
// init hook runs before the first request is accepted and its shutdown hook
// after the accept loop has ended.
core::errors::Result<bool> run_service(runtime::Runner& runner, ServiceApp& app,
                                       const HostOptions& options = {});

}  // namespace agentrt::service
