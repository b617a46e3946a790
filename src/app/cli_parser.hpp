#pragma once
#include <optional>
#include <string>
#include "core/config/deploy_config.hpp"
#include "core/errors/agent_errors.hpp"

namespace agentrt::app::cli {

    // A validated `serve` invocation
    struct ServeCommand {
        agentrt::core::config::DeployConfig config;
        std::optional<std::string> config_file;
        bool verbose = false;
        // Serve on this process. A detached_process deployment runs its
        // child this way.
        bool foreground = false;
    };

    agentrt::core::errors::Result<ServeCommand> parse_and_validate(int argc, char* argv[]);
}
