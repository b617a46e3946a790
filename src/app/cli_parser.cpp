#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace agentrt::app::cli {

    using namespace agentrt::core::errors;
    using agentrt::core::config::DeployConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> config_file;
        std::optional<std::string> host;
        std::optional<std::string> port;
        std::optional<std::string> endpoint;
        std::optional<std::string> response_type;
        std::optional<std::string> mode;
        bool verbose = false;
        bool foreground = false;
    };

    namespace {
        AgentError input_error(const std::string& message, const std::string& code, const std::string& hint = "") {
            return AgentError{ErrorCategory::Validation, message, code, hint};
        }
    }

    Result<ServeCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return input_error("No command provided.", "missing_command", "Usage: agentrt_serve serve [--port 8000]");
        }

        std::string command = argv[1];
        if (command != "serve") {
            return input_error("Unknown command: " + command, "unknown_command", "Currently only the 'serve' command is supported.");
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and 'serve'
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto take_value = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            bool ok = true;
            if (flag == "--config") ok = take_value(i, raw.config_file);
            else if (flag == "--host") ok = take_value(i, raw.host);
            else if (flag == "--port") ok = take_value(i, raw.port);
            else if (flag == "--endpoint") ok = take_value(i, raw.endpoint);
            else if (flag == "--response-type") ok = take_value(i, raw.response_type);
            else if (flag == "--mode") ok = take_value(i, raw.mode);
            else if (flag == "--verbose") raw.verbose = true;
            else if (flag == "--foreground") raw.foreground = true;
            else return input_error("Unknown argument: " + flag, "unknown_argument");

            if (!ok) {
                return input_error("Missing value for " + flag, "missing_value");
            }
        }

        // 3. Validator Phase: file first, then flags on top
        ServeCommand cmd;
        cmd.verbose = raw.verbose;
        cmd.foreground = raw.foreground;
        cmd.config.mode = agentrt::core::config::DeploymentMode::Standalone;

        if (raw.config_file) {
            auto loaded = agentrt::core::config::load_deploy_config(raw.config_file.value(), cmd.config);
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            cmd.config = get_value(loaded);
            cmd.config_file = raw.config_file;
        }

        if (raw.host) {
            if (raw.host->empty()) {
                return input_error("--host cannot be empty", "invalid_host");
            }
            cmd.config.host = raw.host.value();
        }

        // Exception-free integer parsing
        if (raw.port) {
            int port = 0;
            const char* begin = raw.port->data();
            const char* end = raw.port->data() + raw.port->size();
            auto [ptr, ec] = std::from_chars(begin, end, port);
            if (ec != std::errc() || ptr != end) {
                return input_error("Invalid number for --port", "invalid_integer", "Provide an integer between 1 and 65535.");
            }
            if (port < 1 || port > 65535) {
                return input_error("--port out of bounds", "bounds_error", "Must be between 1 and 65535.");
            }
            cmd.config.port = port;
        }

        if (raw.endpoint) {
            if (raw.endpoint->empty() || raw.endpoint->front() != '/') {
                return input_error("--endpoint must start with '/'", "invalid_endpoint");
            }
            cmd.config.endpoint_path = raw.endpoint.value();
        }

        if (raw.response_type) {
            auto type = agentrt::core::config::parse_response_type(raw.response_type.value());
            if (!type) {
                return input_error("Unknown response type: " + raw.response_type.value(), "invalid_response_type", "Use 'sse' or 'json'.");
            }
            cmd.config.response_type = type.value();
        }

        if (raw.mode) {
            auto mode = agentrt::core::config::parse_deployment_mode(raw.mode.value());
            if (!mode) {
                return input_error("Unknown mode: " + raw.mode.value(), "invalid_mode",
                                   "Use 'standalone', 'daemon_thread' or 'detached_process'.");
            }
            cmd.config.mode = mode.value();
        }

        if (cmd.foreground && cmd.config.mode == agentrt::core::config::DeploymentMode::DaemonThread) {
            return input_error("--foreground cannot be combined with daemon_thread", "invalid_foreground",
                               "Use it with 'detached_process' or 'standalone'.");
        }

        auto valid = agentrt::core::config::validate(cmd.config);
        if (is_error(valid)) {
            return get_error(valid);
        }
        return cmd;
    }

} // namespace agentrt::app::cli
