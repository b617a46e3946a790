#include "core/config/deploy_config.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>

namespace agentrt::core::config {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError invalid_config(const std::string& message) {
    return AgentError{ErrorCategory::Validation, message, core::errors::codes::kInvalidConfig,
                      "Check the deployment configuration file and command-line flags."};
}

std::optional<AgentError> read_string(const json& payload, const char* key, std::string& out) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return invalid_config(std::string("'") + key + "' must be a string.");
    }
    out = it->get<std::string>();
    return std::nullopt;
}

std::optional<AgentError> read_bool(const json& payload, const char* key, bool& out) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        return invalid_config(std::string("'") + key + "' must be a boolean.");
    }
    out = it->get<bool>();
    return std::nullopt;
}

std::optional<AgentError> read_string_list(const json& payload, const char* key,
                                           std::vector<std::string>& out) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_array()) {
        return invalid_config(std::string("'") + key + "' must be an array of strings.");
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return invalid_config(std::string("'") + key + "' must be an array of strings.");
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return std::nullopt;
}

// Timeouts are written in seconds and may be fractional.
std::optional<AgentError> read_seconds(const json& payload, const char* key,
                                       std::chrono::milliseconds& out) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        return invalid_config(std::string("'") + key + "' must be a number of seconds.");
    }
    const double seconds = it->get<double>();
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return invalid_config(std::string("'") + key + "' must be positive.");
    }
    out = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
    return std::nullopt;
}

}  // namespace

std::string to_string(const DeploymentMode mode) {
    switch (mode) {
        case DeploymentMode::DaemonThread:
            return "daemon_thread";
        case DeploymentMode::DetachedProcess:
            return "detached_process";
        case DeploymentMode::Standalone:
            return "standalone";
        default:
            return "unknown";
    }
}

std::string to_string(const ResponseType type) {
    switch (type) {
        case ResponseType::Sse:
            return "sse";
        case ResponseType::Json:
            return "json";
        default:
            return "unknown";
    }
}

std::optional<DeploymentMode> parse_deployment_mode(const std::string& text) {
    if (text == "daemon_thread") return DeploymentMode::DaemonThread;
    if (text == "detached_process") return DeploymentMode::DetachedProcess;
    if (text == "standalone") return DeploymentMode::Standalone;
    return std::nullopt;
}

std::optional<ResponseType> parse_response_type(const std::string& text) {
    if (text == "sse") return ResponseType::Sse;
    if (text == "json") return ResponseType::Json;
    return std::nullopt;
}

core::errors::Result<bool> validate(const DeployConfig& config) {
    if (config.host.empty()) {
        return invalid_config("host cannot be empty.");
    }
    if (config.port < 1 || config.port > 65535) {
        return invalid_config("port must be in 1..65535, got " + std::to_string(config.port) + ".");
    }
    if (config.endpoint_path.empty() || config.endpoint_path.front() != '/') {
        return invalid_config("endpoint_path must start with '/': " + config.endpoint_path);
    }
    if (config.deploy_timeout.count() <= 0 || config.shutdown_timeout.count() <= 0) {
        return invalid_config("deploy_timeout and shutdown_timeout must be positive.");
    }
    if (config.probe_interval.count() <= 0 || config.probe_timeout.count() <= 0) {
        return invalid_config("probe_interval and probe_timeout must be positive.");
    }
    if (config.pid_dir.empty()) {
        return invalid_config("pid_dir cannot be empty.");
    }
    return true;
}

core::errors::Result<DeployConfig> deploy_config_from_json(const json& payload,
                                                           const DeployConfig& base) {
    if (!payload.is_object()) {
        return invalid_config("Deployment configuration must be a JSON object.");
    }

    DeployConfig config = base;
    std::optional<AgentError> error;

    if ((error = read_string(payload, "host", config.host))) return *error;

    if (const auto it = payload.find("port"); it != payload.end() && !it->is_null()) {
        if (!it->is_number_integer()) {
            return invalid_config("'port' must be an integer.");
        }
        // Unsigned values above INT64_MAX would wrap when read as signed.
        const bool in_range = it->is_number_unsigned()
                                  ? it->get<std::uint64_t>() <= 65535u
                                  : it->get<std::int64_t>() >= 0 && it->get<std::int64_t>() <= 65535;
        if (!in_range) {
            return invalid_config("'port' must be between 0 and 65535.");
        }
        config.port = static_cast<int>(it->get<std::int64_t>());
    }

    std::string mode = to_string(config.mode);
    if ((error = read_string(payload, "mode", mode))) return *error;
    const auto parsed_mode = parse_deployment_mode(mode);
    if (!parsed_mode) {
        return invalid_config("Unknown deployment mode: " + mode);
    }
    config.mode = *parsed_mode;

    std::string response_type = to_string(config.response_type);
    if ((error = read_string(payload, "response_type", response_type))) return *error;
    const auto parsed_type = parse_response_type(response_type);
    if (!parsed_type) {
        return invalid_config("Unknown response type: " + response_type);
    }
    config.response_type = *parsed_type;

    if ((error = read_string(payload, "endpoint_path", config.endpoint_path))) return *error;
    if ((error = read_bool(payload, "stream", config.stream))) return *error;
    if ((error = read_string_list(payload, "requirements", config.requirements))) return *error;
    if ((error = read_string_list(payload, "extra_packages", config.extra_packages))) return *error;

    if (const auto it = payload.find("environment"); it != payload.end() && !it->is_null()) {
        if (!it->is_object()) {
            return invalid_config("'environment' must be an object of strings.");
        }
        for (const auto& item : it->items()) {
            if (!item.value().is_string()) {
                return invalid_config("environment value for '" + item.key() +
                                      "' must be a string.");
            }
            config.environment[item.key()] = item.value().get<std::string>();
        }
    }

    if ((error = read_seconds(payload, "deploy_timeout", config.deploy_timeout))) return *error;
    if ((error = read_seconds(payload, "shutdown_timeout", config.shutdown_timeout))) return *error;
    if ((error = read_bool(payload, "health_check", config.health_check))) return *error;
    if ((error = read_bool(payload, "handle_signals", config.handle_signals))) return *error;

    std::string pid_dir = config.pid_dir.string();
    if ((error = read_string(payload, "pid_dir", pid_dir))) return *error;
    config.pid_dir = pid_dir;

    auto valid = validate(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    return config;
}

core::errors::Result<DeployConfig> load_deploy_config(const std::filesystem::path& path,
                                                      const DeployConfig& base) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return invalid_config("Configuration file does not exist: " + path.string());
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return invalid_config("Failed to open configuration file: " + path.string());
    }

    json payload = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded()) {
        return invalid_config("Configuration file is not valid JSON: " + path.string());
    }
    return deploy_config_from_json(payload, base);
}

json deploy_config_to_json(const DeployConfig& config) {
    json payload;
    payload["host"] = config.host;
    payload["port"] = config.port;
    payload["mode"] = to_string(config.mode);
    payload["endpoint_path"] = config.endpoint_path;
    payload["response_type"] = to_string(config.response_type);
    payload["stream"] = config.stream;
    payload["requirements"] = config.requirements;
    payload["extra_packages"] = config.extra_packages;
    payload["environment"] = config.environment;
    payload["deploy_timeout"] = static_cast<double>(config.deploy_timeout.count()) / 1000.0;
    payload["shutdown_timeout"] = static_cast<double>(config.shutdown_timeout.count()) / 1000.0;
    payload["health_check"] = config.health_check;
    payload["pid_dir"] = config.pid_dir.string();
    payload["handle_signals"] = config.handle_signals;
    return payload;
}

}  // namespace agentrt::core::config
