#include "deploy/pid_file.hpp"

#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace agentrt::deploy {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

json record_to_json(const DeploymentRecord& record) {
    json payload;
    payload["deploy_id"] = record.deploy_id;
    payload["mode"] = core::config::to_string(record.mode);
    payload["host"] = record.host;
    payload["port"] = record.port;
    payload["pid"] = record.pid.has_value() ? json(record.pid.value()) : json(nullptr);
    payload["url"] = record.url;
    return payload;
}

// Optional typed field. A missing or null value leaves `out` untouched.
template <typename T, typename Check>
bool read_field(const json& payload, const char* key, Check is_type, T& out) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return true;
    }
    if (!((*it).*is_type)()) {
        return false;
    }
    out = it->get<T>();
    return true;
}

}  // namespace

PidFileStore::PidFileStore(std::filesystem::path pid_dir) : pid_dir_(std::move(pid_dir)) {}

core::errors::Result<std::filesystem::path> PidFileStore::file_path(
    const std::string& deploy_id, const std::string& extension) const {
    if (deploy_id.empty() || deploy_id.find('/') != std::string::npos) {
        return AgentError{ErrorCategory::Validation, "Invalid deployment id: '" + deploy_id + "'.",
                          "invalid_deploy_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(pid_dir_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create PID directory: " + pid_dir_.string(),
                          "pid_file_dir_failed"};
    }
    return pid_dir_ / (deploy_id + extension);
}

core::errors::Result<std::filesystem::path> PidFileStore::pid_path(
    const std::string& deploy_id) const {
    return file_path(deploy_id, ".pid");
}

core::errors::Result<std::filesystem::path> PidFileStore::log_path(
    const std::string& deploy_id) const {
    return file_path(deploy_id, ".log");
}

core::errors::Result<std::filesystem::path> PidFileStore::write(
    const DeploymentRecord& record) const {
    if (!record.pid.has_value()) {
        return AgentError{ErrorCategory::Internal,
                          "Deployment " + record.deploy_id + " has no process id to record.",
                          "pid_file_write_failed"};
    }

    auto pid_file = pid_path(record.deploy_id);
    if (core::errors::is_error(pid_file)) {
        return core::errors::get_error(pid_file);
    }
    const auto path = core::errors::get_value(pid_file);

    {
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open()) {
            return AgentError{ErrorCategory::Internal, "Unable to open PID file: " + path.string(),
                              "pid_file_open_failed"};
        }
        out << record.pid.value() << "\n";
        if (!out.good()) {
            return AgentError{ErrorCategory::Internal, "Unable to write PID file: " + path.string(),
                              "pid_file_write_failed"};
        }
    }

    const auto record_path = pid_dir_ / (record.deploy_id + ".json");
    std::ofstream out(record_path, std::ios::trunc);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to open deployment record: " + record_path.string(),
                          "pid_file_open_failed"};
    }
    out << record_to_json(record).dump(2) << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to write deployment record: " + record_path.string(),
                          "pid_file_write_failed"};
    }
    return path;
}

core::errors::Result<pid_t> PidFileStore::read(const std::string& deploy_id) const {
    auto pid_file = pid_path(deploy_id);
    if (core::errors::is_error(pid_file)) {
        return core::errors::get_error(pid_file);
    }
    const auto path = core::errors::get_value(pid_file);

    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Internal, "PID file does not exist: " + path.string(),
                          "pid_file_missing"};
    }
    long pid = 0;
    if (!(in >> pid) || pid <= 0) {
        return AgentError{ErrorCategory::Internal, "PID file is corrupt: " + path.string(),
                          "pid_file_corrupt"};
    }
    return static_cast<pid_t>(pid);
}

core::errors::Result<DeploymentRecord> PidFileStore::read_record(
    const std::string& deploy_id) const {
    auto pid = read(deploy_id);
    if (core::errors::is_error(pid)) {
        return core::errors::get_error(pid);
    }

    const auto record_path = pid_dir_ / (deploy_id + ".json");
    std::ifstream in(record_path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Deployment record does not exist: " + record_path.string(),
                          "pid_file_missing"};
    }
    const json payload = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded() || !payload.is_object()) {
        return AgentError{ErrorCategory::Internal,
                          "Deployment record is corrupt: " + record_path.string(),
                          "pid_file_corrupt"};
    }

    DeploymentRecord record;
    record.deploy_id = deploy_id;
    std::string mode;
    std::int64_t port = 0;
    const bool well_formed =
        read_field(payload, "deploy_id", &json::is_string, record.deploy_id) &&
        read_field(payload, "mode", &json::is_string, mode) &&
        read_field(payload, "host", &json::is_string, record.host) &&
        read_field(payload, "port", &json::is_number_integer, port) &&
        read_field(payload, "url", &json::is_string, record.url);
    if (!well_formed || port < 0 || port > 65535) {
        return AgentError{ErrorCategory::Internal,
                          "Deployment record has malformed fields: " + record_path.string(),
                          "pid_file_corrupt"};
    }
    record.mode = core::config::parse_deployment_mode(mode).value_or(
        core::config::DeploymentMode::DetachedProcess);
    record.port = static_cast<int>(port);
    record.pid = core::errors::get_value(pid);
    return record;
}

core::errors::Result<bool> PidFileStore::remove(const std::string& deploy_id) const {
    auto pid_file = pid_path(deploy_id);
    if (core::errors::is_error(pid_file)) {
        return core::errors::get_error(pid_file);
    }

    std::error_code ec;
    const bool removed = std::filesystem::remove(core::errors::get_value(pid_file), ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to remove PID file: " + core::errors::get_value(pid_file).string(),
                          "pid_file_remove_failed"};
    }
    std::filesystem::remove(pid_dir_ / (deploy_id + ".json"), ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to remove deployment record for " + deploy_id,
                          "pid_file_remove_failed"};
    }
    return removed;
}

}  // namespace agentrt::deploy
