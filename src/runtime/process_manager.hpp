#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace agentrt::runtime {

struct LaunchSpec {
    // Program and arguments. argv[0] is looked up on PATH when it has no '/'.
    std::vector<std::string> argv;
    std::filesystem::path working_directory;
    std::map<std::string, std::string> environment;
    // stdout and stderr of the child; empty keeps the parent's. A "{pid}"
    // token is replaced with the child's pid.
    std::filesystem::path log_path;
};

std::string expand_pid_token(const std::filesystem::path& pattern, pid_t pid);

struct ProcessStatus {
    pid_t pid = 0;
    std::string state;  // Single-letter state from /proc, e.g. "S"
    std::int64_t rss_bytes = 0;
    double cpu_percent = 0.0;
    double uptime_seconds = 0.0;
};

class ProcessManager {
public:
    // Forks and execs spec.argv in a new session so it outlives the parent.
    // Everything the child needs is built before fork(); between fork() and
    // execve() the child only makes async-signal-safe calls. The child starts
    // with an empty signal mask and default dispositions.
    core::errors::Result<pid_t> start_detached(const LaunchSpec& spec) const;

    // Reaps the child if it already exited.
    bool is_alive(pid_t pid) const;

    // SIGTERM, then SIGKILL once timeout elapses. Value is true when the
    // process exited without SIGKILL.
    core::errors::Result<bool> terminate(pid_t pid, std::chrono::milliseconds timeout) const;

    core::errors::Result<ProcessStatus> query_status(pid_t pid) const;
};

}  // namespace agentrt::runtime
