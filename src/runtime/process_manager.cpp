#include "runtime/process_manager.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <optional>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace agentrt::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};
constexpr const char* kPidToken = "{pid}";
constexpr int kResetSignals[] = {SIGTERM, SIGINT, SIGHUP, SIGQUIT, SIGPIPE, SIGUSR1, SIGUSR2};

// Owns argv/envp storage so the child can use raw pointers after fork().
struct CStringArray {
    explicit CStringArray(std::vector<std::string> items) : storage(std::move(items)) {
        pointers.reserve(storage.size() + 1);
        for (auto& item : storage) {
            pointers.push_back(item.data());
        }
        pointers.push_back(nullptr);
    }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** it = environ; it != nullptr && *it != nullptr; ++it) {
        const std::string entry(*it);
        const auto eq = entry.find('=');
        if (eq != std::string::npos && overrides.count(entry.substr(0, eq)) > 0) {
            continue;
        }
        entries.push_back(entry);
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

// execvp searches PATH after fork; do the lookup up front instead. An
// unresolved name is passed through so execve fails in the child.
std::string resolve_program(const std::string& program,
                            const std::map<std::string, std::string>& environment) {
    if (program.find('/') != std::string::npos) {
        return program;
    }
    std::string search_path;
    if (const auto it = environment.find("PATH"); it != environment.end()) {
        search_path = it->second;
    } else if (const char* inherited = std::getenv("PATH")) {
        search_path = inherited;
    } else {
        search_path = "/usr/bin:/bin";
    }

    std::size_t start = 0;
    while (start <= search_path.size()) {
        const auto end = search_path.find(':', start);
        std::string dir = search_path.substr(start, end == std::string::npos ? std::string::npos
                                                                              : end - start);
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return program;
}

// Log path split around "{pid}", with room for the digits, so the child
// can fill it in without allocating.
struct LogPathTemplate {
    std::string prefix;
    std::string suffix;
    bool has_token = false;
    std::vector<char> buffer;

    explicit LogPathTemplate(const std::filesystem::path& pattern) {
        const std::string text = pattern.string();
        const auto pos = text.find(kPidToken);
        has_token = pos != std::string::npos;
        prefix = has_token ? text.substr(0, pos) : text;
        suffix = has_token ? text.substr(pos + std::strlen(kPidToken)) : std::string();
        buffer.assign(prefix.size() + suffix.size() + 24, '\0');
    }

    // Async-signal-safe.
    const char* render(pid_t pid) {
        char* out = buffer.data();
        std::memcpy(out, prefix.data(), prefix.size());
        out += prefix.size();
        if (has_token) {
            char digits[20];
            int count = 0;
            auto value = static_cast<unsigned long>(pid);
            do {
                digits[count++] = static_cast<char>('0' + value % 10);
                value /= 10;
            } while (value != 0 && count < 20);
            while (count > 0) {
                *out++ = digits[--count];
            }
            std::memcpy(out, suffix.data(), suffix.size());
            out += suffix.size();
        }
        *out = '\0';
        return buffer.data();
    }
};

// Runs in the child between fork() and execve(): async-signal-safe calls only.
[[noreturn]] void exec_child(const char* program, char* const* argv, char* const* envp,
                             const char* working_directory, LogPathTemplate* log_path,
                             const sigset_t& empty_mask, const struct sigaction& default_action) {
    if (setsid() < 0) {
        _exit(125);
    }
    for (const int signo : kResetSignals) {
        static_cast<void>(sigaction(signo, &default_action, nullptr));
    }
    static_cast<void>(sigprocmask(SIG_SETMASK, &empty_mask, nullptr));

    if (working_directory != nullptr && chdir(working_directory) != 0) {
        _exit(126);
    }

    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        static_cast<void>(dup2(null_fd, STDIN_FILENO));
        static_cast<void>(close(null_fd));
    }
    if (log_path != nullptr) {
        const int log_fd = open(log_path->render(getpid()), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (log_fd < 0) {
            _exit(126);
        }
        static_cast<void>(dup2(log_fd, STDOUT_FILENO));
        static_cast<void>(dup2(log_fd, STDERR_FILENO));
        static_cast<void>(close(log_fd));
    }

    execve(program, argv, envp);
    _exit(127);
}

}  // namespace

std::string expand_pid_token(const std::filesystem::path& pattern, const pid_t pid) {
    std::string text = pattern.string();
    const auto pos = text.find(kPidToken);
    if (pos != std::string::npos) {
        text.replace(pos, std::strlen(kPidToken), std::to_string(pid));
    }
    return text;
}

core::errors::Result<pid_t> ProcessManager::start_detached(const LaunchSpec& spec) const {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return AgentError{ErrorCategory::Internal, "Detached launch needs a command.",
                          "launch_failed"};
    }

    const std::string program = resolve_program(spec.argv.front(), spec.environment);
    CStringArray argv(spec.argv);
    CStringArray envp(merged_environment(spec.environment));
    const std::string working_directory = spec.working_directory.string();
    std::optional<LogPathTemplate> log_path;
    if (!spec.log_path.empty()) {
        log_path.emplace(spec.log_path);
    }

    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    struct sigaction default_action {};
    default_action.sa_handler = SIG_DFL;
    sigemptyset(&default_action.sa_mask);

    std::fflush(stdout);
    std::fflush(stderr);
    const pid_t pid = fork();
    if (pid < 0) {
        return AgentError{ErrorCategory::Internal, "Failed to fork process.", "launch_failed"};
    }

    if (pid == 0) {
        exec_child(program.c_str(), argv.pointers.data(), envp.pointers.data(),
                   working_directory.empty() ? nullptr : working_directory.c_str(),
                   log_path ? &*log_path : nullptr, empty_mask, default_action);
    }

    return pid;
}

bool ProcessManager::is_alive(const pid_t pid) const {
    if (pid <= 0) {
        return false;
    }

    int status = 0;
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
        return false;
    }
    if (waited == 0) {
        return true;
    }
    // Not our child: fall back to probing with signal 0.
    return kill(pid, 0) == 0 || errno == EPERM;
}

core::errors::Result<bool> ProcessManager::terminate(const pid_t pid,
                                                     const std::chrono::milliseconds timeout) const {
    if (pid <= 0) {
        return AgentError{ErrorCategory::Internal, "Invalid process id: " + std::to_string(pid),
                          "invalid_pid"};
    }
    if (!is_alive(pid)) {
        return true;
    }

    if (kill(pid, SIGTERM) != 0 && errno != ESRCH) {
        return AgentError{ErrorCategory::Internal,
                          "Failed to signal process " + std::to_string(pid) + ".",
                          "signal_failed"};
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!is_alive(pid)) {
            return true;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        return AgentError{ErrorCategory::Internal,
                          "Failed to kill process " + std::to_string(pid) + ".",
                          "signal_failed"};
    }
    int status = 0;
    if (waitpid(pid, &status, 0) < 0 && errno == ECHILD) {
        // Someone else's child; give the kernel a moment to tear it down.
        for (int attempt = 0; attempt < 20 && kill(pid, 0) == 0; ++attempt) {
            std::this_thread::sleep_for(kPollInterval);
        }
    }
    return false;
}

core::errors::Result<ProcessStatus> ProcessManager::query_status(const pid_t pid) const {
    const std::string proc_dir = "/proc/" + std::to_string(pid);
    std::ifstream stat_in(proc_dir + "/stat");
    if (!stat_in.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Process " + std::to_string(pid) + " is not running.",
                          "process_not_found"};
    }
    std::string stat_line;
    std::getline(stat_in, stat_line);

    // The command name may contain spaces; fields resume after the last ')'.
    const auto name_end = stat_line.rfind(')');
    if (name_end == std::string::npos) {
        return AgentError{ErrorCategory::Internal, "Unreadable /proc stat for process " +
                                                       std::to_string(pid) + ".",
                          "process_status_failed"};
    }
    std::istringstream fields(stat_line.substr(name_end + 2));
    std::vector<std::string> values;
    std::string value;
    while (fields >> value) {
        values.push_back(value);
    }
    // values[0] is field 3 (state); utime=14, stime=15, starttime=22.
    constexpr std::size_t kUtime = 14 - 3;
    constexpr std::size_t kStime = 15 - 3;
    constexpr std::size_t kStartTime = 22 - 3;
    if (values.size() <= kStartTime) {
        return AgentError{ErrorCategory::Internal, "Truncated /proc stat for process " +
                                                       std::to_string(pid) + ".",
                          "process_status_failed"};
    }

    ProcessStatus status;
    status.pid = pid;
    status.state = values[0];

    const double ticks = static_cast<double>(sysconf(_SC_CLK_TCK));
    const double cpu_seconds =
        (std::strtod(values[kUtime].c_str(), nullptr) + std::strtod(values[kStime].c_str(), nullptr)) /
        ticks;
    const double started_at = std::strtod(values[kStartTime].c_str(), nullptr) / ticks;

    double system_uptime = 0.0;
    std::ifstream uptime_in("/proc/uptime");
    if (uptime_in >> system_uptime) {
        status.uptime_seconds = system_uptime > started_at ? system_uptime - started_at : 0.0;
    }
    if (status.uptime_seconds > 0.0) {
        status.cpu_percent = cpu_seconds / status.uptime_seconds * 100.0;
    }

    std::ifstream statm_in(proc_dir + "/statm");
    std::int64_t total_pages = 0;
    std::int64_t resident_pages = 0;
    if (statm_in >> total_pages >> resident_pages) {
        status.rss_bytes = resident_pages * static_cast<std::int64_t>(sysconf(_SC_PAGESIZE));
    }
    return status;
}

}  // namespace agentrt::runtime
