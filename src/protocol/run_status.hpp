#pragma once

#include <optional>
#include <string>

namespace agentrt::protocol {

enum class RunStatus {
    Created,
    InProgress,
    Completed,
    Failed,
    Canceled,
    Rejected
};

inline std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Created:
            return "created";
        case RunStatus::InProgress:
            return "in_progress";
        case RunStatus::Completed:
            return "completed";
        case RunStatus::Failed:
            return "failed";
        case RunStatus::Canceled:
            return "canceled";
        case RunStatus::Rejected:
            return "rejected";
        default:
            return "unknown";
    }
}

inline std::optional<RunStatus> parse_run_status(const std::string& text) {
    if (text == "created") return RunStatus::Created;
    if (text == "in_progress") return RunStatus::InProgress;
    if (text == "completed") return RunStatus::Completed;
    if (text == "failed") return RunStatus::Failed;
    if (text == "canceled") return RunStatus::Canceled;
    if (text == "rejected") return RunStatus::Rejected;
    return std::nullopt;
}

// Terminal statuses end a response envelope; nothing may follow them.
inline bool is_terminal(const RunStatus status) {
    return status == RunStatus::Completed || status == RunStatus::Failed ||
           status == RunStatus::Canceled || status == RunStatus::Rejected;
}

}  // namespace agentrt::protocol
