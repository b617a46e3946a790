#pragma once

#include <chrono>
#include <string>

namespace agentrt::deploy {

struct ProbeTarget {
    std::string host = "127.0.0.1";
    int port = 8000;
    std::chrono::milliseconds connect_timeout{100};
    std::chrono::milliseconds health_timeout{2000};
    bool health_check = true;
    // When set, /health must report this pid. Keeps another listener on the
    // same port from passing for a detached child.
    long expected_pid = 0;
};

// One TCP connect attempt bounded by connect_timeout.
bool port_accepts_connections(const std::string& host, int port,
                              std::chrono::milliseconds timeout);

// GET /health answered with 200 (and the expected pid, if any).
bool health_endpoint_ok(const ProbeTarget& target);

// A single readiness attempt: connect, then /health when health_check or
// expected_pid is set.
bool probe_once(const ProbeTarget& target);

}  // namespace agentrt::deploy
