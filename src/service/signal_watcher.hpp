#pragma once

#include <atomic>
#include <functional>
#include <signal.h>
#include <thread>
#include <vector>
#include "core/logging/logger.hpp"

namespace agentrt::service {

// Blocks the given signals in the calling thread (and every thread it starts
// afterwards) and waits for them on a dedicated thread with sigtimedwait.
// The callback runs on that thread, once per received signal.
class SignalWatcher {
public:
    using Callback = std::function<void(int)>;

    SignalWatcher(Callback on_signal, std::shared_ptr<core::logging::Logger> logger,
                  std::vector<int> signals = {SIGINT, SIGTERM});
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Restores the previous signal mask of the constructing thread.
    void stop();

    int received_count() const { return received_.load(); }

private:
    void watch();

    Callback on_signal_;
    std::shared_ptr<core::logging::Logger> logger_;
    sigset_t watched_{};
    sigset_t previous_{};
    std::atomic<bool> stopping_{false};
    std::atomic<int> received_{0};
    std::thread thread_;
};

}  // namespace agentrt::service
