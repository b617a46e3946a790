#include "service/signal_watcher.hpp"

#include <ctime>
#include <string>
#include <utility>

namespace agentrt::service {

namespace {

constexpr long kWaitSliceNanos = 200L * 1000L * 1000L;

}  // namespace

SignalWatcher::SignalWatcher(Callback on_signal, std::shared_ptr<core::logging::Logger> logger,
                             std::vector<int> signals)
    : on_signal_(std::move(on_signal)),
      logger_(logger ? std::move(logger) : core::logging::Logger::make_default("signals")) {
    sigemptyset(&watched_);
    for (const int signo : signals) {
        sigaddset(&watched_, signo);
    }
    sigemptyset(&previous_);
    static_cast<void>(pthread_sigmask(SIG_BLOCK, &watched_, &previous_));
    thread_ = std::thread([this]() { watch(); });
}

SignalWatcher::~SignalWatcher() { stop(); }

void SignalWatcher::stop() {
    stopping_.store(true);
    if (thread_.joinable()) {
        thread_.join();
        static_cast<void>(pthread_sigmask(SIG_SETMASK, &previous_, nullptr));
    }
}

void SignalWatcher::watch() {
    const timespec slice{0, kWaitSliceNanos};
    while (!stopping_.load()) {
        siginfo_t info{};
        const int signo = sigtimedwait(&watched_, &info, &slice);
        if (signo < 0) {
            // EAGAIN: the slice elapsed. EINTR: interrupted by an unrelated signal.
            continue;
        }
        received_.fetch_add(1);
        AGENTRT_LOG_INFO(logger_, "SignalWatcher: received signal " + std::to_string(signo));
        if (on_signal_) {
            on_signal_(signo);
        }
    }
}

}  // namespace agentrt::service
