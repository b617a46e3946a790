#pragma once

#include <cstdint>

namespace agentrt::runtime {

// Numbers the events of a single stream: 0, 1, 2, ...
// One instance per stream; not shared between threads.
class Sequencer {
public:
    std::int64_t next() { return next_++; }

    std::int64_t issued() const { return next_; }

private:
    std::int64_t next_ = 0;
};

}  // namespace agentrt::runtime
