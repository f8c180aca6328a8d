#pragma once

#include <chrono>
#include <cstdint>

namespace llmgate {

// Millisecond time source. The governor only compares differences, so any
// monotonic origin works there; task and link timestamps need wall-clock time.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now_ms() const = 0;
};

class SteadyClock : public Clock {
public:
    int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }
};

// Milliseconds since the Unix epoch.
class SystemClock : public Clock {
public:
    int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

}
