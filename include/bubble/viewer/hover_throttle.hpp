#pragma once

#include <chrono>
#include <optional>

#include "bubble/config.hpp"

namespace bubble::viewer {

// Limits hover hit-testing to one update per interval. Panning does not go
// through this.
class HoverThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit HoverThrottle(
        std::chrono::milliseconds interval =
            std::chrono::milliseconds(static_cast<int>(constants::kHoverThrottle_ms)));

    // True when no update was accepted yet or the interval has elapsed since
    // the last accepted one; accepting records now.
    bool ShouldUpdate(Clock::time_point now);
    void Reset();

    std::chrono::milliseconds Interval() const { return interval_; }

private:
    std::chrono::milliseconds interval_;
    std::optional<Clock::time_point> lastAccepted_;
};

}  // namespace bubble::viewer
