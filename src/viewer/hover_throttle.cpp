#include "bubble/viewer/hover_throttle.hpp"

namespace bubble::viewer {

HoverThrottle::HoverThrottle(std::chrono::milliseconds interval) : interval_(interval) {}

bool HoverThrottle::ShouldUpdate(Clock::time_point now) {
    if (lastAccepted_.has_value() && (now - *lastAccepted_) < interval_) {
        return false;
    }
    lastAccepted_ = now;
    return true;
}

void HoverThrottle::Reset() {
    lastAccepted_.reset();
}

}  // namespace bubble::viewer
