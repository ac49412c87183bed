#include "core/deadline.hpp"

#include <algorithm>

Deadline Deadline::none() {
    return Deadline();
}

Deadline Deadline::after(Clock::duration timeout) {
    return at(Clock::now() + timeout);
}

Deadline Deadline::at(Clock::time_point when) {
    Deadline d;
    d.when_ = when;
    return d;
}

Deadline Deadline::with_cancel(const std::atomic<bool>* flag) const {
    Deadline d = *this;
    d.cancel_flag_ = flag;
    return d;
}

bool Deadline::cancelled() const {
    return cancel_flag_ != nullptr && cancel_flag_->load();
}

bool Deadline::expired() const {
    if (cancelled()) return true;
    return when_ && Clock::now() >= *when_;
}

Deadline::Clock::time_point Deadline::next_wakeup() const {
    auto wake = when_ ? *when_ : Clock::time_point::max();
    if (cancel_flag_ != nullptr) {
        wake = std::min(wake, Clock::now() + kCancelPollInterval);
    }
    return wake;
}
