#include "process/exit_slot.hpp"

bool ExitSlot::put(const ProcError& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (value_) return false;
        value_ = result;
    }
    cv_.notify_all();
    return true;
}

bool ExitSlot::ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_.has_value();
}

ProcError ExitSlot::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return value_.has_value(); });
    return *value_;
}

std::optional<ProcError> ExitSlot::wait_until(const Deadline& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!value_) {
        if (deadline.expired()) return std::nullopt;
        if (deadline.unbounded()) {
            cv_.wait(lock);
        } else {
            cv_.wait_until(lock, deadline.next_wakeup());
        }
    }
    return value_;
}
