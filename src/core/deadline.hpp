#pragma once

#include <atomic>
#include <chrono>
#include <optional>

/// A point in time after which a blocking operation gives up, optionally
/// combined with a cancellation flag owned by the caller.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    /// How often a blocked waiter re-checks the cancellation flag
    static constexpr std::chrono::milliseconds kCancelPollInterval{10};

    Deadline() = default;

    static Deadline none();
    static Deadline after(Clock::duration timeout);
    static Deadline at(Clock::time_point when);

    /// Copy of this deadline that also expires once *flag becomes true.
    /// The flag must outlive every wait using the returned deadline.
    Deadline with_cancel(const std::atomic<bool>* flag) const;

    bool expired() const;
    bool cancelled() const;
    bool unbounded() const { return !when_ && cancel_flag_ == nullptr; }

    /// Latest time a waiter may sleep until before checking expired() again
    Clock::time_point next_wakeup() const;

    std::optional<Clock::time_point> when() const { return when_; }

private:
    std::optional<Clock::time_point> when_;
    const std::atomic<bool>* cancel_flag_ = nullptr;
};
