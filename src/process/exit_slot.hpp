#pragma once

#include "core/deadline.hpp"
#include "core/proc_error.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>

/// One-shot cell carrying a process's terminal result from the reaper to
/// any number of readers. The first put() wins and never blocks; every
/// read after that returns the same stored value.
class ExitSlot {
public:
    /// Store the result. Returns false if a value was already stored.
    bool put(const ProcError& result);

    /// True once a value has been stored
    bool ready() const;

    /// Block until a value is stored
    ProcError wait();

    /// Block until a value is stored or the deadline expires (nullopt)
    std::optional<ProcError> wait_until(const Deadline& deadline);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<ProcError> value_;
};
