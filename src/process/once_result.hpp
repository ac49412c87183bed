#pragma once

#include "core/proc_error.hpp"

#include <mutex>

/// Runs a termination body at most once. Concurrent callers block until the
/// first run finishes; every caller gets the recorded result.
class OnceResult {
public:
    template <typename Fn>
    ProcError run(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!done_) {
            result_ = fn();
            done_ = true;
        }
        return result_;
    }

    bool done() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return done_;
    }

private:
    mutable std::mutex mutex_;
    bool done_ = false;
    ProcError result_;
};
