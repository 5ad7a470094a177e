#pragma once

#include <exception>
#include <functional>
#include <print>
#include <utility>
#include <vector>

// Single-slot "current session has fully settled" signal.
//
// begin() opens the slot (no-op when already open), resolve() runs every
// waiter once and empties the slot, wait() runs the continuation when the
// slot settles, or right away when nothing is pending. Everything happens on
// the loop thread; there is no locking.
class SessionGate {
public:
    using Continuation = std::function<void()>;

    bool begin() {
        if (pending_) return false;
        pending_ = true;
        return true;
    }

    bool resolve() {
        if (!pending_) return false;
        pending_ = false;

        // Waiters may begin() a new slot; they must not see this one's list.
        auto waiters = std::exchange(waiters_, {});
        for (auto& waiter : waiters) {
            run(waiter);
        }
        return true;
    }

    void wait(Continuation next) {
        if (!pending_) {
            run(next);
            return;
        }
        waiters_.push_back(std::move(next));
    }

    bool pending() const { return pending_; }
    size_t waiter_count() const { return waiters_.size(); }

private:
    static void run(Continuation& next) {
        if (!next) return;
        try {
            next();
        } catch (const std::exception& e) {
            std::println(stderr, "session: lifecycle waiter failed: {}", e.what());
        }
    }

    bool pending_ = false;
    std::vector<Continuation> waiters_;
};
