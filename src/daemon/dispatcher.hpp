#pragma once

#include <functional>

// Hands work to the daemon's single logical thread. post() may be called from
// any thread; tasks run later, in post order, on the loop thread.
class Dispatcher {
public:
    using Task = std::function<void()>;

    virtual ~Dispatcher() = default;
    virtual void post(Task task) = 0;
};
