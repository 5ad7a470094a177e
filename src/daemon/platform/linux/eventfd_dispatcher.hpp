#pragma once

#include "dispatcher.hpp"

#include <deque>
#include <mutex>

// Queues tasks and wakes the epoll loop through an eventfd. drain() runs on
// the loop thread when fd() becomes readable.
class EventFdDispatcher : public Dispatcher {
public:
    EventFdDispatcher();
    ~EventFdDispatcher() override;

    EventFdDispatcher(const EventFdDispatcher&) = delete;
    EventFdDispatcher& operator=(const EventFdDispatcher&) = delete;

    bool init();
    int fd() const { return event_fd_; }

    void post(Task task) override;

    // Runs queued tasks until the queue is empty, including tasks they post.
    // Returns how many ran.
    size_t drain();

private:
    int event_fd_ = -1;
    std::mutex mutex_;
    std::deque<Task> tasks_;
};
