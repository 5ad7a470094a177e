#include "platform/linux/eventfd_dispatcher.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <print>
#include <sys/eventfd.h>
#include <unistd.h>

EventFdDispatcher::EventFdDispatcher() = default;

EventFdDispatcher::~EventFdDispatcher() {
    if (event_fd_ >= 0) ::close(event_fd_);
}

bool EventFdDispatcher::init() {
    event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

void EventFdDispatcher::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    if (event_fd_ >= 0) {
        uint64_t val = 1;
        if (::write(event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
            std::println(stderr, "dispatcher: eventfd write failed: {}", std::strerror(errno));
        }
    }
}

size_t EventFdDispatcher::drain() {
    if (event_fd_ >= 0) {
        uint64_t val;
        ::read(event_fd_, &val, sizeof(val));
    }

    size_t ran = 0;
    for (;;) {
        std::deque<Task> batch;
        {
            std::lock_guard lock(mutex_);
            batch.swap(tasks_);
        }
        if (batch.empty()) break;

        for (auto& task : batch) {
            try {
                task();
            } catch (const std::exception& e) {
                std::println(stderr, "dispatcher: task failed: {}", e.what());
            }
            ++ran;
        }
    }
    return ran;
}
