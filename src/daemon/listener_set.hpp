#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <print>
#include <utility>
#include <vector>

// Subscribers to the recording flag. notify() walks a snapshot, so listeners
// may unsubscribe themselves or others while being called. The handle from
// subscribe() only holds a weak reference and is safe after the set is gone.
class ListenerSet {
public:
    using Listener = std::function<void(bool)>;
    using Unsubscribe = std::function<void()>;

    ListenerSet() : entries_(std::make_shared<Entries>()) {}

    Unsubscribe subscribe(Listener listener) {
        uint64_t id = next_id_++;
        entries_->emplace(id, std::move(listener));

        std::weak_ptr<Entries> weak = entries_;
        return [weak, id] {
            if (auto entries = weak.lock()) {
                entries->erase(id);
            }
        };
    }

    // Returns the number of listeners that threw.
    size_t notify(bool recording) const {
        std::vector<Listener> snapshot;
        snapshot.reserve(entries_->size());
        for (auto& [id, listener] : *entries_) {
            snapshot.push_back(listener);
        }

        size_t failures = 0;
        for (auto& listener : snapshot) {
            try {
                listener(recording);
            } catch (const std::exception& e) {
                ++failures;
                std::println(stderr, "recorder: toggle listener failed: {}", e.what());
            }
        }
        return failures;
    }

    void clear() { entries_->clear(); }
    size_t size() const { return entries_->size(); }
    bool empty() const { return entries_->empty(); }

private:
    using Entries = std::map<uint64_t, Listener>;

    std::shared_ptr<Entries> entries_;
    uint64_t next_id_ = 1;
};
