#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

// Holds the PCM of one capture session between the PipeWire process thread
// (sole writer) and the loop thread (sole reader). Positions only grow; the
// slot is pos % capacity. A write that does not fit is cut short and the
// missing bytes are counted instead of blocking the audio thread.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_bytes)
        : buf_(capacity_bytes), capacity_(capacity_bytes) {}

    size_t write(const void* data, size_t len) {
        size_t head = write_pos_.load(std::memory_order_relaxed);
        size_t tail = read_pos_.load(std::memory_order_acquire);

        size_t n = std::min(len, capacity_ - (head - tail));
        if (n < len) {
            dropped_.fetch_add(len - n, std::memory_order_relaxed);
        }
        if (n > 0) {
            copy_in(head % capacity_, static_cast<const uint8_t*>(data), n);
            write_pos_.store(head + n, std::memory_order_release);
        }
        return n;
    }

    size_t read(void* dest, size_t max_len) {
        size_t tail = read_pos_.load(std::memory_order_relaxed);
        size_t head = write_pos_.load(std::memory_order_acquire);

        size_t n = std::min(max_len, head - tail);
        if (n > 0) {
            copy_out(tail % capacity_, static_cast<uint8_t*>(dest), n);
            read_pos_.store(tail + n, std::memory_order_release);
        }
        return n;
    }

    // Whole int16 samples buffered so far. An odd trailing byte stays put.
    std::vector<int16_t> drain_samples() {
        std::vector<int16_t> samples(available() / sizeof(int16_t));
        if (!samples.empty()) {
            read(samples.data(), samples.size() * sizeof(int16_t));
        }
        return samples;
    }

    size_t available() const {
        return write_pos_.load(std::memory_order_acquire) -
               read_pos_.load(std::memory_order_acquire);
    }

    size_t free_space() const { return capacity_ - available(); }
    size_t capacity() const { return capacity_; }

    // Bytes lost to a full buffer since the last reset().
    size_t dropped_bytes() const { return dropped_.load(std::memory_order_relaxed); }

    // Only while the writer is stopped, between sessions.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    void copy_in(size_t slot, const uint8_t* src, size_t n) {
        size_t first = std::min(n, capacity_ - slot);
        std::memcpy(buf_.data() + slot, src, first);
        std::memcpy(buf_.data(), src + first, n - first);
    }

    void copy_out(size_t slot, uint8_t* dst, size_t n) const {
        size_t first = std::min(n, capacity_ - slot);
        std::memcpy(dst, buf_.data() + slot, first);
        std::memcpy(dst + first, buf_.data(), n - first);
    }

    std::vector<uint8_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
