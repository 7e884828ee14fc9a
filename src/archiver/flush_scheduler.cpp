#include "flush_scheduler.hpp"

FlushScheduler::FlushScheduler(size_t max_bytes, std::chrono::milliseconds interval)
    : max_bytes_(max_bytes),
      interval_(interval),
      bytes_since_flush_(0),
      last_flush_time_(std::chrono::steady_clock::now()) {
}

bool FlushScheduler::recordDelivered(size_t bytes) {
    size_t total = bytes_since_flush_.fetch_add(bytes) + bytes;
    return total >= max_bytes_;
}

bool FlushScheduler::isDue() const {
    return bytes_since_flush_.load() >= max_bytes_ || isIntervalElapsed();
}

bool FlushScheduler::isIntervalElapsed() const {
    std::lock_guard<std::mutex> lock(time_mutex_);
    return std::chrono::steady_clock::now() - last_flush_time_ >= interval_;
}

void FlushScheduler::markFlushed() {
    bytes_since_flush_.store(0);
    std::lock_guard<std::mutex> lock(time_mutex_);
    last_flush_time_ = std::chrono::steady_clock::now();
}

std::chrono::seconds FlushScheduler::getTimeSinceFlush() const {
    std::lock_guard<std::mutex> lock(time_mutex_);
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - last_flush_time_);
}
