#ifndef FLUSH_SCHEDULER_HPP
#define FLUSH_SCHEDULER_HPP

#include <chrono>
#include <mutex>
#include <atomic>

// Decides when the service asks the coordinator to flush: after a fixed
// interval, or earlier once enough bytes have been delivered since the last flush
class FlushScheduler {
public:
    FlushScheduler(size_t max_bytes, std::chrono::milliseconds interval);

    // Account for delivered bytes, returns true once the size threshold is reached
    bool recordDelivered(size_t bytes);

    // True if the size threshold is reached or the interval has elapsed
    bool isDue() const;

    bool isIntervalElapsed() const;

    // Restart both triggers (call after a successful flush)
    void markFlushed();

    size_t getBytesSinceFlush() const { return bytes_since_flush_.load(); }
    std::chrono::seconds getTimeSinceFlush() const;

private:
    size_t max_bytes_;
    std::chrono::milliseconds interval_;
    std::atomic<size_t> bytes_since_flush_;
    std::chrono::steady_clock::time_point last_flush_time_;
    mutable std::mutex time_mutex_;
};

#endif // FLUSH_SCHEDULER_HPP
