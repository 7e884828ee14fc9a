#ifndef ARCHIVER_SERVICE_HPP
#define ARCHIVER_SERVICE_HPP

#include "../config.hpp"
#include "duckdb_object_store.hpp"
#include "flush_scheduler.hpp"
#include "parquet_chunk_writer.hpp"
#include "queue_consumer.hpp"
#include "sink_coordinator.hpp"
#include "duckdb.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>

using duckdb::DuckDB;
using duckdb::Connection;

// Host runtime of the archiver: polls Kafka, feeds the coordinator, triggers
// flushes and commits consumer group offsets once chunks are archived
class ArchiverService {
public:
    ArchiverService(const ArchiverConfig& config);
    ~ArchiverService();

    // Initialize DuckDB, storage configuration, coordinator and consumer
    bool initialize();

    // Run the polling loop in the current thread until requestStop().
    // Throws ArchiverError on an unrecoverable failure.
    void start();

    // Only sets flags, safe to call from a signal handler
    void requestStop();
    void requestFlush();

    // Ask the polling loop to flush and wait for the outcome
    bool forceFlush(int timeout_seconds);

    bool isRunning() const { return running_; }
    const SinkCoordinator& getCoordinator() const { return *coordinator_; }
    long getSecondsSinceFlush() const { return static_cast<long>(scheduler_.getTimeSinceFlush().count()); }

private:
    ArchiverConfig config_;

    // Shared DuckDB instance (connections are per chunk writer and per store call)
    std::unique_ptr<DuckDB> db_;
    std::unique_ptr<Connection> main_conn_;

    std::unique_ptr<DuckDbObjectStore> store_;
    std::unique_ptr<ParquetChunkWriterFactory> writer_factory_;
    std::unique_ptr<QueueConsumer> consumer_;
    std::unique_ptr<SinkCoordinator> coordinator_;

    FlushScheduler scheduler_;

    // Next offset after the last record handed to the coordinator (poll thread only)
    std::map<PartitionId, int64_t> delivered_offsets_;

    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<bool> flush_requested_;

    // Completed forced flushes, for forceFlush() waiters
    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    uint64_t completed_flushes_;
    bool last_flush_ok_;

    void onPartitionsAssigned(const std::vector<PartitionId>& partitions);
    void onPartitionsRevoked(const std::vector<PartitionId>& partitions);

    // Put a polled batch, retrying retriable failures with backoff
    void deliver(const std::vector<SinkRecord>& records);

    // Flush every assigned partition and commit the archived offsets
    bool flushAll();

    std::map<PartitionId, int64_t> buildCheckpoints() const;

    void completeForcedFlush(bool ok);
};

#endif // ARCHIVER_SERVICE_HPP
