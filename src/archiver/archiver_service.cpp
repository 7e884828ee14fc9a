#include "archiver_service.hpp"
#include "duckdb_utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>

ArchiverService::ArchiverService(const ArchiverConfig& config)
    : config_(config)
    , scheduler_(config.buffer_size_mb * 1024 * 1024, std::chrono::seconds(config.flush_interval_seconds))
    , running_(false)
    , stop_requested_(false)
    , flush_requested_(false)
    , completed_flushes_(0)
    , last_flush_ok_(false) {
}

ArchiverService::~ArchiverService() {
    coordinator_.reset();
    if (consumer_) {
        consumer_->close();
    }
}

bool ArchiverService::initialize() {
    try {
        std::filesystem::create_directories(config_.local_buffer_dir);

        // Chunks are buffered in memory and spill to the local buffer dir
        db_ = std::make_unique<DuckDB>(nullptr);
        main_conn_ = std::make_unique<Connection>(*db_);

        if (!DuckDbUtils::loadExtensions(*main_conn_)) {
            std::cerr << "Failed to load DuckDB extensions" << std::endl;
            return false;
        }

        if (!DuckDbUtils::configureStorage(*main_conn_, config_)) {
            std::cerr << "Failed to configure storage" << std::endl;
            return false;
        }

        if (!DuckDbUtils::configureTempDirectory(*main_conn_, config_.local_buffer_dir)) {
            std::cerr << "Failed to configure temp directory" << std::endl;
            return false;
        }

        RetryPolicy retry;
        retry.max_attempts = config_.object_store_retries;
        retry.base_delay_ms = config_.object_store_retry_base_delay_ms;
        retry.max_delay_ms = config_.object_store_retry_max_delay_ms;

        store_ = std::make_unique<DuckDbObjectStore>(*db_, config_.objectStoreRoot(),
                                                     config_.chunk_compression, retry);
        writer_factory_ = std::make_unique<ParquetChunkWriterFactory>(*db_, config_.chunk_compression);

        consumer_ = std::make_unique<QueueConsumer>(config_);
        coordinator_ = std::make_unique<SinkCoordinator>(*consumer_, *store_, *writer_factory_,
                                                         config_.local_buffer_dir,
                                                         config_.chunk_threshold_bytes);

        // Set up rebalance callbacks before subscribing
        consumer_->setAssignmentCallback([this](const std::vector<PartitionId>& partitions) {
            onPartitionsAssigned(partitions);
        });

        consumer_->setRevocationCallback([this](const std::vector<PartitionId>& partitions) {
            onPartitionsRevoked(partitions);
        });

        if (!consumer_->initialize()) {
            std::cerr << "Failed to initialize queue consumer" << std::endl;
            return false;
        }

        std::cout << "ArchiverService initialized successfully" << std::endl;
        std::cout << "Archive root: " << store_->getRootUri() << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize ArchiverService: " << e.what() << std::endl;
        return false;
    }
}

void ArchiverService::start() {
    if (running_) {
        std::cerr << "Service is already running" << std::endl;
        return;
    }
    if (!consumer_ || !coordinator_) {
        std::cerr << "Service not initialized. Call initialize() first." << std::endl;
        return;
    }

    running_ = true;
    stop_requested_ = false;

    std::cout << "Starting archiver..." << std::endl;
    std::cout << "Flush settings: " << config_.buffer_size_mb << " MB or "
              << config_.flush_interval_seconds << " seconds" << std::endl;
    std::cout << "Chunk block size: " << config_.chunk_threshold_bytes << " bytes, compression: "
              << config_.chunk_compression << std::endl;

    try {
        coordinator_->start();
        scheduler_.markFlushed();

        while (!stop_requested_) {
            std::vector<SinkRecord> records = consumer_->poll(config_.poll_batch_size,
                                                              std::chrono::milliseconds(1000));
            if (!records.empty()) {
                deliver(records);
            }

            bool forced = flush_requested_.exchange(false);
            if (forced || scheduler_.isDue()) {
                bool ok = flushAll();
                if (forced) {
                    completeForcedFlush(ok);
                }
            }
        }

        // Final flush before shutdown
        std::cout << "Final flush on shutdown" << std::endl;
        flushAll();
        coordinator_->stop();
    } catch (const ArchiverError& e) {
        std::cerr << "Unrecoverable archiver error: " << e.what() << std::endl;
        running_ = false;
        completeForcedFlush(false);
        throw;
    }

    running_ = false;
    completeForcedFlush(false);
    std::cout << "Archiver stopped" << std::endl;
}

void ArchiverService::requestStop() {
    stop_requested_ = true;
}

void ArchiverService::requestFlush() {
    flush_requested_ = true;
}

bool ArchiverService::forceFlush(int timeout_seconds) {
    std::unique_lock<std::mutex> lock(flush_mutex_);
    if (!running_) {
        return false;
    }

    uint64_t target = completed_flushes_ + 1;
    flush_requested_ = true;

    bool completed = flush_cv_.wait_for(lock, std::chrono::seconds(timeout_seconds), [this, target] {
        return completed_flushes_ >= target;
    });
    if (!completed) {
        std::cerr << "Timeout waiting for forced flush" << std::endl;
        return false;
    }
    return last_flush_ok_;
}

void ArchiverService::completeForcedFlush(bool ok) {
    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
        ++completed_flushes_;
        last_flush_ok_ = ok;
    }
    flush_cv_.notify_all();
}

void ArchiverService::onPartitionsAssigned(const std::vector<PartitionId>& partitions) {
    coordinator_->onAssigned(partitions);
}

void ArchiverService::onPartitionsRevoked(const std::vector<PartitionId>& partitions) {
    coordinator_->onRevoked(partitions);
    for (const auto& partition : partitions) {
        delivered_offsets_.erase(partition);
    }
}

void ArchiverService::deliver(const std::vector<SinkRecord>& records) {
    size_t bytes = 0;
    for (const auto& record : records) {
        bytes += record.sizeBytes();
    }

    for (int attempt = 1;; ++attempt) {
        try {
            coordinator_->put(records);
            break;
        } catch (const RetriableError& e) {
            std::cerr << "Put of " << records.size() << " records failed (attempt " << attempt
                      << "): " << e.what() << std::endl;
        }

        if (stop_requested_) {
            std::cerr << "Shutdown requested, dropping batch; it is redelivered after restart" << std::endl;
            return;
        }

        // Sealed chunks block their partition until uploaded
        flushAll();

        auto delay = DuckDbUtils::calculateBackoff(attempt, config_.object_store_retry_base_delay_ms,
                                                   config_.object_store_retry_max_delay_ms);
        std::this_thread::sleep_for(delay);
    }

    for (const auto& record : records) {
        auto it = delivered_offsets_.find(record.partition);
        if (it == delivered_offsets_.end()) {
            delivered_offsets_[record.partition] = record.offset + 1;
        } else {
            it->second = std::max(it->second, record.offset + 1);
        }
    }

    if (scheduler_.recordDelivered(bytes)) {
        std::cout << "Flush triggered by buffered size" << std::endl;
    }
}

bool ArchiverService::flushAll() {
    auto checkpoints = buildCheckpoints();
    if (checkpoints.empty()) {
        scheduler_.markFlushed();
        return true;
    }

    try {
        auto committed = coordinator_->flush(checkpoints);

        // Consumer group offsets are advisory; recovery reads the archive
        if (!consumer_->commitOffsets(committed)) {
            std::cerr << "Warning: chunks archived but Kafka offset commit failed" << std::endl;
        }

        scheduler_.markFlushed();
        return true;
    } catch (const RetriableError& e) {
        std::cerr << "Flush failed, keeping buffered chunks for retry: " << e.what() << std::endl;
        return false;
    }
}

std::map<PartitionId, int64_t> ArchiverService::buildCheckpoints() const {
    std::map<PartitionId, int64_t> checkpoints;
    for (const auto& status : coordinator_->getPartitionStatus()) {
        auto it = delivered_offsets_.find(status.partition);
        checkpoints[status.partition] =
            it != delivered_offsets_.end() ? it->second : status.next_offset;
    }
    return checkpoints;
}
