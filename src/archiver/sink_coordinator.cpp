#include "sink_coordinator.hpp"
#include "errors.hpp"
#include <iostream>
#include <stdexcept>

SinkCoordinator::SinkCoordinator(SinkContext& context,
                                 ObjectStoreClient& store,
                                 ChunkWriterFactory& writer_factory,
                                 const std::string& local_dir,
                                 size_t chunk_threshold_bytes)
    : context_(context)
    , store_(store)
    , writer_factory_(writer_factory)
    , local_dir_(local_dir)
    , chunk_threshold_bytes_(chunk_threshold_bytes) {
}

SinkCoordinator::~SinkCoordinator() {
    stop();
}

void SinkCoordinator::start() {
    onAssigned(context_.assignment());
}

void SinkCoordinator::stop() {
    std::map<PartitionId, std::shared_ptr<PartitionBuffer>> to_discard;
    {
        std::lock_guard<std::mutex> lock(buffers_mutex_);
        to_discard.swap(buffers_);
    }

    for (auto& kv : to_discard) {
        if (kv.second->getRecordCount() > 0) {
            std::cout << "Partition " << kv.first.toString() << ": Dropping "
                      << kv.second->getRecordCount()
                      << " unflushed records on stop" << std::endl;
        }
        kv.second->discard();
    }
}

void SinkCoordinator::onAssigned(const std::vector<PartitionId>& partitions) {
    if (partitions.empty()) {
        return;
    }

    std::cout << "Partitions assigned: ";
    for (const auto& p : partitions) {
        std::cout << p.toString() << " ";
    }
    std::cout << std::endl;

    for (const auto& partition : partitions) {
        if (findBuffer(partition)) {
            continue;
        }
        std::cout << "Partition " << partition.toString()
                  << ": Assigned new partition, creating buffer writer" << std::endl;
        recoverPartition(partition);
    }
}

void SinkCoordinator::onRevoked(const std::vector<PartitionId>& partitions) {
    if (partitions.empty()) {
        return;
    }

    std::cout << "Partitions revoked: ";
    for (const auto& p : partitions) {
        std::cout << p.toString() << " ";
    }
    std::cout << std::endl;

    for (const auto& partition : partitions) {
        std::shared_ptr<PartitionBuffer> buffer;
        {
            std::lock_guard<std::mutex> lock(buffers_mutex_);
            auto it = buffers_.find(partition);
            if (it == buffers_.end()) {
                continue;
            }
            buffer = std::move(it->second);
            buffers_.erase(it);
        }

        std::cout << "Partition " << partition.toString() << ": Revoked, deleting buffer with "
                  << buffer->getRecordCount() << " unflushed records" << std::endl;
        buffer->discard();
    }
}

void SinkCoordinator::put(const std::vector<SinkRecord>& records) {
    std::shared_ptr<PartitionBuffer> buffer;

    for (const auto& record : records) {
        if (!buffer || buffer->getPartition() != record.partition) {
            buffer = findBuffer(record.partition);
        }

        if (!buffer) {
            std::cerr << "Trying to put " << records.size() << " records to partition "
                      << record.partition.toString() << " which is not assigned" << std::endl;
            throw ArchiverError("Trying to put records for partition " +
                                record.partition.toString() + " which has not been assigned");
        }

        if (buffer->isSealed()) {
            throw RetriableError("Partition " + record.partition.toString() +
                                 ": chunk starting at offset " +
                                 std::to_string(buffer->getStartOffset()) +
                                 " is sealed and awaiting upload");
        }

        try {
            buffer->append(record);
        } catch (const std::logic_error& e) {
            throw ArchiverError(e.what());
        } catch (const std::exception& e) {
            throw RetriableError("Partition " + record.partition.toString() +
                                 ": failed to write to buffer: " + e.what());
        }
    }
}

std::map<PartitionId, int64_t> SinkCoordinator::flush(const std::map<PartitionId, int64_t>& checkpoints) {
    for (const auto& kv : checkpoints) {
        if (!findBuffer(kv.first)) {
            std::cerr << "Trying to flush partition " << kv.first.toString()
                      << " which is not assigned" << std::endl;
            throw ArchiverError("Trying to flush records for partition " +
                                kv.first.toString() + " which has not been assigned");
        }
    }

    std::map<PartitionId, int64_t> committed;
    std::vector<std::string> failures;

    for (const auto& kv : checkpoints) {
        try {
            int64_t offset = flushPartition(kv.first, kv.second);
            if (offset >= 0) {
                committed[kv.first] = offset;
            }
        } catch (const RetriableError& e) {
            std::cerr << e.what() << std::endl;
            failures.push_back(e.what());
        }
    }

    if (!failures.empty()) {
        throw RetriableError("Flush failed for " + std::to_string(failures.size()) +
                             " partition(s), first error: " + failures.front());
    }

    return committed;
}

bool SinkCoordinator::isAssigned(const PartitionId& partition) const {
    return findBuffer(partition) != nullptr;
}

std::vector<PartitionStatus> SinkCoordinator::getPartitionStatus() const {
    std::lock_guard<std::mutex> lock(buffers_mutex_);
    std::vector<PartitionStatus> result;
    result.reserve(buffers_.size());

    for (const auto& kv : buffers_) {
        PartitionStatus status;
        status.partition = kv.first;
        status.start_offset = kv.second->getStartOffset();
        status.next_offset = kv.second->getNextOffset();
        status.record_count = kv.second->getRecordCount();
        status.buffered_bytes = kv.second->getBufferedBytes();
        status.sealed = kv.second->isSealed();
        result.push_back(status);
    }
    return result;
}

size_t SinkCoordinator::getPartitionCount() const {
    std::lock_guard<std::mutex> lock(buffers_mutex_);
    return buffers_.size();
}

size_t SinkCoordinator::getTotalBufferedBytes() const {
    std::lock_guard<std::mutex> lock(buffers_mutex_);
    size_t total = 0;
    for (const auto& kv : buffers_) {
        total += kv.second->getBufferedBytes();
    }
    return total;
}

size_t SinkCoordinator::getTotalRecordCount() const {
    std::lock_guard<std::mutex> lock(buffers_mutex_);
    size_t total = 0;
    for (const auto& kv : buffers_) {
        total += kv.second->getRecordCount();
    }
    return total;
}

std::shared_ptr<PartitionBuffer> SinkCoordinator::findBuffer(const PartitionId& partition) const {
    std::lock_guard<std::mutex> lock(buffers_mutex_);
    auto it = buffers_.find(partition);
    if (it == buffers_.end()) {
        return nullptr;
    }
    return it->second;
}

void SinkCoordinator::recoverPartition(const PartitionId& partition) {
    // No records may arrive until the buffer exists and the cursor is repositioned.
    // On failure the partition stays paused.
    context_.pause(partition);

    int64_t offset;
    try {
        offset = store_.fetchLastCommittedOffset(partition);
    } catch (const std::exception& e) {
        std::cerr << "Partition " << partition.toString()
                  << ": Failed to recover offset from object store: " << e.what() << std::endl;
        throw ArchiverError("Failed to resume partition " + partition.toString() +
                            " from object store: " + e.what());
    }

    if (offset < 0) {
        std::cout << "Partition " << partition.toString()
                  << ": No archived chunks found, starting from offset 0" << std::endl;
        offset = 0;
    }

    std::shared_ptr<PartitionBuffer> buffer;
    try {
        buffer = createBuffer(partition, offset);
    } catch (const std::exception& e) {
        throw ArchiverError("Partition " + partition.toString() +
                            ": failed to create buffer writer: " + e.what());
    }

    bool inserted;
    {
        std::lock_guard<std::mutex> lock(buffers_mutex_);
        inserted = buffers_.emplace(partition, buffer).second;
    }
    if (!inserted) {
        buffer->discard();
        return;
    }

    std::cout << "Partition " << partition.toString()
              << ": Recovering from offset " << offset << std::endl;

    context_.seek(partition, offset);
    context_.resume(partition);
}

std::shared_ptr<PartitionBuffer> SinkCoordinator::createBuffer(const PartitionId& partition,
                                                               int64_t start_offset) {
    auto writer = writer_factory_.create(partition, local_dir_, start_offset, chunk_threshold_bytes_);
    return std::make_shared<PartitionBuffer>(partition, std::move(writer), start_offset);
}

int64_t SinkCoordinator::flushPartition(const PartitionId& partition, int64_t checkpoint) {
    auto buffer = findBuffer(partition);
    if (!buffer) {
        std::cout << "Partition " << partition.toString()
                  << ": Revoked before flush, skipping" << std::endl;
        return -1;
    }

    if (buffer->getRecordCount() == 0) {
        std::cout << "Partition " << partition.toString() << ": No new records" << std::endl;
        return buffer->getStartOffset();
    }

    ChunkFiles files;
    try {
        files = buffer->finalize();
    } catch (const std::exception& e) {
        if (buffer->isDiscarded()) {
            std::cout << "Partition " << partition.toString()
                      << ": Revoked during flush, skipping" << std::endl;
            return -1;
        }
        throw RetriableError("Partition " + partition.toString() +
                             ": failed to finalize chunk: " + e.what());
    }

    ChunkUploadResult result;
    try {
        result = store_.uploadChunk(files, partition);
    } catch (const ChunkConflictError& e) {
        if (wasRevoked(partition, buffer)) {
            return -1;
        }
        throw ArchiverError("Partition " + partition.toString() + ": " + e.what());
    } catch (const std::exception& e) {
        if (wasRevoked(partition, buffer)) {
            return -1;
        }
        throw RetriableError("Partition " + partition.toString() +
                             ": failed chunk upload: " + e.what());
    }

    if (result.next_offset != checkpoint) {
        std::cerr << "Partition " << partition.toString() << ": Warning: checkpoint offset "
                  << checkpoint << " differs from archived offset " << result.next_offset
                  << ", resuming from archived offset" << std::endl;
    }

    std::shared_ptr<PartitionBuffer> replacement;
    try {
        replacement = createBuffer(partition, result.next_offset);
    } catch (const std::exception& e) {
        // The sealed buffer stays mapped; a retry re-confirms the same chunk
        throw RetriableError("Partition " + partition.toString() +
                             ": failed to create next buffer writer: " + e.what());
    }

    if (!replaceBuffer(partition, buffer, replacement)) {
        std::cout << "Partition " << partition.toString()
                  << ": Revoked during upload, ignoring upload result" << std::endl;
        replacement->discard();
        return -1;
    }
    buffer->discard();

    std::cout << "Partition " << partition.toString() << ": Uploaded chunk ["
              << result.start_offset << ", " << result.next_offset << ") to "
              << result.data_key << ", now at offset " << result.next_offset << std::endl;
    return result.next_offset;
}

bool SinkCoordinator::wasRevoked(const PartitionId& partition,
                                  const std::shared_ptr<PartitionBuffer>& buffer) const {
    if (!buffer->isDiscarded() && findBuffer(partition) == buffer) {
        return false;
    }
    std::cout << "Partition " << partition.toString()
              << ": Revoked during upload, ignoring upload result" << std::endl;
    return true;
}

bool SinkCoordinator::replaceBuffer(const PartitionId& partition,
                                    const std::shared_ptr<PartitionBuffer>& expected,
                                    std::shared_ptr<PartitionBuffer> replacement) {
    std::lock_guard<std::mutex> lock(buffers_mutex_);
    auto it = buffers_.find(partition);
    if (it == buffers_.end() || it->second != expected) {
        return false;
    }
    it->second = std::move(replacement);
    return true;
}
