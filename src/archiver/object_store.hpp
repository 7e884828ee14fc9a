#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include "partition_id.hpp"
#include "chunk_writer.hpp"
#include <string>
#include <stdexcept>
#include <cstdint>

// Confirmation of a durable chunk upload
struct ChunkUploadResult {
    std::string data_key;
    std::string index_key;
    int64_t start_offset = 0;
    int64_t next_offset = 0;  // one past the last archived record
    size_t record_count = 0;
};

// Raised when an upload would overlap the offsets already archived for a partition
class ChunkConflictError : public std::runtime_error {
public:
    explicit ChunkConflictError(const std::string& message) : std::runtime_error(message) {}
};

// Durable chunk storage and offset discovery
class ObjectStoreClient {
public:
    virtual ~ObjectStoreClient() = default;

    // Offset one past the newest archived record of the partition,
    // -1 when nothing has been archived yet. Throws when the store is unreachable.
    virtual int64_t fetchLastCommittedOffset(const PartitionId& partition) = 0;

    // Upload a sealed chunk. The chunk becomes visible to readers only once
    // every object is in place. Throws on failure.
    virtual ChunkUploadResult uploadChunk(const ChunkFiles& files, const PartitionId& partition) = 0;
};

#endif // OBJECT_STORE_HPP
