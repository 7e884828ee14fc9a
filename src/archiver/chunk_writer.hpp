#ifndef CHUNK_WRITER_HPP
#define CHUNK_WRITER_HPP

#include "partition_id.hpp"
#include "sink_record.hpp"
#include <string>
#include <memory>
#include <cstdint>

// Local artifacts of a sealed chunk
struct ChunkFiles {
    std::string data_path;
    std::string index_path;
};

// Streaming compressor and indexer for one partition's buffered records.
// An instance belongs to exactly one PartitionBuffer.
class ChunkWriter {
public:
    virtual ~ChunkWriter() = default;

    // Append one record, returns the number of records written so far.
    // Throws on local I/O failure.
    virtual size_t append(const SinkRecord& record) = 0;

    // Seal the chunk and write the data and index files.
    // Throws if the writer was already finalized or discarded.
    virtual ChunkFiles finalize() = 0;

    // Drop buffered records and delete any local files. Never throws.
    virtual void discard() = 0;

    virtual size_t getRecordCount() const = 0;
    virtual size_t getBufferedBytes() const = 0;
};

class ChunkWriterFactory {
public:
    virtual ~ChunkWriterFactory() = default;

    virtual std::unique_ptr<ChunkWriter> create(const PartitionId& partition,
                                                const std::string& local_dir,
                                                int64_t start_offset,
                                                size_t threshold_bytes) = 0;
};

#endif // CHUNK_WRITER_HPP
