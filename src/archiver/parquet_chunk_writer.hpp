#ifndef PARQUET_CHUNK_WRITER_HPP
#define PARQUET_CHUNK_WRITER_HPP

#include "chunk_writer.hpp"
#include "duckdb_utils.hpp"
#include "duckdb.hpp"
#include <memory>
#include <string>

using duckdb::DuckDB;
using duckdb::Connection;

// Buffers a partition's records in a DuckDB table and seals them into a
// compressed Parquet data file plus a newline-delimited JSON block index.
//
// Records are grouped into blocks: a new block starts when the next record
// would push the current block past the size threshold. The index holds one
// line per block: block, first_record_offset, last_record_offset,
// num_records, byte_length (uncompressed key + value bytes).
class ParquetChunkWriter : public ChunkWriter {
public:
    ParquetChunkWriter(DuckDB& db,
                       const PartitionId& partition,
                       const std::string& local_dir,
                       int64_t start_offset,
                       size_t threshold_bytes,
                       const std::string& compression);
    ~ParquetChunkWriter() override;

    size_t append(const SinkRecord& record) override;
    ChunkFiles finalize() override;
    void discard() override;

    size_t getRecordCount() const override { return record_count_; }
    size_t getBufferedBytes() const override { return buffered_bytes_; }

    const std::string& getDataPath() const { return data_path_; }
    const std::string& getIndexPath() const { return index_path_; }
    int32_t getBlockCount() const { return record_count_ == 0 ? 0 : current_block_ + 1; }

    // "<topic>-<ppppp>-<start offset padded to 12 digits>"
    static std::string chunkBaseName(const PartitionId& partition, int64_t start_offset);

private:
    PartitionId partition_;
    int64_t start_offset_;
    size_t threshold_bytes_;
    std::string codec_;

    std::unique_ptr<Connection> conn_;
    std::unique_ptr<duckdb::Appender> appender_;
    std::string table_name_;
    std::string data_path_;
    std::string index_path_;

    size_t record_count_;
    size_t buffered_bytes_;
    int32_t current_block_;
    size_t current_block_bytes_;

    bool finalized_;
    bool discarded_;

    void createBufferTable();
    void dropBufferTable();
};

class ParquetChunkWriterFactory : public ChunkWriterFactory {
public:
    ParquetChunkWriterFactory(DuckDB& db, const std::string& compression);

    std::unique_ptr<ChunkWriter> create(const PartitionId& partition,
                                        const std::string& local_dir,
                                        int64_t start_offset,
                                        size_t threshold_bytes) override;

private:
    DuckDB& db_;
    std::string compression_;
};

#endif // PARQUET_CHUNK_WRITER_HPP
