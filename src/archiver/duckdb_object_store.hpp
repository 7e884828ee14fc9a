#ifndef DUCKDB_OBJECT_STORE_HPP
#define DUCKDB_OBJECT_STORE_HPP

#include "object_store.hpp"
#include "duckdb_utils.hpp"
#include "duckdb.hpp"
#include <string>

using duckdb::DuckDB;
using duckdb::Connection;

// Bounded retry for object store round trips
struct RetryPolicy {
    int max_attempts = 3;
    int base_delay_ms = 200;
    int max_delay_ms = 5000;
};

// Archives chunks under a root URI through DuckDB's httpfs (s3://bucket/prefix)
// or, when the root is a plain path, on the local filesystem.
//
// Layout below the root:
//   <topic>/<ppppp>/<topic>-<ppppp>-<start offset>.parquet      chunk data
//   <topic>/<ppppp>/<topic>-<ppppp>-<start offset>.index.json   block index
//   last_chunk_index.<topic>-<ppppp>.json                       cursor
//
// The cursor names the newest durable chunk and its end offset. It is written
// last, so a chunk only counts as archived once the cursor points at it.
class DuckDbObjectStore : public ObjectStoreClient {
public:
    DuckDbObjectStore(DuckDB& db,
                      const std::string& root_uri,
                      const std::string& compression,
                      const RetryPolicy& retry_policy);

    int64_t fetchLastCommittedOffset(const PartitionId& partition) override;
    ChunkUploadResult uploadChunk(const ChunkFiles& files, const PartitionId& partition) override;

    std::string chunkKey(const PartitionId& partition, const std::string& file_name) const;
    std::string cursorKey(const PartitionId& partition) const;
    const std::string& getRootUri() const { return root_uri_; }

private:
    struct Cursor {
        bool found = false;
        std::string index_key;
        std::string data_key;
        int64_t start_offset = 0;
        int64_t next_offset = 0;
        int64_t record_count = 0;
    };

    struct IndexSummary {
        int64_t first_offset = 0;
        int64_t last_offset = 0;
        int64_t record_count = 0;
    };

    DuckDB& db_;
    std::string root_uri_;
    std::string codec_;
    RetryPolicy retry_policy_;

    Cursor readCursor(Connection& conn, const PartitionId& partition);
    IndexSummary summarizeIndex(Connection& conn, const std::string& index_path);
    ChunkUploadResult attemptUpload(const ChunkFiles& files, const PartitionId& partition);

    // Local roots need their directories to exist before COPY ... TO
    void ensureParentDirectory(const std::string& key);

    template <typename Operation>
    auto withRetry(const std::string& description, const PartitionId& partition, Operation operation)
        -> decltype(operation());
};

#endif // DUCKDB_OBJECT_STORE_HPP
