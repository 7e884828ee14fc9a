#include "duckdb_object_store.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

const char* kIndexColumns =
    "columns={'block': 'INTEGER', 'first_record_offset': 'BIGINT', "
    "'last_record_offset': 'BIGINT', 'num_records': 'BIGINT', 'byte_length': 'BIGINT'}";

const char* kCursorColumns =
    "columns={'index_key': 'VARCHAR', 'data_key': 'VARCHAR', 'start_offset': 'BIGINT', "
    "'next_offset': 'BIGINT', 'record_count': 'BIGINT'}";

std::string readJson(const std::string& path, const char* columns) {
    return "read_json(" + DuckDbUtils::quote(path) + ", format='newline_delimited', " + columns + ")";
}

}

DuckDbObjectStore::DuckDbObjectStore(DuckDB& db,
                                     const std::string& root_uri,
                                     const std::string& compression,
                                     const RetryPolicy& retry_policy)
    : db_(db)
    , root_uri_(root_uri)
    , codec_(DuckDbUtils::parquetCodec(compression))
    , retry_policy_(retry_policy) {
    while (root_uri_.size() > 1 && root_uri_.back() == '/') {
        root_uri_.pop_back();
    }
}

template <typename Operation>
auto DuckDbObjectStore::withRetry(const std::string& description,
                                  const PartitionId& partition,
                                  Operation operation) -> decltype(operation()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return operation();
        } catch (const ChunkConflictError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "Partition " << partition.toString() << ": " << description
                      << " attempt " << attempt << " failed: " << e.what() << std::endl;
            if (attempt >= retry_policy_.max_attempts) {
                throw std::runtime_error(description + " failed after " + std::to_string(attempt) +
                                         " attempt(s): " + e.what());
            }
        }

        auto delay = DuckDbUtils::calculateBackoff(attempt, retry_policy_.base_delay_ms,
                                                   retry_policy_.max_delay_ms);
        std::cout << "Partition " << partition.toString() << ": Retrying " << description
                  << " after " << delay.count() << "ms" << std::endl;
        std::this_thread::sleep_for(delay);
    }
}

std::string DuckDbObjectStore::chunkKey(const PartitionId& partition, const std::string& file_name) const {
    char dir[16];
    std::snprintf(dir, sizeof(dir), "%05d", partition.partition);
    return root_uri_ + "/" + partition.topic + "/" + dir + "/" + file_name;
}

std::string DuckDbObjectStore::cursorKey(const PartitionId& partition) const {
    return root_uri_ + "/last_chunk_index." + partition.toString() + ".json";
}

int64_t DuckDbObjectStore::fetchLastCommittedOffset(const PartitionId& partition) {
    return withRetry("Offset lookup", partition, [this, &partition]() {
        Connection conn(db_);
        Cursor cursor = readCursor(conn, partition);
        if (!cursor.found) {
            return static_cast<int64_t>(-1);
        }
        std::cout << "Partition " << partition.toString() << ": Last archived chunk "
                  << cursor.index_key << " ends at offset " << cursor.next_offset << std::endl;
        return cursor.next_offset;
    });
}

ChunkUploadResult DuckDbObjectStore::uploadChunk(const ChunkFiles& files, const PartitionId& partition) {
    return withRetry("Chunk upload", partition, [this, &files, &partition]() {
        return attemptUpload(files, partition);
    });
}

DuckDbObjectStore::Cursor DuckDbObjectStore::readCursor(Connection& conn, const PartitionId& partition) {
    Cursor cursor;
    std::string key = cursorKey(partition);
    std::string context = "Partition " + partition.toString() + ": reading cursor " + key;

    auto listing = DuckDbUtils::execute(conn, "SELECT COUNT(*) FROM glob(" + DuckDbUtils::quote(key) + ");", context);
    if (listing->GetValue(0, 0).GetValue<int64_t>() == 0) {
        return cursor;
    }

    auto result = DuckDbUtils::execute(
        conn,
        "SELECT index_key, data_key, start_offset, next_offset, record_count FROM " +
            readJson(key, kCursorColumns) + ";",
        context);
    if (result->RowCount() == 0 || result->GetValue(3, 0).IsNull()) {
        throw std::runtime_error(context + ": cursor object is empty");
    }

    cursor.found = true;
    cursor.index_key = result->GetValue(0, 0).ToString();
    cursor.data_key = result->GetValue(1, 0).ToString();
    cursor.start_offset = result->GetValue(2, 0).GetValue<int64_t>();
    cursor.next_offset = result->GetValue(3, 0).GetValue<int64_t>();
    cursor.record_count = result->GetValue(4, 0).GetValue<int64_t>();
    return cursor;
}

DuckDbObjectStore::IndexSummary DuckDbObjectStore::summarizeIndex(Connection& conn, const std::string& index_path) {
    auto result = DuckDbUtils::execute(
        conn,
        "SELECT MIN(first_record_offset), MAX(last_record_offset), SUM(num_records)::BIGINT FROM " +
            readJson(index_path, kIndexColumns) + ";",
        "Reading chunk index " + index_path);

    if (result->RowCount() == 0 || result->GetValue(0, 0).IsNull()) {
        throw std::runtime_error("Chunk index " + index_path + " has no blocks");
    }

    IndexSummary summary;
    summary.first_offset = result->GetValue(0, 0).GetValue<int64_t>();
    summary.last_offset = result->GetValue(1, 0).GetValue<int64_t>();
    summary.record_count = result->GetValue(2, 0).GetValue<int64_t>();
    return summary;
}

ChunkUploadResult DuckDbObjectStore::attemptUpload(const ChunkFiles& files, const PartitionId& partition) {
    Connection conn(db_);
    std::string context = "Partition " + partition.toString() + ": uploading chunk";

    IndexSummary summary = summarizeIndex(conn, files.index_path);

    ChunkUploadResult upload;
    upload.data_key = chunkKey(partition, std::filesystem::path(files.data_path).filename().string());
    upload.index_key = chunkKey(partition, std::filesystem::path(files.index_path).filename().string());
    upload.start_offset = summary.first_offset;
    upload.next_offset = summary.last_offset + 1;
    upload.record_count = static_cast<size_t>(summary.record_count);

    Cursor cursor = readCursor(conn, partition);
    if (cursor.found) {
        if (cursor.index_key == upload.index_key && cursor.next_offset == upload.next_offset) {
            // A previous attempt committed but its confirmation was lost
            std::cout << "Partition " << partition.toString() << ": Chunk " << upload.index_key
                      << " is already archived" << std::endl;
            return upload;
        }
        if (cursor.next_offset > upload.start_offset) {
            throw ChunkConflictError("Chunk [" + std::to_string(upload.start_offset) + ", " +
                                     std::to_string(upload.next_offset) +
                                     ") overlaps archived offsets up to " +
                                     std::to_string(cursor.next_offset) + " (" + cursor.index_key + ")");
        }
        if (cursor.next_offset < upload.start_offset) {
            std::cerr << "Partition " << partition.toString() << ": Warning: chunk starts at offset "
                      << upload.start_offset << " but archive ends at " << cursor.next_offset << std::endl;
        }
    }

    ensureParentDirectory(upload.data_key);
    ensureParentDirectory(cursorKey(partition));

    std::ostringstream data_sql;
    data_sql << "COPY (SELECT * FROM read_parquet(" << DuckDbUtils::quote(files.data_path) << ")) "
             << "TO " << DuckDbUtils::quote(upload.data_key) << " "
             << "(FORMAT PARQUET, COMPRESSION " << codec_ << ");";
    DuckDbUtils::execute(conn, data_sql.str(), context + " data");

    std::ostringstream index_sql;
    index_sql << "COPY (SELECT * FROM " << readJson(files.index_path, kIndexColumns) << ") "
              << "TO " << DuckDbUtils::quote(upload.index_key) << " (FORMAT JSON);";
    DuckDbUtils::execute(conn, index_sql.str(), context + " index");

    std::ostringstream cursor_sql;
    cursor_sql << "COPY (SELECT "
               << DuckDbUtils::quote(upload.index_key) << " AS index_key, "
               << DuckDbUtils::quote(upload.data_key) << " AS data_key, "
               << upload.start_offset << "::BIGINT AS start_offset, "
               << upload.next_offset << "::BIGINT AS next_offset, "
               << upload.record_count << "::BIGINT AS record_count) "
               << "TO " << DuckDbUtils::quote(cursorKey(partition)) << " (FORMAT JSON);";
    DuckDbUtils::execute(conn, cursor_sql.str(), context + " cursor");

    return upload;
}

void DuckDbObjectStore::ensureParentDirectory(const std::string& key) {
    if (DuckDbUtils::isRemoteUri(key)) {
        return;
    }
    std::filesystem::create_directories(std::filesystem::path(key).parent_path());
}
