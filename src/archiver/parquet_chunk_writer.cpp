#include "parquet_chunk_writer.hpp"
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace {
std::atomic<uint64_t> next_table_id{0};
}

ParquetChunkWriter::ParquetChunkWriter(DuckDB& db,
                                       const PartitionId& partition,
                                       const std::string& local_dir,
                                       int64_t start_offset,
                                       size_t threshold_bytes,
                                       const std::string& compression)
    : partition_(partition)
    , start_offset_(start_offset)
    , threshold_bytes_(threshold_bytes)
    , codec_(DuckDbUtils::parquetCodec(compression))
    , record_count_(0)
    , buffered_bytes_(0)
    , current_block_(0)
    , current_block_bytes_(0)
    , finalized_(false)
    , discarded_(false) {

    std::filesystem::create_directories(local_dir);

    std::string base = (std::filesystem::path(local_dir) / chunkBaseName(partition, start_offset)).string();
    data_path_ = base + ".parquet";
    index_path_ = base + ".index.json";

    table_name_ = "chunk_buffer_" + std::to_string(next_table_id.fetch_add(1));

    conn_ = std::make_unique<Connection>(db);
    createBufferTable();
}

ParquetChunkWriter::~ParquetChunkWriter() {
    if (!finalized_) {
        discard();
    }
}

std::string ParquetChunkWriter::chunkBaseName(const PartitionId& partition, int64_t start_offset) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "-%012lld", static_cast<long long>(start_offset));
    return partition.toString() + suffix;
}

void ParquetChunkWriter::createBufferTable() {
    std::ostringstream create_sql;
    create_sql << "CREATE TABLE " << table_name_ << " (\n"
               << "  _kafka_offset BIGINT,\n"
               << "  _kafka_timestamp TIMESTAMP,\n"
               << "  _block INTEGER,\n"
               << "  _kafka_key BLOB,\n"
               << "  value BLOB\n"
               << ");";
    DuckDbUtils::execute(*conn_, create_sql.str(),
                         "Partition " + partition_.toString() + ": creating buffer table");

    appender_ = std::make_unique<duckdb::Appender>(*conn_, table_name_);
}

size_t ParquetChunkWriter::append(const SinkRecord& record) {
    if (finalized_ || discarded_) {
        throw std::logic_error("Partition " + partition_.toString() + ": chunk writer is closed");
    }

    // Re-open after a finalize attempt that failed part way
    if (!appender_) {
        appender_ = std::make_unique<duckdb::Appender>(*conn_, table_name_);
    }

    size_t size = record.sizeBytes();
    if (current_block_bytes_ > 0 && current_block_bytes_ + size > threshold_bytes_) {
        ++current_block_;
        current_block_bytes_ = 0;
    }

    int64_t offset = record.offset >= 0 ? record.offset : start_offset_ + static_cast<int64_t>(record_count_);

    appender_->BeginRow();
    appender_->Append<int64_t>(offset);
    if (record.timestamp_ms > 0) {
        appender_->Append<duckdb::Value>(
            duckdb::Value::TIMESTAMP(duckdb::Timestamp::FromEpochMs(record.timestamp_ms)));
    } else {
        appender_->Append<duckdb::Value>(duckdb::Value(duckdb::LogicalType::TIMESTAMP));
    }
    appender_->Append<int32_t>(current_block_);
    appender_->Append<duckdb::Value>(duckdb::Value::BLOB(
        reinterpret_cast<duckdb::const_data_ptr_t>(record.key.data()), record.key.size()));
    appender_->Append<duckdb::Value>(duckdb::Value::BLOB(
        reinterpret_cast<duckdb::const_data_ptr_t>(record.value.data()), record.value.size()));
    appender_->EndRow();

    current_block_bytes_ += size;
    buffered_bytes_ += size;
    return ++record_count_;
}

ChunkFiles ParquetChunkWriter::finalize() {
    if (discarded_) {
        throw std::logic_error("Partition " + partition_.toString() + ": chunk writer was discarded");
    }
    if (finalized_) {
        throw std::logic_error("Partition " + partition_.toString() + ": chunk writer already finalized");
    }

    std::string context = "Partition " + partition_.toString() + ": finalizing chunk";

    if (appender_) {
        appender_->Close();
        appender_.reset();
    }

    std::ostringstream data_sql;
    data_sql << "COPY (SELECT "
             << DuckDbUtils::quote(partition_.topic) << " AS _kafka_topic, "
             << partition_.partition << "::INTEGER AS _kafka_partition, "
             << "_kafka_offset, _kafka_timestamp, _kafka_key, value "
             << "FROM " << table_name_ << ") "
             << "TO " << DuckDbUtils::quote(data_path_) << " "
             << "(FORMAT PARQUET, COMPRESSION " << codec_ << ");";
    DuckDbUtils::execute(*conn_, data_sql.str(), context);

    std::ostringstream index_sql;
    index_sql << "COPY (SELECT _block AS block, "
              << "MIN(_kafka_offset) AS first_record_offset, "
              << "MAX(_kafka_offset) AS last_record_offset, "
              << "COUNT(*) AS num_records, "
              << "SUM(octet_length(_kafka_key) + octet_length(value)) AS byte_length "
              << "FROM " << table_name_ << " "
              << "GROUP BY _block ORDER BY _block) "
              << "TO " << DuckDbUtils::quote(index_path_) << " (FORMAT JSON);";
    DuckDbUtils::execute(*conn_, index_sql.str(), context);

    finalized_ = true;
    dropBufferTable();

    std::cout << "Partition " << partition_.toString() << ": Sealed chunk with "
              << record_count_ << " records in " << getBlockCount() << " block(s): "
              << data_path_ << std::endl;

    ChunkFiles files;
    files.data_path = data_path_;
    files.index_path = index_path_;
    return files;
}

void ParquetChunkWriter::discard() {
    if (discarded_) {
        return;
    }
    discarded_ = true;

    if (appender_) {
        try {
            appender_->Close();
        } catch (const std::exception& e) {
            std::cerr << "Partition " << partition_.toString()
                      << ": Error closing appender on discard: " << e.what() << std::endl;
        }
        appender_.reset();
    }

    dropBufferTable();

    std::error_code ec;
    for (const auto& path : {data_path_, index_path_}) {
        std::filesystem::remove(path, ec);
        if (ec) {
            std::cerr << "Partition " << partition_.toString() << ": Failed to delete "
                      << path << ": " << ec.message() << std::endl;
        }
    }
}

void ParquetChunkWriter::dropBufferTable() {
    auto result = conn_->Query("DROP TABLE IF EXISTS " + table_name_ + ";");
    if (result->HasError()) {
        std::cerr << "Partition " << partition_.toString()
                  << ": Error dropping buffer table: " << result->GetError() << std::endl;
    }
}

ParquetChunkWriterFactory::ParquetChunkWriterFactory(DuckDB& db, const std::string& compression)
    : db_(db), compression_(compression) {
}

std::unique_ptr<ChunkWriter> ParquetChunkWriterFactory::create(const PartitionId& partition,
                                                               const std::string& local_dir,
                                                               int64_t start_offset,
                                                               size_t threshold_bytes) {
    return std::make_unique<ParquetChunkWriter>(db_, partition, local_dir, start_offset,
                                                threshold_bytes, compression_);
}
