#ifndef DUCKDB_UTILS_HPP
#define DUCKDB_UTILS_HPP

#include "../config.hpp"
#include "duckdb.hpp"
#include <string>
#include <chrono>
#include <memory>

using duckdb::DuckDB;
using duckdb::Connection;
using duckdb::MaterializedQueryResult;

// Shared helpers for the DuckDB-backed chunk writer and object store
class DuckDbUtils {
public:
    // Escape a value for use inside a single-quoted SQL string literal
    static std::string escapeSqlString(const std::string& str);

    // Escape and wrap in single quotes
    static std::string quote(const std::string& str);

    // Run a statement and throw std::runtime_error carrying DuckDB's message on failure
    static std::unique_ptr<MaterializedQueryResult> execute(Connection& conn,
                                                            const std::string& sql,
                                                            const std::string& context);

    // Load httpfs, parquet and json on a connection
    static bool loadExtensions(Connection& conn);

    // Apply S3 credentials and endpoint settings database-wide
    static bool configureStorage(Connection& conn, const ArchiverConfig& config);

    // Scratch space for DuckDB to spill buffered chunks that exceed memory
    static bool configureTempDirectory(Connection& conn, const std::string& local_dir);

    // True for s3://, http:// and similar URIs; false for local paths
    static bool isRemoteUri(const std::string& uri);

    // Map a chunk compression name to DuckDB's Parquet COMPRESSION option
    static std::string parquetCodec(const std::string& compression);

    // Exponential backoff with jitter for retry attempt `attempt` (1-based)
    static std::chrono::milliseconds calculateBackoff(int attempt, int base_delay_ms, int max_delay_ms);
};

#endif // DUCKDB_UTILS_HPP
