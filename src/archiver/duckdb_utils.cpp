#include "duckdb_utils.hpp"
#include <iostream>
#include <random>
#include <algorithm>
#include <stdexcept>

std::string DuckDbUtils::escapeSqlString(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 8);
    for (char c : str) {
        if (c == '\'') {
            result += "''";
        } else {
            result += c;
        }
    }
    return result;
}

std::string DuckDbUtils::quote(const std::string& str) {
    return "'" + escapeSqlString(str) + "'";
}

std::unique_ptr<MaterializedQueryResult> DuckDbUtils::execute(Connection& conn,
                                                              const std::string& sql,
                                                              const std::string& context) {
    auto result = conn.Query(sql);
    if (result->HasError()) {
        throw std::runtime_error(context + ": " + result->GetError());
    }
    return result;
}

bool DuckDbUtils::loadExtensions(Connection& conn) {
    try {
        // Set home directory BEFORE installing extensions so they can be cached
        execute(conn, "SET home_directory='/tmp';", "Setting home directory");

        // httpfs provides s3:// access
        execute(conn, "INSTALL httpfs;", "Installing httpfs");
        execute(conn, "LOAD httpfs;", "Loading httpfs");

        // Chunk data and block indexes
        execute(conn, "LOAD parquet;", "Loading parquet");
        execute(conn, "LOAD json;", "Loading json");

        std::cout << "DuckDB extensions loaded: httpfs, parquet, json" << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error loading extensions: " << e.what() << std::endl;
        return false;
    }
}

bool DuckDbUtils::configureStorage(Connection& conn, const ArchiverConfig& config) {
    try {
        // GLOBAL so that the per-partition connections see the same settings
        execute(conn, "SET GLOBAL s3_region=" + quote(config.s3_region) + ";", "Setting s3_region");
        execute(conn, "SET GLOBAL s3_url_style=" + quote(config.s3_url_style) + ";", "Setting s3_url_style");
        execute(conn, std::string("SET GLOBAL s3_use_ssl=") + (config.s3_use_ssl ? "true" : "false") + ";",
                "Setting s3_use_ssl");

        if (!config.s3_endpoint.empty()) {
            execute(conn, "SET GLOBAL s3_endpoint=" + quote(config.s3_endpoint) + ";", "Setting s3_endpoint");
        }
        if (!config.s3_access_key.empty()) {
            execute(conn, "SET GLOBAL s3_access_key_id=" + quote(config.s3_access_key) + ";",
                    "Setting s3_access_key_id");
        }
        if (!config.s3_secret_key.empty()) {
            execute(conn, "SET GLOBAL s3_secret_access_key=" + quote(config.s3_secret_key) + ";",
                    "Setting s3_secret_access_key");
        }

        std::cout << "Storage configured: bucket=" << config.s3_bucket
                  << ", prefix=" << (config.s3_prefix.empty() ? "/" : config.s3_prefix)
                  << ", endpoint=" << (config.s3_endpoint.empty() ? "default" : config.s3_endpoint)
                  << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error configuring storage: " << e.what() << std::endl;
        return false;
    }
}

bool DuckDbUtils::configureTempDirectory(Connection& conn, const std::string& local_dir) {
    try {
        execute(conn, "SET GLOBAL temp_directory=" + quote(local_dir + "/duckdb_tmp") + ";",
                "Setting temp_directory");
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error configuring temp directory: " << e.what() << std::endl;
        return false;
    }
}

bool DuckDbUtils::isRemoteUri(const std::string& uri) {
    return uri.find("://") != std::string::npos;
}

std::string DuckDbUtils::parquetCodec(const std::string& compression) {
    if (compression == "gzip" || compression == "zstd" || compression == "snappy" ||
        compression == "uncompressed") {
        return compression;
    }
    throw std::invalid_argument("Unsupported chunk compression: " + compression);
}

std::chrono::milliseconds DuckDbUtils::calculateBackoff(int attempt, int base_delay_ms, int max_delay_ms) {
    // base * 2^(attempt - 1), capped
    int shift = std::min(std::max(attempt - 1, 0), 20);
    int64_t delay = static_cast<int64_t>(base_delay_ms) << shift;
    delay = std::min<int64_t>(delay, max_delay_ms);

    // Add jitter (0-50% of delay)
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(0, delay / 2);
    delay += dist(gen);

    return std::chrono::milliseconds(delay);
}
