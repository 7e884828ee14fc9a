#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <cerrno>
#include <stdexcept>

struct ArchiverConfig {
    std::string queue_brokers;
    std::vector<std::string> queue_topics;
    std::string consumer_group = "s3-archiver";

    std::string s3_bucket;
    std::string s3_prefix;  // empty means the bucket root
    std::string s3_endpoint;
    std::string s3_access_key;
    std::string s3_secret_key;
    std::string s3_region = "us-east-1";
    std::string s3_url_style = "path";
    bool s3_use_ssl = true;

    std::string local_buffer_dir;
    size_t chunk_threshold_bytes = 64 * 1024 * 1024;
    std::string chunk_compression = "gzip";

    int flush_interval_seconds = 60;
    size_t buffer_size_mb = 100;
    size_t poll_batch_size = 500;

    int object_store_retries = 3;
    int object_store_retry_base_delay_ms = 200;
    int object_store_retry_max_delay_ms = 5000;

    int health_port = 8080;

    static ArchiverConfig fromEnv() {
        ArchiverConfig config;

        const char* brokers = std::getenv("KAFKA_BROKERS");
        if (!brokers || strlen(brokers) == 0) {
            throw std::runtime_error("KAFKA_BROKERS environment variable is required");
        }
        config.queue_brokers = brokers;

        const char* topics = std::getenv("KAFKA_TOPICS");
        if (topics) {
            config.queue_topics = splitList(topics);
        }
        if (config.queue_topics.empty()) {
            throw std::runtime_error("KAFKA_TOPICS environment variable is required");
        }

        const char* consumer_group = std::getenv("KAFKA_CONSUMER_GROUP");
        if (consumer_group && strlen(consumer_group) > 0) {
            config.consumer_group = consumer_group;
        }

        const char* bucket = std::getenv("S3_BUCKET");
        if (!bucket || strlen(bucket) == 0) {
            throw std::runtime_error("S3_BUCKET environment variable is required");
        }
        config.s3_bucket = bucket;

        const char* prefix = std::getenv("S3_PREFIX");
        if (prefix) {
            config.s3_prefix = normalizePrefix(prefix);
        }

        const char* endpoint = std::getenv("S3_ENDPOINT");
        if (endpoint) {
            config.s3_endpoint = endpoint;
        }

        const char* access_key = std::getenv("S3_ACCESS_KEY");
        if (access_key) {
            config.s3_access_key = access_key;
        }

        const char* secret_key = std::getenv("S3_SECRET_KEY");
        if (secret_key) {
            config.s3_secret_key = secret_key;
        }

        const char* region = std::getenv("S3_REGION");
        if (region && strlen(region) > 0) {
            config.s3_region = region;
        }

        const char* url_style = std::getenv("S3_URL_STYLE");
        if (url_style && strlen(url_style) > 0) {
            std::string style = url_style;
            if (style != "path" && style != "vhost") {
                throw std::runtime_error("S3_URL_STYLE must be 'path' or 'vhost', got '" + style + "'");
            }
            config.s3_url_style = style;
        }

        const char* use_ssl = std::getenv("S3_USE_SSL");
        if (use_ssl && strlen(use_ssl) > 0) {
            config.s3_use_ssl = parseBool("S3_USE_SSL", use_ssl);
        }

        const char* local_dir = std::getenv("LOCAL_BUFFER_DIR");
        if (!local_dir || strlen(local_dir) == 0) {
            throw std::runtime_error("LOCAL_BUFFER_DIR environment variable is required");
        }
        config.local_buffer_dir = local_dir;

        config.chunk_threshold_bytes = static_cast<size_t>(
            readNumber("COMPRESSED_BLOCK_SIZE", static_cast<int64_t>(config.chunk_threshold_bytes), 1));

        const char* compression = std::getenv("CHUNK_COMPRESSION");
        if (compression && strlen(compression) > 0) {
            std::string codec = compression;
            if (codec != "gzip" && codec != "zstd" && codec != "snappy" && codec != "uncompressed") {
                throw std::runtime_error("Unsupported CHUNK_COMPRESSION: " + codec);
            }
            config.chunk_compression = codec;
        }

        config.flush_interval_seconds = static_cast<int>(
            readNumber("FLUSH_INTERVAL_SECONDS", config.flush_interval_seconds, 1, INT32_MAX));
        config.buffer_size_mb = static_cast<size_t>(
            readNumber("BUFFER_SIZE_MB", static_cast<int64_t>(config.buffer_size_mb), 1));
        config.poll_batch_size = static_cast<size_t>(
            readNumber("POLL_BATCH_SIZE", static_cast<int64_t>(config.poll_batch_size), 1));

        config.object_store_retries = static_cast<int>(
            readNumber("OBJECT_STORE_RETRIES", config.object_store_retries, 1, 100));
        config.object_store_retry_base_delay_ms = static_cast<int>(
            readNumber("OBJECT_STORE_RETRY_BASE_DELAY_MS", config.object_store_retry_base_delay_ms, 0, INT32_MAX));
        config.object_store_retry_max_delay_ms = static_cast<int>(
            readNumber("OBJECT_STORE_RETRY_MAX_DELAY_MS", config.object_store_retry_max_delay_ms, 0, INT32_MAX));

        config.health_port = static_cast<int>(readNumber("HEALTH_PORT", config.health_port, 1, 65535));

        return config;
    }

    // Root URI all object keys are resolved against, e.g. s3://bucket/archive
    std::string objectStoreRoot() const {
        std::string root = "s3://" + s3_bucket;
        if (!s3_prefix.empty()) {
            root += "/" + s3_prefix;
        }
        return root;
    }

    // Strip leading and trailing slashes; "/" and "" both mean the bucket root
    static std::string normalizePrefix(const std::string& prefix) {
        size_t start = prefix.find_first_not_of('/');
        if (start == std::string::npos) {
            return "";
        }
        size_t end = prefix.find_last_not_of('/');
        return prefix.substr(start, end - start + 1);
    }

    static std::vector<std::string> splitList(const std::string& value) {
        std::vector<std::string> items;
        size_t pos = 0;
        while (pos <= value.size()) {
            size_t comma = value.find(',', pos);
            if (comma == std::string::npos) {
                comma = value.size();
            }
            std::string item = value.substr(pos, comma - pos);
            size_t first = item.find_first_not_of(" \t");
            if (first != std::string::npos) {
                size_t last = item.find_last_not_of(" \t");
                items.push_back(item.substr(first, last - first + 1));
            }
            pos = comma + 1;
        }
        return items;
    }

    // Parse a whole decimal string; throws on anything else
    static int64_t parseNumber(const std::string& name, const std::string& value,
                               int64_t min_value, int64_t max_value) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error(name + " must be a non-negative integer, got '" + value + "'");
        }
        errno = 0;
        char* end = nullptr;
        long long parsed = std::strtoll(value.c_str(), &end, 10);
        if (errno == ERANGE || *end != '\0') {
            throw std::runtime_error(name + " is out of range: '" + value + "'");
        }
        if (parsed < min_value || parsed > max_value) {
            throw std::runtime_error(name + " must be between " + std::to_string(min_value) +
                                     " and " + std::to_string(max_value) + ", got " + value);
        }
        return parsed;
    }

private:
    static int64_t readNumber(const char* name, int64_t default_value,
                              int64_t min_value, int64_t max_value = INT64_MAX) {
        const char* raw = std::getenv(name);
        if (!raw || strlen(raw) == 0) {
            return default_value;
        }
        return parseNumber(name, raw, min_value, max_value);
    }

    static bool parseBool(const std::string& name, const std::string& value) {
        if (value == "true" || value == "1") {
            return true;
        }
        if (value == "false" || value == "0") {
            return false;
        }
        throw std::runtime_error(name + " must be 'true' or 'false', got '" + value + "'");
    }
};

#endif // CONFIG_HPP
