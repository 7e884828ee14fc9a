#include "archiver_service.hpp"
#include "admin_server.hpp"
#include "errors.hpp"
#include "../config.hpp"
#include <iostream>
#include <thread>
#include <csignal>

ArchiverService* g_service = nullptr;

void signalHandler(int signal) {
    if (!g_service) {
        return;
    }
    if (signal == SIGUSR1) {
        g_service->requestFlush();
    } else {
        g_service->requestStop();
    }
}

void printUsage() {
    std::cerr << "Please set required environment variables:" << std::endl;
    std::cerr << "  KAFKA_BROKERS - Comma-separated list of broker addresses" << std::endl;
    std::cerr << "  KAFKA_TOPICS - Comma-separated list of topics to archive" << std::endl;
    std::cerr << "  S3_BUCKET - S3 bucket name" << std::endl;
    std::cerr << "  LOCAL_BUFFER_DIR - Directory for chunks being built" << std::endl;
    std::cerr << "Optional:" << std::endl;
    std::cerr << "  KAFKA_CONSUMER_GROUP - Consumer group name (default: s3-archiver)" << std::endl;
    std::cerr << "  S3_PREFIX - Key prefix inside the bucket (default: bucket root)" << std::endl;
    std::cerr << "  S3_ENDPOINT - S3-compatible storage endpoint" << std::endl;
    std::cerr << "  S3_ACCESS_KEY - S3 access key" << std::endl;
    std::cerr << "  S3_SECRET_KEY - S3 secret key" << std::endl;
    std::cerr << "  S3_REGION - S3 region (default: us-east-1)" << std::endl;
    std::cerr << "  S3_URL_STYLE - path or vhost (default: path)" << std::endl;
    std::cerr << "  S3_USE_SSL - true or false (default: true)" << std::endl;
    std::cerr << "  COMPRESSED_BLOCK_SIZE - Chunk block size in bytes (default: 67108864)" << std::endl;
    std::cerr << "  CHUNK_COMPRESSION - gzip, zstd, snappy or uncompressed (default: gzip)" << std::endl;
    std::cerr << "  FLUSH_INTERVAL_SECONDS - Flush interval (default: 60)" << std::endl;
    std::cerr << "  BUFFER_SIZE_MB - Early flush threshold (default: 100)" << std::endl;
    std::cerr << "  POLL_BATCH_SIZE - Max records per poll (default: 500)" << std::endl;
    std::cerr << "  OBJECT_STORE_RETRIES - Attempts per object store call (default: 3)" << std::endl;
    std::cerr << "  OBJECT_STORE_RETRY_BASE_DELAY_MS - First retry delay (default: 200)" << std::endl;
    std::cerr << "  OBJECT_STORE_RETRY_MAX_DELAY_MS - Retry delay cap (default: 5000)" << std::endl;
    std::cerr << "  HEALTH_PORT - Health/flush endpoint port (default: 8080)" << std::endl;
}

int main() {
    ArchiverConfig config;
    try {
        config = ArchiverConfig::fromEnv();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        printUsage();
        return 1;
    }

    ArchiverService service(config);
    if (!service.initialize()) {
        std::cerr << "Failed to initialize archiver" << std::endl;
        return 1;
    }

    g_service = &service;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGUSR1, signalHandler);  // Force flush signal

    AdminServer admin(
        service.getCoordinator(),
        [&service]() { return service.forceFlush(120); },
        [&service]() { return service.isRunning(); },
        [&service]() { return service.getSecondsSinceFlush(); });

    std::thread admin_thread([&admin, &config]() {
        admin.run(config.health_port);
    });

    std::cout << "S3 archiver started successfully" << std::endl;
    std::cout << "Send SIGUSR1 to force flush (kill -USR1 <pid>)" << std::endl;

    int exit_code = 0;
    try {
        service.start();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        exit_code = 1;
    }

    g_service = nullptr;
    admin.stop();
    admin_thread.join();

    std::cout << "Archiver exited" << std::endl;
    return exit_code;
}
