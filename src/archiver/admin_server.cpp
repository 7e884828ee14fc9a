#include "admin_server.hpp"
#include <iostream>
#include <vector>

AdminServer::AdminServer(const SinkCoordinator& coordinator,
                         FlushHandler flush_handler,
                         ReadinessProbe readiness_probe,
                         FlushAgeProbe flush_age_probe)
    : coordinator_(coordinator)
    , flush_handler_(std::move(flush_handler))
    , readiness_probe_(std::move(readiness_probe))
    , flush_age_probe_(std::move(flush_age_probe)) {
}

void AdminServer::setupRoutes(crow::SimpleApp& app) {
    CROW_ROUTE(app, "/health")
    ([]() {
        return crow::response(200, "OK");
    });

    CROW_ROUTE(app, "/ready")
    ([this]() {
        if (readiness_probe_ && readiness_probe_()) {
            return crow::response(200, "OK");
        }
        return crow::response(503, "Not ready");
    });

    CROW_ROUTE(app, "/flush").methods("POST"_method)
    ([this]() {
        std::cout << "Force flush requested via HTTP endpoint" << std::endl;
        if (flush_handler_ && flush_handler_()) {
            return crow::response(200, "Flush completed successfully (offsets committed)");
        }
        return crow::response(500, "Flush failed (buffered chunks kept for retry)");
    });

    CROW_ROUTE(app, "/stats")
    ([this]() {
        return crow::response(200, buildStats());
    });
}

crow::json::wvalue AdminServer::buildStats() const {
    crow::json::wvalue stats;
    std::vector<crow::json::wvalue> partitions;

    size_t total_records = 0;
    size_t total_bytes = 0;
    for (const auto& status : coordinator_.getPartitionStatus()) {
        crow::json::wvalue entry;
        entry["topic"] = status.partition.topic;
        entry["partition"] = status.partition.partition;
        entry["start_offset"] = status.start_offset;
        entry["next_offset"] = status.next_offset;
        entry["record_count"] = status.record_count;
        entry["buffered_bytes"] = status.buffered_bytes;
        entry["sealed"] = status.sealed;
        partitions.push_back(std::move(entry));

        total_records += status.record_count;
        total_bytes += status.buffered_bytes;
    }

    stats["partition_count"] = partitions.size();
    stats["total_records"] = total_records;
    stats["total_bytes"] = total_bytes;
    stats["seconds_since_flush"] = flush_age_probe_ ? flush_age_probe_() : 0L;
    stats["partitions"] = std::move(partitions);
    return stats;
}

void AdminServer::run(int port) {
    setupRoutes(app_);

    std::cout << "Archiver admin server running on port " << port << std::endl;
    std::cout << "  POST /flush - Force flush buffered chunks to the object store" << std::endl;
    std::cout << "  GET /stats - Get buffer statistics" << std::endl;
    std::cout << "  GET /health - Health check" << std::endl;

    app_.port(port).multithreaded().run();
}

void AdminServer::stop() {
    app_.stop();
}
