#ifndef ADMIN_SERVER_HPP
#define ADMIN_SERVER_HPP

#include "sink_coordinator.hpp"
#include "crow.h"
#include <functional>

// Health, readiness, statistics and forced flush over HTTP
class AdminServer {
public:
    using FlushHandler = std::function<bool()>;
    using ReadinessProbe = std::function<bool()>;
    using FlushAgeProbe = std::function<long()>;

    AdminServer(const SinkCoordinator& coordinator,
                FlushHandler flush_handler,
                ReadinessProbe readiness_probe,
                FlushAgeProbe flush_age_probe);

    // Setup routes on the provided app (for testing)
    void setupRoutes(crow::SimpleApp& app);

    // Blocks until stop() is called
    void run(int port);
    void stop();

private:
    const SinkCoordinator& coordinator_;
    FlushHandler flush_handler_;
    ReadinessProbe readiness_probe_;
    FlushAgeProbe flush_age_probe_;
    crow::SimpleApp app_;

    crow::json::wvalue buildStats() const;
};

#endif // ADMIN_SERVER_HPP
