#pragma once

#include "metrics/SnapshotService.h"
#include "networking/RequestRouter.h"
#include "session/SessionRegistry.h"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace psmonitor::networking {

// Accepts TCP connections on one io_context, serves plain HTTP through the
// RequestRouter and hands /connect upgrades to a StreamSession once the
// worker record has been claimed.
class HttpServer {
public:
    struct Options {
        std::string address = "localhost";
        unsigned short port = 4500;   // 0 picks a free port
        std::size_t max_streams = 20;
        std::chrono::milliseconds publish_interval{1000};
    };

    // Binds and listens immediately; throws boost::system::system_error when
    // the address cannot be resolved or bound.
    HttpServer(boost::asio::io_context& ioc,
               Options options,
               RequestRouter& router,
               session::SessionRegistry& registry,
               metrics::SnapshotService& snapshots);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();  // start accepting
    void stop();   // stop accepting, refuse further upgrades, close active streams

    unsigned short local_port() const;
    std::size_t active_streams() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace psmonitor::networking
