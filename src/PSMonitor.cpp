#include "auth/CredentialStore.h"
#include "auth/TokenService.h"
#include "core/Logger.h"
#include "core/OffloadPool.h"
#include "core/Settings.h"
#include "metrics/SnapshotService.h"
#include "metrics/SystemProviders.h"
#include "networking/HttpServer.h"
#include "networking/RequestRouter.h"
#include "session/SessionReaper.h"
#include "session/SessionRegistry.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>

namespace {

constexpr std::chrono::seconds kDrainTimeout{1};

void configure_logging(const psmonitor::Settings& settings) {
    auto& logger = psmonitor::Logger::get();
    logger.set_level(settings.log_level);
    logger.set_enabled(settings.logging_enabled);

    if (settings.logging_enabled && !settings.log_file.empty() && !logger.open_file(settings.log_file)) {
        PSM_LOG_WARN("[PSMonitor] cannot open log file " << settings.log_file << ", logging to console only");
    }
}

int run(const psmonitor::Settings& settings) {
    using namespace psmonitor;

    boost::asio::io_context ioc;

    const auto credentials = auth::CredentialStore::open(settings.data_dir);

    const auth::TokenService tokens(settings.token_ttl);
    session::SessionRegistry registry(settings.worker_grace);
    OffloadPool pool(settings.pool_size);

    metrics::SnapshotService snapshots(
        pool,
        metrics::SnapshotService::system_feed(std::make_shared<metrics::CpuSampler>()),
        metrics::SnapshotService::network_feed());

    networking::RequestRouter router(registry, credentials, tokens, snapshots, pool);

    networking::HttpServer::Options options;
    options.address = settings.address;
    options.port = settings.port;
    options.max_streams = settings.max_ws_connections;
    options.publish_interval = settings.publish_interval;

    networking::HttpServer server(ioc, options, router, registry, snapshots);
    session::SessionReaper reaper(ioc, registry, settings.sweep_interval);

    server.start();
    reaper.start();

    // Graceful shutdown on Ctrl+C / SIGTERM. Streams get a short window to
    // finish their close handshake before the loop is stopped.
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    boost::asio::steady_timer drain(ioc);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        PSM_LOG_INFO("[PSMonitor] signal " << signo << ", shutting down...");
        reaper.stop();
        server.stop();
        drain.expires_after(kDrainTimeout);
        drain.async_wait([&](const boost::system::error_code&) { ioc.stop(); });
    });

    PSM_LOG_INFO("[PSMonitor] server running on " << settings.address << ":" << server.local_port()
                 << " (" << pool.size() << " worker threads)");
    ioc.run();

    pool.stop();
    PSM_LOG_INFO("[PSMonitor] exit.");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    psmonitor::CommandLine cli;
    try {
        cli = psmonitor::parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "psmonitor: " << e.what() << "\n";
        return 2;
    }
    if (cli.exit_code) return *cli.exit_code;

    configure_logging(cli.settings);

    try {
        return run(cli.settings);
    } catch (const std::exception& e) {
        PSM_LOG_ERROR("[PSMonitor] fatal: " << e.what());
        return 1;
    }
}
