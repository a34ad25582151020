#pragma once

#include "metrics/SnapshotService.h"
#include "networking/RequestRouter.h"
#include "session/SessionRecord.hpp"
#include "session/SessionRegistry.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace psmonitor::networking {

// One claimed worker: a WebSocket that receives a snapshot every
// publish interval until either side closes. The registry holds it as the
// record's StreamConnection; release() is called exactly once when it ends.
class StreamSession : public session::StreamConnection,
                      public std::enable_shared_from_this<StreamSession> {
public:
    // Consecutive ticks skipped because a frame was still being written.
    static constexpr int kMaxDroppedTicks = 10;

    static constexpr char kGreeting[] = "connected to monitor, transmitting data...";

    using OnFinish = std::function<void()>;

    StreamSession(boost::asio::ip::tcp::socket socket,
                  std::string id,
                  metrics::FeedKind feed,
                  session::SessionRegistry& registry,
                  metrics::SnapshotService& snapshots,
                  std::chrono::milliseconds interval,
                  OnFinish on_finish);

    // Completes the WebSocket handshake for `req`, then starts publishing.
    void start(Request req);

    // Refuses the upgrade with a plain HTTP response and closes. Used when
    // the claim fails; the record is not touched.
    void reject(Response res);

    // Closes the socket from any thread. Also used by SessionRegistry::close_all.
    void close() override;

    const std::string& id() const { return id_; }

private:
    void on_accept(boost::beast::error_code ec);
    void do_read();
    void schedule_tick();
    void on_tick();
    void send(std::string msg);
    void do_write();
    void on_close_or_fail(const char* what, boost::beast::error_code ec);
    void finish();

    std::string id_;
    metrics::FeedKind feed_;
    session::SessionRegistry& registry_;
    metrics::SnapshotService& snapshots_;
    std::chrono::milliseconds interval_;
    OnFinish on_finish_;

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    boost::asio::steady_timer timer_;

    boost::beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;

    Request upgrade_;
    bool gathering_ = false;
    int dropped_ticks_ = 0;
    bool closing_ = false;
    bool finished_ = false;
};

} // namespace psmonitor::networking
