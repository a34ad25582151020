#include "networking/StreamSession.h"

#include "core/Logger.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/json/serialize.hpp>

namespace psmonitor::networking {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

StreamSession::StreamSession(asio::ip::tcp::socket socket,
                             std::string id,
                             metrics::FeedKind feed,
                             session::SessionRegistry& registry,
                             metrics::SnapshotService& snapshots,
                             std::chrono::milliseconds interval,
                             OnFinish on_finish)
    : id_(std::move(id)),
      feed_(feed),
      registry_(registry),
      snapshots_(snapshots),
      interval_(interval),
      on_finish_(std::move(on_finish)),
      ws_(std::move(socket)),
      strand_(asio::make_strand(ws_.get_executor())),
      timer_(strand_) {}

void StreamSession::start(Request req) {
    upgrade_ = std::move(req);

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "psmonitor");
    }));

    ws_.async_accept(
        upgrade_,
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec) { self->on_accept(ec); }));
}

void StreamSession::reject(Response res) {
    finished_ = true;

    auto msg = std::make_shared<Response>(std::move(res));
    msg->keep_alive(false);
    http::async_write(
        ws_.next_layer(), *msg,
        asio::bind_executor(
            strand_,
            [self = shared_from_this(), msg](beast::error_code ec, std::size_t) {
                if (ec) PSM_LOG_DEBUG("[Stream " << self->id_ << "] reject: " << ec.message());
                beast::error_code ignored;
                self->ws_.next_layer().socket().shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
            }));
}

void StreamSession::close() {
    asio::post(
        strand_,
        [self = shared_from_this()] {
            if (self->closing_ || self->finished_) return;
            self->closing_ = true;
            self->timer_.cancel();
            self->ws_.async_close(
                websocket::close_code::normal,
                asio::bind_executor(self->strand_, [self](beast::error_code ec) {
                    if (ec) self->on_close_or_fail("close", ec);
                }));
        });
}

void StreamSession::on_accept(beast::error_code ec) {
    if (ec) return on_close_or_fail("accept", ec);

    PSM_LOG_INFO("[Stream " << id_ << "] connected");
    send(kGreeting);
    do_read();
    schedule_tick();
}

void StreamSession::do_read() {
    ws_.async_read(
        buffer_,
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) return self->on_close_or_fail("read", ec);

                // inbound frames carry nothing; reading keeps control frames flowing
                self->buffer_.consume(self->buffer_.size());
                self->do_read();
            }));
}

void StreamSession::schedule_tick() {
    if (closing_ || finished_) return;

    timer_.expires_after(interval_);
    timer_.async_wait(
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec == asio::error::operation_aborted) return;
                self->on_tick();
            }));
}

void StreamSession::on_tick() {
    if (closing_ || finished_) return;

    if (!write_queue_.empty()) {
        if (++dropped_ticks_ >= kMaxDroppedTicks) {
            // a close frame would queue behind the stuck write; drop the socket
            PSM_LOG_WARN("[Stream " << id_ << "] client not keeping up, dropping connection");
            return finish();
        }
        PSM_LOG_DEBUG("[Stream " << id_ << "] write in flight, tick dropped");
        return schedule_tick();
    }

    // one gather at a time; a slow provider only delays this connection
    if (!gathering_) {
        gathering_ = true;
        snapshots_.gather(feed_, strand_, [self = shared_from_this()](boost::json::object snapshot) {
            self->gathering_ = false;
            if (self->closing_ || self->finished_) return;
            self->send(boost::json::serialize(snapshot));
        });
    }
    schedule_tick();
}

void StreamSession::send(std::string msg) {
    const bool writing = !write_queue_.empty();
    write_queue_.push_back(std::move(msg));
    if (!writing) do_write();
}

void StreamSession::do_write() {
    ws_.text(true);
    ws_.async_write(
        asio::buffer(write_queue_.front()),
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) return self->on_close_or_fail("write", ec);

                self->write_queue_.pop_front();
                self->dropped_ticks_ = 0;
                if (!self->write_queue_.empty()) self->do_write();
            }));
}

void StreamSession::on_close_or_fail(const char* what, beast::error_code ec) {
    if (finished_) return;

    if (ec == websocket::error::closed || ec == asio::error::operation_aborted || closing_) {
        PSM_LOG_INFO("[Stream " << id_ << "] closed");
    } else {
        PSM_LOG_WARN("[Stream " << id_ << "] " << what << ": " << ec.message());
    }
    finish();
}

void StreamSession::finish() {
    finished_ = true;
    timer_.cancel();

    beast::error_code ignored;
    ws_.next_layer().socket().close(ignored);

    registry_.release(id_);
    if (on_finish_) on_finish_();
}

} // namespace psmonitor::networking
