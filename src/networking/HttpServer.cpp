#include "networking/HttpServer.h"

#include "core/Error.h"
#include "core/Logger.h"
#include "networking/StreamSession.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json/object.hpp>

#include <atomic>
#include <string>

namespace psmonitor::networking {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace json = boost::json;
using tcp = asio::ip::tcp;

namespace {

constexpr std::chrono::seconds kRequestTimeout{30};

tcp::endpoint resolve(asio::io_context& ioc, const std::string& address, unsigned short port) {
    tcp::resolver resolver(ioc);
    auto results = resolver.resolve(address, std::to_string(port), tcp::resolver::passive);
    return results.begin()->endpoint();
}

} // namespace

class HttpServer::Impl {
public:
    Impl(asio::io_context& ioc,
         Options options,
         RequestRouter& router,
         session::SessionRegistry& registry,
         metrics::SnapshotService& snapshots)
        : ioc_(ioc),
          acceptor_(ioc),
          options_(std::move(options)),
          router_(router),
          registry_(registry),
          snapshots_(snapshots) {
        const tcp::endpoint endpoint = resolve(ioc_, options_.address, options_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);
        port_ = acceptor_.local_endpoint().port();
    }

    void start() {
        PSM_LOG_INFO("[HttpServer] listening on " << options_.address << ":" << port_);
        do_accept();
    }

    void stop() {
        stopping_ = true;

        beast::error_code ec;
        acceptor_.close(ec);

        // Close all streams; each one releases its own record
        registry_.close_all();
    }

    unsigned short local_port() const { return port_; }
    std::size_t active_streams() const { return streams_.load(); }

private:
    // One plain HTTP connection. Requests are served one at a time; a
    // WebSocket upgrade on /connect moves the socket into a StreamSession.
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(Impl& server, tcp::socket socket)
            : server_(server),
              stream_(std::move(socket)) {}

        void start() { do_read(); }

    private:
        void do_read() {
            req_ = {};
            stream_.expires_after(kRequestTimeout);
            http::async_read(
                stream_, buffer_, req_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    self->on_read(ec);
                });
        }

        void on_read(beast::error_code ec) {
            if (ec == http::error::end_of_stream) return do_close();
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != beast::error::timeout) {
                    PSM_LOG_DEBUG("[HttpSession] read: " << ec.message());
                }
                return;
            }

            if (websocket::is_upgrade(req_)) return upgrade();

            server_.router_.handle(
                req_, stream_.get_executor(),
                [self = shared_from_this()](Response res) { self->write(std::move(res)); });
        }

        void upgrade() {
            const unsigned version = req_.version();
            const Target target = parse_target(std::string_view(req_.target().data(), req_.target().size()));

            if (target.path != "/connect") {
                return write(json_response(http::status::not_found,
                                           json::object{{"error", "not_found"}, {"message", "no such route"}},
                                           version, false));
            }

            const auto query = [&](const char* key) {
                const auto it = target.query.find(key);
                return it == target.query.end() ? std::string() : it->second;
            };
            const std::string id = query("id");
            const std::string subscriber = query("subscriber");
            const auto feed = metrics::parse_feed_kind(query("feed"));

            if (id.empty() || subscriber.empty() || !feed) {
                PSM_LOG_INFO("[HttpServer] upgrade rejected: bad query " << req_.target());
                return write(error_response(make_error_code(errc::bad_request), version, false));
            }

            // kept-alive connections may still ask for a stream while draining
            if (server_.stopping_.load()) {
                PSM_LOG_INFO("[HttpServer] upgrade for " << id << " rejected: shutting down");
                return write(error_response(make_error_code(errc::shutting_down), version, false));
            }

            // capacity first, so a refused connection leaves the record claimable
            if (server_.streams_.load() >= server_.options_.max_streams) {
                PSM_LOG_WARN("[HttpServer] upgrade for " << id << " rejected: at capacity");
                return write(error_response(make_error_code(errc::capacity_exceeded), version, false));
            }

            stream_.expires_never();
            Impl& server = server_;
            auto stream = std::make_shared<StreamSession>(
                stream_.release_socket(), id, *feed, server.registry_, server.snapshots_,
                server.options_.publish_interval,
                [&server] { --server.streams_; });

            if (auto ec = server.registry_.claim(id, subscriber, stream)) {
                PSM_LOG_INFO("[HttpServer] claim " << id << " rejected: " << ec.message());
                return stream->reject(error_response(ec, version, false));
            }

            ++server.streams_;
            stream->start(std::move(req_));
        }

        void write(Response res) {
            auto msg = std::make_shared<Response>(std::move(res));
            if (server_.stopping_.load()) msg->keep_alive(false);
            const bool keep_alive = msg->keep_alive();

            http::async_write(
                stream_, *msg,
                [self = shared_from_this(), msg, keep_alive](beast::error_code ec, std::size_t) {
                    if (ec) {
                        PSM_LOG_DEBUG("[HttpSession] write: " << ec.message());
                        return;
                    }
                    if (!keep_alive) return self->do_close();
                    self->do_read();
                });
        }

        void do_close() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        Impl& server_;
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        Request req_;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    PSM_LOG_ERROR("[accept] " << ec.message());
                    return do_accept();
                }

                std::make_shared<HttpSession>(*this, std::move(socket))->start();
                do_accept();
            });
    }

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    Options options_;

    RequestRouter& router_;
    session::SessionRegistry& registry_;
    metrics::SnapshotService& snapshots_;

    std::atomic<std::size_t> streams_{0};
    std::atomic<bool> stopping_{false};
};

// ---- HttpServer wrapper ----

HttpServer::HttpServer(asio::io_context& ioc,
                       Options options,
                       RequestRouter& router,
                       session::SessionRegistry& registry,
                       metrics::SnapshotService& snapshots)
    : impl_(new Impl(ioc, std::move(options), router, registry, snapshots)) {}

HttpServer::~HttpServer() = default;

void HttpServer::start() { impl_->start(); }
void HttpServer::stop() { impl_->stop(); }

unsigned short HttpServer::local_port() const { return impl_->local_port(); }
std::size_t HttpServer::active_streams() const { return impl_->active_streams(); }

} // namespace psmonitor::networking
