#include <doctest/doctest.h>

#include "networking/HttpServer.h"
#include "networking/RequestRouter.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>

#include <functional>
#include <future>
#include <thread>

using namespace psmonitor;
using namespace psmonitor::networking;
using namespace std::chrono_literals;

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace json = boost::json;
using tcp = asio::ip::tcp;

namespace {

metrics::Feed system_feed() {
    return {
        {"cpu", [] { return json::value(json::object{{"usage", 1.0}}); }},
        {"mem", [] { return json::value(json::object{{"total", 2.0}}); }},
    };
}

// One frame far larger than the socket buffers of a client that never reads.
metrics::Feed bulky_feed() {
    return {
        {"blob", [] { return json::value(json::string(std::size_t{1} << 20, 'x')); }},
    };
}

metrics::Feed network_feed() {
    return {
        {"interfaces", [] { return json::value(json::array{"lo"}); }},
    };
}

HttpServer::Options loopback(std::size_t max_streams, std::chrono::milliseconds interval) {
    HttpServer::Options options;
    options.address = "127.0.0.1";
    options.port = 0;
    options.max_streams = max_streams;
    options.publish_interval = interval;
    return options;
}

// A full server on an ephemeral loopback port, its io_context on a
// background thread.
struct ServerHarness {
    asio::io_context ioc;
    OffloadPool pool{2};
    session::SessionRegistry registry{5s};
    auth::CredentialStore credentials = auth::CredentialStore::with_password("psmonitor", "hunter2", 1000);
    auth::TokenService tokens{60s, "e2e-secret"};
    metrics::SnapshotService snapshots;
    RequestRouter router{registry, credentials, tokens, snapshots, pool};
    HttpServer server;
    std::thread runner;

    explicit ServerHarness(std::size_t max_streams = 20,
                           metrics::Feed feed = system_feed(),
                           std::chrono::milliseconds interval = 50ms)
        : snapshots(pool, std::move(feed), network_feed()),
          server(ioc, loopback(max_streams, interval), router, registry, snapshots) {
        server.start();
        runner = std::thread([this] { ioc.run(); });
    }

    ~ServerHarness() {
        shutdown();
        runner.join();
    }

    void shutdown() {
        asio::post(ioc, [this] {
            server.stop();
            ioc.stop();
        });
    }

    // Runs server.stop() on the loop and waits for it.
    void stop_server() {
        std::promise<void> done;
        asio::post(ioc, [this, &done] {
            server.stop();
            done.set_value();
        });
        done.get_future().wait();
    }

    tcp::endpoint endpoint() const {
        return {asio::ip::make_address("127.0.0.1"), server.local_port()};
    }

    std::string subject() const { return credentials.account().id; }
};

bool eventually(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 3s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

Response http_call(const tcp::endpoint& ep, http::verb verb, const std::string& target,
                   const std::string& body = {}, const std::string& authorization = {}) {
    asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(ep);

    Request req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!authorization.empty()) req.set(http::field::authorization, authorization);
    req.body() = body;
    req.prepare_payload();
    http::write(stream, req);

    beast::flat_buffer buffer;
    Response res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

std::string login(const tcp::endpoint& ep) {
    const Response res = http_call(ep, http::verb::post, "/authenticate",
                                   R"({"username":"psmonitor","password":"hunter2"})");
    DOCTEST_REQUIRE_EQ(res.result(), http::status::ok);
    return "Bearer " + json::value_to<std::string>(json::parse(res.body()).as_object().at("token"));
}

std::string new_worker(const tcp::endpoint& ep, const std::string& bearer) {
    const Response res = http_call(ep, http::verb::post, "/worker", {}, bearer);
    DOCTEST_REQUIRE_EQ(res.result(), http::status::ok);
    return json::value_to<std::string>(json::parse(res.body()).as_object().at("id"));
}

struct StreamClient {
    asio::io_context ioc;
    websocket::stream<tcp::socket> ws{ioc};
    beast::flat_buffer buffer;

    // Returns the handshake status: 101 on success, the rejection otherwise.
    http::status connect(const tcp::endpoint& ep, const std::string& target) {
        ws.next_layer().connect(ep);
        websocket::response_type res;
        beast::error_code ec;
        ws.handshake(res, "127.0.0.1", target, ec);
        return res.result();
    }

    std::string read() {
        buffer.consume(buffer.size());
        ws.read(buffer);
        return beast::buffers_to_string(buffer.data());
    }
};

std::string connect_target(const std::string& id, const std::string& subscriber, const std::string& feed = {}) {
    std::string target = "/connect?id=" + id + "&subscriber=" + subscriber;
    if (!feed.empty()) target += "&feed=" + feed;
    return target;
}

} // namespace

DOCTEST_TEST_CASE("authenticate, create a worker, stream and disconnect") {
    ServerHarness h;
    const auto ep = h.endpoint();

    const std::string id = new_worker(ep, login(ep));
    DOCTEST_CHECK(h.registry.contains(id));
    DOCTEST_CHECK_FALSE(h.registry.is_claimed(id));

    StreamClient client;
    DOCTEST_REQUIRE_EQ(client.connect(ep, connect_target(id, h.subject())), http::status::switching_protocols);
    DOCTEST_CHECK(h.registry.is_claimed(id));
    DOCTEST_CHECK_EQ(h.server.active_streams(), 1u);

    DOCTEST_CHECK_EQ(client.read(), "connected to monitor, transmitting data...");

    const json::object first = json::parse(client.read()).as_object();
    DOCTEST_CHECK(first.contains("cpu"));
    DOCTEST_CHECK(first.contains("mem"));
    const json::object second = json::parse(client.read()).as_object();
    DOCTEST_CHECK(second.contains("cpu"));

    client.ws.close(websocket::close_code::normal);

    DOCTEST_CHECK(eventually([&] { return !h.registry.contains(id); }));
    DOCTEST_CHECK(eventually([&] { return h.server.active_streams() == 0; }));

    // a released worker cannot be claimed again
    StreamClient again;
    DOCTEST_CHECK_EQ(again.connect(ep, connect_target(id, h.subject())), http::status::not_found);
}

DOCTEST_TEST_CASE("network feed is selected by query parameter") {
    ServerHarness h;
    const auto ep = h.endpoint();
    const std::string id = new_worker(ep, login(ep));

    StreamClient client;
    DOCTEST_REQUIRE_EQ(client.connect(ep, connect_target(id, h.subject(), "network")),
                       http::status::switching_protocols);
    client.read();  // greeting

    const json::object snap = json::parse(client.read()).as_object();
    DOCTEST_CHECK(snap.contains("interfaces"));
    DOCTEST_CHECK_FALSE(snap.contains("cpu"));
}

DOCTEST_TEST_CASE("claim failures reject the upgrade") {
    ServerHarness h;
    const auto ep = h.endpoint();
    const std::string bearer = login(ep);
    const std::string id = new_worker(ep, bearer);

    StreamClient unknown;
    DOCTEST_CHECK_EQ(unknown.connect(ep, connect_target("worker-unknown", h.subject())), http::status::not_found);

    StreamClient stranger;
    DOCTEST_CHECK_EQ(stranger.connect(ep, connect_target(id, "account-someone-else")), http::status::forbidden);
    DOCTEST_CHECK_FALSE(h.registry.is_claimed(id));

    StreamClient malformed;
    DOCTEST_CHECK_EQ(malformed.connect(ep, "/connect?id=" + id), http::status::bad_request);

    StreamClient bad_feed;
    DOCTEST_CHECK_EQ(bad_feed.connect(ep, connect_target(id, h.subject(), "disk")), http::status::bad_request);

    StreamClient owner;
    DOCTEST_REQUIRE_EQ(owner.connect(ep, connect_target(id, h.subject())), http::status::switching_protocols);

    StreamClient second;
    DOCTEST_CHECK_EQ(second.connect(ep, connect_target(id, h.subject())), http::status::conflict);
    DOCTEST_CHECK(h.registry.is_claimed(id));

    StreamClient late_stranger;
    DOCTEST_CHECK_EQ(late_stranger.connect(ep, connect_target(id, "account-someone-else")), http::status::forbidden);
}

DOCTEST_TEST_CASE("connections beyond capacity are refused before claiming") {
    ServerHarness h(1);
    const auto ep = h.endpoint();
    const std::string bearer = login(ep);
    const std::string first_id = new_worker(ep, bearer);
    const std::string second_id = new_worker(ep, bearer);

    StreamClient first;
    DOCTEST_REQUIRE_EQ(first.connect(ep, connect_target(first_id, h.subject())), http::status::switching_protocols);

    StreamClient second;
    DOCTEST_CHECK_EQ(second.connect(ep, connect_target(second_id, h.subject())), http::status::service_unavailable);
    DOCTEST_CHECK(h.registry.contains(second_id));
    DOCTEST_CHECK_FALSE(h.registry.is_claimed(second_id));
}

DOCTEST_TEST_CASE("server shutdown closes open streams") {
    ServerHarness h;
    const auto ep = h.endpoint();
    const std::string id = new_worker(ep, login(ep));

    StreamClient client;
    DOCTEST_REQUIRE_EQ(client.connect(ep, connect_target(id, h.subject())), http::status::switching_protocols);
    client.read();

    h.stop_server();

    beast::error_code ec;
    for (int i = 0; i < 100 && !ec; ++i) {
        client.buffer.consume(client.buffer.size());
        client.ws.read(client.buffer, ec);
    }
    DOCTEST_CHECK_EQ(ec, beast::error_code(websocket::error::closed));
    DOCTEST_CHECK_EQ(h.registry.size(), 0u);
    DOCTEST_CHECK(eventually([&] { return h.server.active_streams() == 0; }));
}

DOCTEST_TEST_CASE("a client that stops reading is dropped and released") {
    ServerHarness h(20, bulky_feed(), 20ms);
    const auto ep = h.endpoint();
    const std::string id = new_worker(ep, login(ep));

    StreamClient client;
    client.ws.next_layer().open(tcp::v4());
    client.ws.next_layer().set_option(asio::socket_base::receive_buffer_size(4096));
    DOCTEST_REQUIRE_EQ(client.connect(ep, connect_target(id, h.subject())), http::status::switching_protocols);
    DOCTEST_CHECK(h.registry.is_claimed(id));

    // never read: the first frame stalls and the following ticks are dropped
    DOCTEST_CHECK(eventually([&] { return !h.registry.contains(id); }, 5s));
    DOCTEST_CHECK(eventually([&] { return h.server.active_streams() == 0; }));
}

DOCTEST_TEST_CASE("upgrades on kept-alive connections are refused once stopping") {
    ServerHarness h;
    const auto ep = h.endpoint();
    const std::string id = new_worker(ep, login(ep));

    StreamClient client;
    client.ws.next_layer().connect(ep);

    // a plain request first, so the server has accepted this connection
    Request index{http::verb::get, "/", 11};
    index.set(http::field::host, "127.0.0.1");
    http::write(client.ws.next_layer(), index);
    Response res;
    http::read(client.ws.next_layer(), client.buffer, res);
    DOCTEST_REQUIRE_EQ(res.result(), http::status::ok);
    DOCTEST_REQUIRE(res.keep_alive());

    h.stop_server();

    websocket::response_type upgrade;
    beast::error_code ec;
    client.ws.handshake(upgrade, "127.0.0.1", connect_target(id, h.subject()), ec);
    DOCTEST_CHECK(ec);
    DOCTEST_CHECK_EQ(upgrade.result(), http::status::service_unavailable);
    DOCTEST_CHECK_EQ(h.server.active_streams(), 0u);
}
