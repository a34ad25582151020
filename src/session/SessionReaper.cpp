#include "session/SessionReaper.h"

#include "core/Logger.h"

#include <boost/asio/steady_timer.hpp>

namespace psmonitor::session {

namespace asio = boost::asio;

class SessionReaper::Impl : public std::enable_shared_from_this<Impl> {
public:
    Impl(asio::io_context& ioc, SessionRegistry& registry, std::chrono::milliseconds interval)
        : registry_(registry),
          interval_(interval),
          timer_(ioc) {}

    void start() {
        running_ = true;
        arm();
    }

    void stop() {
        running_ = false;
        timer_.cancel();
    }

private:
    void arm() {
        timer_.expires_after(interval_);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec == asio::error::operation_aborted || !self->running_) return;
            if (ec) {
                PSM_LOG_WARN("[SessionReaper] timer: " << ec.message());
            } else {
                self->registry_.sweep();
            }
            self->arm();
        });
    }

    SessionRegistry& registry_;
    std::chrono::milliseconds interval_;
    asio::steady_timer timer_;
    bool running_ = false;
};

SessionReaper::SessionReaper(asio::io_context& ioc,
                             SessionRegistry& registry,
                             std::chrono::milliseconds interval)
    : impl_(std::make_shared<Impl>(ioc, registry, interval)) {}

SessionReaper::~SessionReaper() {
    impl_->stop();
}

void SessionReaper::start() { impl_->start(); }
void SessionReaper::stop() { impl_->stop(); }

} // namespace psmonitor::session
