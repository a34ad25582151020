#pragma once

#include "session/SessionRegistry.h"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>

namespace psmonitor::session {

// Periodically sweeps the registry from a steady_timer on the given
// io_context. stop() cancels the timer; it is safe to call more than once.
class SessionReaper {
public:
    SessionReaper(boost::asio::io_context& ioc,
                  SessionRegistry& registry,
                  std::chrono::milliseconds interval = std::chrono::seconds(1));
    ~SessionReaper();

    SessionReaper(const SessionReaper&) = delete;
    SessionReaper& operator=(const SessionReaper&) = delete;

    void start();
    void stop();

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace psmonitor::session
