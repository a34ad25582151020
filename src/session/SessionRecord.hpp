#pragma once
#include <chrono>
#include <memory>
#include <string>

namespace psmonitor::session {

// What the registry knows about a bound stream: enough to shut it down.
class StreamConnection {
public:
    virtual ~StreamConnection() = default;
    virtual void close() = 0;
};

struct SessionRecord {
    using Clock = std::chrono::steady_clock;

    std::string id;        // "worker-<base32>"
    std::string subject;   // token "sub" of the creator

    Clock::time_point created_at{};
    bool claimed = false;

    // Set exactly once, together with `claimed`.
    std::shared_ptr<StreamConnection> connection;

    bool expired(Clock::time_point now, Clock::duration grace) const noexcept {
        return !claimed && now - created_at > grace;
    }
};

} // namespace psmonitor::session
