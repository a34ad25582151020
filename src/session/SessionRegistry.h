#pragma once

#include "session/IDGenerator.hpp"
#include "session/SessionRecord.hpp"

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace psmonitor::session {

// Owns every session record. One mutex guards the table, so create, claim,
// release and sweep are mutually exclusive.
class SessionRegistry {
public:
    using Clock = SessionRecord::Clock;

    explicit SessionRegistry(Clock::duration grace = std::chrono::seconds(5));

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Inserts an unclaimed record for `subject` and returns its identifier.
    // Throws std::logic_error if the generator repeats an identifier.
    std::string create(const std::string& subject, Clock::time_point now = Clock::now());

    // Binds `connection` to the record. Errors: errc::not_found,
    // errc::subject_mismatch, errc::already_claimed. On error the record is
    // left exactly as it was.
    boost::system::error_code claim(const std::string& id,
                                    const std::string& subject,
                                    std::shared_ptr<StreamConnection> connection = nullptr);

    // Destroys the record. Returns false if it was already gone.
    bool release(const std::string& id);

    // Destroys unclaimed records older than the grace period. Returns how
    // many were removed.
    std::size_t sweep(Clock::time_point now = Clock::now());

    // Closes every bound connection and empties the table (shutdown).
    void close_all();

    bool contains(const std::string& id) const;
    bool is_claimed(const std::string& id) const;
    std::size_t size() const;
    std::size_t pending() const;
    std::size_t active() const;

    Clock::duration grace_period() const noexcept { return grace_; }

private:
    const Clock::duration grace_;
    IDGenerator idgen_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, SessionRecord> records_;
};

} // namespace psmonitor::session
