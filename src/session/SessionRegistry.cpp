#include "session/SessionRegistry.h"

#include "core/Error.h"
#include "core/Logger.h"

#include <stdexcept>
#include <utility>
#include <vector>

namespace psmonitor::session {

SessionRegistry::SessionRegistry(Clock::duration grace)
    : grace_(grace) {}

std::string SessionRegistry::create(const std::string& subject, Clock::time_point now) {
    std::string id = idgen_.workerID();

    SessionRecord record;
    record.id = id;
    record.subject = subject;
    record.created_at = now;

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto [it, inserted] = records_.emplace(id, std::move(record));
        if (!inserted) {
            throw std::logic_error("session id generated twice: " + id);
        }
    }

    PSM_LOG_DEBUG("[SessionRegistry] created " << id << " for " << subject);
    return id;
}

boost::system::error_code SessionRegistry::claim(const std::string& id,
                                                 const std::string& subject,
                                                 std::shared_ptr<StreamConnection> connection) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = records_.find(id);
    if (it == records_.end()) return make_error_code(errc::not_found);

    SessionRecord& record = it->second;
    if (record.subject != subject) return make_error_code(errc::subject_mismatch);
    if (record.claimed) return make_error_code(errc::already_claimed);

    record.claimed = true;
    record.connection = std::move(connection);
    return {};
}

bool SessionRegistry::release(const std::string& id) {
    std::shared_ptr<StreamConnection> connection;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = records_.find(id);
        if (it == records_.end()) return false;
        connection = std::move(it->second.connection);
        records_.erase(it);
    }
    // connection (if last owner) is destroyed outside the lock
    PSM_LOG_DEBUG("[SessionRegistry] released " << id);
    return true;
}

std::size_t SessionRegistry::sweep(Clock::time_point now) {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = records_.begin(); it != records_.end();) {
            if (it->second.expired(now, grace_)) {
                it = records_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) PSM_LOG_DEBUG("[SessionRegistry] reaped " << removed << " unclaimed worker(s)");
    return removed;
}

void SessionRegistry::close_all() {
    std::vector<std::shared_ptr<StreamConnection>> connections;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, record] : records_) {
            if (record.connection) connections.push_back(std::move(record.connection));
        }
        records_.clear();
    }
    for (auto& c : connections) c->close();
}

bool SessionRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return records_.count(id) != 0;
}

bool SessionRegistry::is_claimed(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(id);
    return it != records_.end() && it->second.claimed;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return records_.size();
}

std::size_t SessionRegistry::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t n = 0;
    for (const auto& [id, record] : records_) {
        if (!record.claimed) ++n;
    }
    return n;
}

std::size_t SessionRegistry::active() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t n = 0;
    for (const auto& [id, record] : records_) {
        if (record.claimed) ++n;
    }
    return n;
}

} // namespace psmonitor::session
