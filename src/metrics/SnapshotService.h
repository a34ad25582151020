#pragma once

#include "core/OffloadPool.h"
#include "metrics/SystemProviders.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace psmonitor::metrics {

using Provider = std::function<boost::json::value()>;

// Ordered list of (response key, provider). Keys appear in the snapshot in
// this order.
using Feed = std::vector<std::pair<std::string, Provider>>;

enum class FeedKind { System, Network };

std::optional<FeedKind> parse_feed_kind(std::string_view name);

// Fans one feed's providers out to the offload pool and assembles the
// results into a single JSON object. A provider that throws does not fail
// the snapshot: its key holds failure_marker(what()) instead.
class SnapshotService {
public:
    using Handler = std::function<void(boost::json::object)>;

    SnapshotService(OffloadPool& pool, Feed system, Feed network);

    // cpu, mem, disk, user, platform, processes
    static Feed system_feed(std::shared_ptr<CpuSampler> sampler);
    // interfaces, wireless, statistics
    static Feed network_feed();

    static boost::json::object failure_marker(const std::string& detail);

    // `done` runs on `ex` once every provider has reported. Completions are
    // serialized through `ex`, which must not run handlers concurrently
    // (single-threaded io_context or a strand).
    void gather(FeedKind kind, const boost::asio::any_io_executor& ex, Handler done);

private:
    OffloadPool& pool_;
    Feed system_;
    Feed network_;
};

} // namespace psmonitor::metrics
