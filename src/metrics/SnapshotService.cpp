#include "metrics/SnapshotService.h"

#include "core/Error.h"
#include "core/Logger.h"
#include "metrics/NetworkProviders.h"

#include <boost/asio/post.hpp>

namespace json = boost::json;

namespace psmonitor::metrics {

std::optional<FeedKind> parse_feed_kind(std::string_view name) {
    if (name.empty() || name == "system") return FeedKind::System;
    if (name == "network") return FeedKind::Network;
    return std::nullopt;
}

SnapshotService::SnapshotService(OffloadPool& pool, Feed system, Feed network)
    : pool_(pool),
      system_(std::move(system)),
      network_(std::move(network)) {}

Feed SnapshotService::system_feed(std::shared_ptr<CpuSampler> sampler) {
    return {
        {"cpu", [sampler] { return cpu_info(*sampler); }},
        {"mem", [] { return memory_info(); }},
        {"disk", [] { return disk_info("/"); }},
        {"user", [] { return current_user(); }},
        {"platform", [] { return platform_info(); }},
        {"processes", [] { return top_processes(10); }},
    };
}

Feed SnapshotService::network_feed() {
    return {
        {"interfaces", [] { return interface_names(); }},
        {"wireless", [] { return wireless_info(); }},
        {"statistics", [] { return interface_statistics(); }},
    };
}

json::object SnapshotService::failure_marker(const std::string& detail) {
    return json::object{
        {"error", error_name(make_error_code(errc::provider_failure))},
        {"message", detail},
    };
}

void SnapshotService::gather(FeedKind kind, const boost::asio::any_io_executor& ex, Handler done) {
    const Feed& feed = kind == FeedKind::System ? system_ : network_;

    struct State {
        json::object result;
        std::size_t remaining = 0;
        Handler done;
    };
    auto state = std::make_shared<State>();
    state->remaining = feed.size();
    state->done = std::move(done);

    if (feed.empty()) {
        boost::asio::post(ex, [state] { state->done(std::move(state->result)); });
        return;
    }

    // reserve the keys so the response keeps the feed order
    for (const auto& [key, provider] : feed) state->result[key] = nullptr;

    for (const auto& [key, provider] : feed) {
        pool_.submit(provider, ex, [state, key = key](TaskResult<json::value> r) {
            if (r.ec) {
                PSM_LOG_WARN("[SnapshotService] " << key << ": " << r.ec.message()
                             << (r.detail.empty() ? "" : ": ") << r.detail);
                state->result[key] = failure_marker(r.detail.empty() ? r.ec.message() : r.detail);
            } else {
                state->result[key] = std::move(r.value);
            }

            if (--state->remaining == 0) state->done(std::move(state->result));
        });
    }
}

} // namespace psmonitor::metrics
