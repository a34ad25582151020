#pragma once

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

// Linux readers for the /system snapshot. Every function may block on the
// filesystem and is meant to run on the offload pool. Failures that make a
// whole domain unreadable throw std::runtime_error; a missing optional
// sensor (temperature, frequency) is reported as null.
namespace psmonitor::metrics {

// Aggregate CPU times from the first line of /proc/stat.
struct CpuTimes {
    std::uint64_t total = 0;
    std::uint64_t idle = 0;
};

std::optional<CpuTimes> parse_proc_stat(std::istream& in);

// Keeps the previous /proc/stat sample so usage covers the interval between
// two calls. The first call reports 0.
class CpuSampler {
public:
    double usage();

    // Usage between `prev` and `cur` in percent, 0 when no time elapsed.
    static double usage_between(const CpuTimes& prev, const CpuTimes& cur);

private:
    std::mutex mu_;
    std::optional<CpuTimes> prev_;
};

struct MemInfo {
    std::uint64_t total = 0;       // bytes
    std::uint64_t free = 0;
    std::uint64_t available = 0;
    std::uint64_t buffers = 0;
    std::uint64_t cached = 0;
};

std::optional<MemInfo> parse_meminfo(std::istream& in);

// PRETTY_NAME from an os-release file, unquoted.
std::optional<std::string> parse_os_release(std::istream& in);

// "1 day, 2 hrs, 3 mins, 4 secs"; zero-valued parts are omitted.
std::string format_uptime(double seconds);

double round_to(double value, int places);
double bytes_to_gb(std::uint64_t bytes);

// {usage, temp, freq}
boost::json::value cpu_info(CpuSampler& sampler);

// {total, used, free, percent}, sizes in GB
boost::json::value memory_info();
boost::json::object memory_json(const MemInfo& m);

// {total, used, free, percent} for the filesystem holding `path`, in GB
boost::json::value disk_info(const std::string& path = "/");

// Login name of the server process owner.
boost::json::value current_user();

// {distro, kernel, uptime}
boost::json::value platform_info();

// Top `limit` process names by resident memory, aggregated by name:
// [{pid, name, username, mem}] with mem in MB.
boost::json::value top_processes(std::size_t limit = 10);

} // namespace psmonitor::metrics
