#include "metrics/SystemProviders.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <pwd.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace json = boost::json;
namespace fs = std::filesystem;

namespace psmonitor::metrics {

namespace {

std::string trim(std::string s) {
    constexpr const char* whitespace = " \t\n\r\f\v";
    const auto first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

std::optional<double> read_number(const fs::path& path) {
    std::ifstream in(path);
    double v = 0;
    if (in >> v) return v;
    return std::nullopt;
}

std::string read_line(const fs::path& path) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    return trim(line);
}

std::string user_name(uid_t uid) {
    passwd pw{};
    passwd* result = nullptr;
    std::vector<char> buf(4096);
    if (::getpwuid_r(uid, &pw, buf.data(), buf.size(), &result) == 0 && result) {
        return result->pw_name;
    }
    return std::to_string(uid);
}

// First hwmon chip that looks like a CPU sensor, then thermal_zone0.
json::value cpu_temperature() {
    static const std::set<std::string> cpu_chips = {"coretemp", "k10temp", "zenpower", "cpu_thermal"};

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/sys/class/hwmon", ec)) {
        if (cpu_chips.count(read_line(entry.path() / "name")) == 0) continue;
        if (auto milli = read_number(entry.path() / "temp1_input")) return round_to(*milli / 1000.0, 2);
    }
    if (auto milli = read_number("/sys/class/thermal/thermal_zone0/temp")) {
        return round_to(*milli / 1000.0, 2);
    }
    return nullptr;
}

// MHz, averaged over all cores listed in /proc/cpuinfo.
json::value cpu_frequency() {
    if (auto khz = read_number("/sys/devices/system/cpu/cpu0/cpufreq/scaling_cur_freq")) {
        return round_to(*khz / 1000.0, 2);
    }

    std::ifstream in("/proc/cpuinfo");
    std::string line;
    double sum = 0;
    int count = 0;
    while (std::getline(in, line)) {
        if (line.rfind("cpu MHz", 0) != 0) continue;
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        sum += std::strtod(line.c_str() + colon + 1, nullptr);
        ++count;
    }
    if (count == 0) return nullptr;
    return round_to(sum / count, 2);
}

struct ProcSample {
    int pid = 0;
    std::string name;
    std::string username;
    double mem_mb = 0;
};

std::optional<ProcSample> read_process(const fs::path& dir, long page_size) {
    ProcSample p;
    p.pid = std::atoi(dir.filename().c_str());

    std::ifstream statm(dir / "statm");
    std::uint64_t size_pages = 0, resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) return std::nullopt;
    p.mem_mb = static_cast<double>(resident_pages) * static_cast<double>(page_size) / (1024.0 * 1024.0);

    std::ifstream status(dir / "status");
    if (!status.is_open()) return std::nullopt;

    std::string line;
    bool have_uid = false;
    while (std::getline(status, line)) {
        if (line.rfind("Name:", 0) == 0) {
            p.name = trim(line.substr(5));
        } else if (line.rfind("Uid:", 0) == 0) {
            std::istringstream iss(line.substr(4));
            uid_t uid = 0;
            if (iss >> uid) {
                p.username = user_name(uid);
                have_uid = true;
            }
        }
        if (!p.name.empty() && have_uid) break;
    }
    if (p.name.empty()) p.name = "unknown";
    return p;
}

} // namespace

std::optional<CpuTimes> parse_proc_stat(std::istream& in) {
    std::string line;
    if (!std::getline(in, line) || line.rfind("cpu ", 0) != 0) return std::nullopt;

    std::istringstream iss(line);
    std::string header;
    std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    iss >> header >> user >> nice >> system >> idle;
    if (!iss) return std::nullopt;
    iss >> iowait >> irq >> softirq >> steal;   // absent on very old kernels

    CpuTimes t;
    t.total = user + nice + system + idle + iowait + irq + softirq + steal;
    t.idle = idle + iowait;
    return t;
}

double CpuSampler::usage_between(const CpuTimes& prev, const CpuTimes& cur) {
    if (cur.total <= prev.total) return 0.0;
    const double total = static_cast<double>(cur.total - prev.total);
    const double idle = cur.idle >= prev.idle ? static_cast<double>(cur.idle - prev.idle) : 0.0;
    return std::clamp(100.0 * (total - idle) / total, 0.0, 100.0);
}

double CpuSampler::usage() {
    std::ifstream in("/proc/stat");
    auto cur = parse_proc_stat(in);
    if (!cur) throw std::runtime_error("cannot parse /proc/stat");

    std::lock_guard<std::mutex> lk(mu_);
    const double result = prev_ ? usage_between(*prev_, *cur) : 0.0;
    prev_ = cur;
    return round_to(result, 2);
}

std::optional<MemInfo> parse_meminfo(std::istream& in) {
    MemInfo m;
    bool have_total = false, have_available = false;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string key;
        std::uint64_t kb = 0;
        if (!(iss >> key >> kb)) continue;

        const std::uint64_t bytes = kb * 1024;
        if (key == "MemTotal:") { m.total = bytes; have_total = true; }
        else if (key == "MemFree:") m.free = bytes;
        else if (key == "MemAvailable:") { m.available = bytes; have_available = true; }
        else if (key == "Buffers:") m.buffers = bytes;
        else if (key == "Cached:" || key == "SReclaimable:") m.cached += bytes;
    }
    if (!have_total) return std::nullopt;
    if (!have_available) m.available = m.free + m.buffers + m.cached;
    return m;
}

std::optional<std::string> parse_os_release(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("PRETTY_NAME=", 0) != 0) continue;
        std::string value = trim(line.substr(12));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    }
    return std::nullopt;
}

std::string format_uptime(double seconds) {
    auto total = static_cast<std::uint64_t>(seconds < 0 ? 0 : seconds);
    const std::uint64_t days = total / 86400;
    total %= 86400;
    const std::uint64_t hours = total / 3600;
    total %= 3600;
    const std::uint64_t minutes = total / 60;
    const std::uint64_t secs = total % 60;

    std::string out;
    auto part = [&out](std::uint64_t n, const char* unit) {
        if (n == 0) return;
        if (!out.empty()) out += ", ";
        out += std::to_string(n) + " " + unit + (n != 1 ? "s" : "");
    };
    part(days, "day");
    part(hours, "hr");
    part(minutes, "min");
    part(secs, "sec");
    return out;
}

double round_to(double value, int places) {
    const double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

double bytes_to_gb(std::uint64_t bytes) {
    return round_to(static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0), 2);
}

json::value cpu_info(CpuSampler& sampler) {
    return json::object{
        {"usage", sampler.usage()},
        {"temp", cpu_temperature()},
        {"freq", cpu_frequency()},
    };
}

json::object memory_json(const MemInfo& m) {
    const std::uint64_t reclaim = m.free + m.buffers + m.cached;
    const std::uint64_t used = m.total > reclaim ? m.total - reclaim : 0;
    const double percent = m.total == 0 ? 0.0
        : 100.0 * static_cast<double>(m.total - std::min(m.available, m.total)) / static_cast<double>(m.total);

    return json::object{
        {"total", bytes_to_gb(m.total)},
        {"used", bytes_to_gb(used)},
        {"free", bytes_to_gb(m.free)},
        {"percent", round_to(percent, 1)},
    };
}

json::value memory_info() {
    std::ifstream in("/proc/meminfo");
    auto m = parse_meminfo(in);
    if (!m) throw std::runtime_error("cannot parse /proc/meminfo");
    return memory_json(*m);
}

json::value disk_info(const std::string& path) {
    struct statvfs st{};
    if (::statvfs(path.c_str(), &st) != 0) {
        throw std::runtime_error("statvfs(" + path + ") failed");
    }

    const std::uint64_t frsize = st.f_frsize;
    const std::uint64_t total = static_cast<std::uint64_t>(st.f_blocks) * frsize;
    const std::uint64_t free = static_cast<std::uint64_t>(st.f_bavail) * frsize;
    const std::uint64_t used = static_cast<std::uint64_t>(st.f_blocks - st.f_bfree) * frsize;
    const double percent = (used + free) == 0 ? 0.0
        : 100.0 * static_cast<double>(used) / static_cast<double>(used + free);

    return json::object{
        {"total", bytes_to_gb(total)},
        {"used", bytes_to_gb(used)},
        {"free", bytes_to_gb(free)},
        {"percent", round_to(percent, 1)},
    };
}

json::value current_user() {
    return json::value(user_name(::getuid()));
}

json::value platform_info() {
    std::string distro = "Unknown";
    for (const char* path : {"/etc/os-release", "/usr/lib/os-release"}) {
        std::ifstream in(path);
        if (!in.is_open()) continue;
        if (auto name = parse_os_release(in)) {
            distro = *name;
            break;
        }
    }

    std::string kernel = "Unknown";
    utsname uts{};
    if (::uname(&uts) == 0) kernel = uts.release;

    std::string uptime = "N/A";
    std::ifstream in("/proc/uptime");
    double seconds = 0;
    if (in >> seconds) uptime = format_uptime(seconds);

    return json::object{
        {"distro", distro},
        {"kernel", kernel},
        {"uptime", uptime},
    };
}

json::value top_processes(std::size_t limit) {
    struct Aggregate {
        double mem_mb = 0;
        int first_pid = 0;
        std::set<std::string> usernames;
    };

    const long page_size = ::sysconf(_SC_PAGESIZE);
    std::map<std::string, Aggregate> by_name;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) continue;

        // processes exit while we walk /proc; skip whatever vanished
        auto p = read_process(entry.path(), page_size);
        if (!p) continue;

        Aggregate& agg = by_name[p->name];
        if (agg.first_pid == 0 || p->pid < agg.first_pid) agg.first_pid = p->pid;
        agg.mem_mb += p->mem_mb;
        if (!p->username.empty()) agg.usernames.insert(p->username);
    }
    if (ec) throw std::runtime_error("cannot list /proc: " + ec.message());

    std::vector<std::pair<std::string, Aggregate>> ranked(by_name.begin(), by_name.end());
    std::sort(ranked.begin(), ranked.end(),
              [](const auto& a, const auto& b) { return a.second.mem_mb > b.second.mem_mb; });
    if (ranked.size() > limit) ranked.resize(limit);

    json::array out;
    for (const auto& [name, agg] : ranked) {
        std::string users;
        for (const auto& u : agg.usernames) {
            if (!users.empty()) users += ", ";
            users += u;
        }
        out.push_back(json::object{
            {"pid", agg.first_pid},
            {"name", name},
            {"username", users},
            {"mem", round_to(agg.mem_mb, 2)},
        });
    }
    return out;
}

} // namespace psmonitor::metrics
