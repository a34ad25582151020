#include "metrics/NetworkProviders.h"

#include "metrics/SystemProviders.h"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <ifaddrs.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <linux/wireless.h>

namespace json = boost::json;

namespace psmonitor::metrics {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

double to_mb(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

// Owns a datagram socket used only as an ioctl handle.
class IoctlSocket {
public:
    IoctlSocket() : fd_(::socket(AF_INET, SOCK_DGRAM, 0)) {}
    ~IoctlSocket() { if (fd_ >= 0) ::close(fd_); }

    IoctlSocket(const IoctlSocket&) = delete;
    IoctlSocket& operator=(const IoctlSocket&) = delete;

    bool valid() const { return fd_ >= 0; }

    bool query(const std::string& iface, unsigned long request, iwreq& wrq) const {
        std::strncpy(wrq.ifr_name, iface.c_str(), IFNAMSIZ - 1);
        return ::ioctl(fd_, request, &wrq) >= 0;
    }

private:
    int fd_;
};

std::string query_essid(const IoctlSocket& sock, const std::string& iface) {
    char essid[IW_ESSID_MAX_SIZE + 1] = {};
    iwreq wrq{};
    wrq.u.essid.pointer = essid;
    wrq.u.essid.length = IW_ESSID_MAX_SIZE;
    if (!sock.query(iface, SIOCGIWESSID, wrq)) return {};
    return std::string(essid, std::min<std::size_t>(wrq.u.essid.length, IW_ESSID_MAX_SIZE));
}

std::string query_access_point(const IoctlSocket& sock, const std::string& iface) {
    iwreq wrq{};
    if (!sock.query(iface, SIOCGIWAP, wrq)) return {};

    const auto* mac = reinterpret_cast<const unsigned char*>(wrq.u.ap_addr.sa_data);
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                  mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return buf;
}

std::string query_channel(const IoctlSocket& sock, const std::string& iface) {
    iwreq wrq{};
    if (!sock.query(iface, SIOCGIWFREQ, wrq)) return {};

    const double value = static_cast<double>(wrq.u.freq.m) * std::pow(10.0, wrq.u.freq.e);
    // drivers report either a channel number or a frequency in Hz
    const int channel = value < 1000.0 ? static_cast<int>(value) : channel_for_frequency(value / 1e6);
    return channel > 0 ? std::to_string(channel) : std::string();
}

std::string query_encryption(const IoctlSocket& sock, const std::string& iface) {
    char key[IW_ENCODING_TOKEN_MAX] = {};
    iwreq wrq{};
    wrq.u.data.pointer = key;
    wrq.u.data.length = sizeof(key);
    if (!sock.query(iface, SIOCGIWENCODE, wrq)) return {};
    return (wrq.u.data.flags & IW_ENCODE_DISABLED) ? "Open" : "Encrypted";
}

} // namespace

std::vector<InterfaceCounters> parse_net_dev(std::istream& in) {
    std::vector<InterfaceCounters> out;
    std::string line;

    // header 2 lines
    if (!std::getline(in, line) || !std::getline(in, line)) return out;

    while (std::getline(in, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        InterfaceCounters c;
        c.name = trim(line.substr(0, colon));

        std::istringstream iss(line.substr(colon + 1));
        std::uint64_t rx_fifo = 0, rx_frame = 0, rx_comp = 0, rx_mcast = 0;
        if (!(iss >> c.rx_bytes >> c.rx_packets >> c.rx_errs >> c.rx_drop
                  >> rx_fifo >> rx_frame >> rx_comp >> rx_mcast
                  >> c.tx_bytes >> c.tx_packets >> c.tx_errs >> c.tx_drop)) {
            continue;
        }
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<WirelessLink> parse_proc_wireless(std::istream& in) {
    std::vector<WirelessLink> out;
    std::string line;
    if (!std::getline(in, line) || !std::getline(in, line)) return out;

    while (std::getline(in, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        WirelessLink w;
        w.interface = trim(line.substr(0, colon));

        std::istringstream iss(line.substr(colon + 1));
        std::string status;
        if (!(iss >> status >> w.link >> w.level)) continue;
        out.push_back(std::move(w));
    }
    return out;
}

int channel_for_frequency(double mhz) {
    const int f = static_cast<int>(std::lround(mhz));
    if (f == 2484) return 14;
    if (f >= 2412 && f <= 2472) return (f - 2407) / 5;
    if (f >= 5160 && f <= 5885) return (f - 5000) / 5;
    if (f >= 5955 && f <= 7115) return (f - 5950) / 5;
    return 0;
}

json::value interface_names() {
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) throw std::runtime_error("getifaddrs failed");

    json::array names;
    for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_name) continue;
        const json::string_view name(ifa->ifa_name);
        if (std::find(names.begin(), names.end(), json::value(name)) == names.end()) {
            names.emplace_back(name);
        }
    }
    ::freeifaddrs(list);
    return names;
}

json::value statistics_json(const std::vector<InterfaceCounters>& counters) {
    json::object out;
    for (const auto& c : counters) {
        out[c.name] = json::object{
            {"mb_sent", to_mb(c.tx_bytes)},
            {"mb_received", to_mb(c.rx_bytes)},
            {"pk_sent", c.tx_packets},
            {"pk_received", c.rx_packets},
            {"error_in", c.rx_errs},
            {"error_out", c.tx_errs},
            {"dropout", c.rx_drop + c.tx_drop},
        };
    }
    return out;
}

json::value interface_statistics() {
    std::ifstream in("/proc/net/dev");
    if (!in.is_open()) throw std::runtime_error("cannot open /proc/net/dev");
    return statistics_json(parse_net_dev(in));
}

json::value wireless_info() {
    json::object out{
        {"name", ""},
        {"quality", ""},
        {"channel", ""},
        {"encryption", ""},
        {"address", ""},
        {"signal", ""},
    };

    std::ifstream in("/proc/net/wireless");
    const auto links = parse_proc_wireless(in);
    if (links.empty()) return out;

    const WirelessLink& w = links.front();
    out["quality"] = std::to_string(static_cast<int>(std::lround(std::clamp(w.link / 70.0, 0.0, 1.0) * 100.0)));
    out["signal"] = std::to_string(static_cast<int>(std::lround(w.level))) + " dBm";

    IoctlSocket sock;
    if (sock.valid()) {
        out["name"] = query_essid(sock, w.interface);
        out["channel"] = query_channel(sock, w.interface);
        out["encryption"] = query_encryption(sock, w.interface);
        out["address"] = query_access_point(sock, w.interface);
    }
    return out;
}

} // namespace psmonitor::metrics
