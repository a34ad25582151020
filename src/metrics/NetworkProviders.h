#pragma once

#include <boost/json/value.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

// Linux readers for the /network snapshot. Blocking; run on the offload pool.
namespace psmonitor::metrics {

struct InterfaceCounters {
    std::string name;
    std::uint64_t rx_bytes = 0, rx_packets = 0, rx_errs = 0, rx_drop = 0;
    std::uint64_t tx_bytes = 0, tx_packets = 0, tx_errs = 0, tx_drop = 0;
};

// Parses /proc/net/dev (two header lines, then one line per interface).
std::vector<InterfaceCounters> parse_net_dev(std::istream& in);

struct WirelessLink {
    std::string interface;
    double link = 0;      // link quality, out of 70 for most drivers
    double level = 0;     // signal level, dBm
};

// Parses /proc/net/wireless; returns the first interface listed, if any.
std::vector<WirelessLink> parse_proc_wireless(std::istream& in);

// 802.11 channel for a frequency in MHz, 0 when unknown.
int channel_for_frequency(double mhz);

// ["lo", "eth0", ...] in the order the kernel reports them.
boost::json::value interface_names();

// {<iface>: {mb_sent, mb_received, pk_sent, pk_received, error_in, error_out, dropout}}
boost::json::value interface_statistics();
boost::json::value statistics_json(const std::vector<InterfaceCounters>& counters);

// {name, quality, channel, encryption, address, signal}; every field is an
// empty string when the host has no wireless interface.
boost::json::value wireless_info();

} // namespace psmonitor::metrics
