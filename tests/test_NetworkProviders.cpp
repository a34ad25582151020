#include <doctest/doctest.h>

#include "metrics/NetworkProviders.h"

#include <boost/json.hpp>

#include <sstream>

using namespace psmonitor::metrics;
namespace json = boost::json;

namespace {

const char* const kNetDev =
    "Inter-|   Receive                                                |  Transmit\n"
    " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
    "    lo: 1048576     100    0    0    0     0          0         0  1048576     100    0    0    0     0       0          0\n"
    "  eth0: 2097152    2000    3    4    0     0          0         0  3145728    1500    5    6    0     0       0          0\n";

} // namespace

DOCTEST_TEST_CASE("parse_net_dev reads per-interface counters") {
    std::istringstream in(kNetDev);
    const auto counters = parse_net_dev(in);
    DOCTEST_REQUIRE_EQ(counters.size(), 2u);

    DOCTEST_CHECK_EQ(counters[0].name, "lo");
    const InterfaceCounters& eth = counters[1];
    DOCTEST_CHECK_EQ(eth.name, "eth0");
    DOCTEST_CHECK_EQ(eth.rx_bytes, 2097152u);
    DOCTEST_CHECK_EQ(eth.rx_packets, 2000u);
    DOCTEST_CHECK_EQ(eth.rx_errs, 3u);
    DOCTEST_CHECK_EQ(eth.rx_drop, 4u);
    DOCTEST_CHECK_EQ(eth.tx_bytes, 3145728u);
    DOCTEST_CHECK_EQ(eth.tx_packets, 1500u);
    DOCTEST_CHECK_EQ(eth.tx_errs, 5u);
    DOCTEST_CHECK_EQ(eth.tx_drop, 6u);
}

DOCTEST_TEST_CASE("statistics_json reports megabytes and packet counts") {
    std::istringstream in(kNetDev);
    const json::object stats = statistics_json(parse_net_dev(in)).as_object();
    const json::object& eth = stats.at("eth0").as_object();

    DOCTEST_CHECK_EQ(eth.at("mb_sent").as_double(), 3.0);
    DOCTEST_CHECK_EQ(eth.at("mb_received").as_double(), 2.0);
    DOCTEST_CHECK_EQ(eth.at("pk_sent").as_uint64(), 1500u);
    DOCTEST_CHECK_EQ(eth.at("pk_received").as_uint64(), 2000u);
    DOCTEST_CHECK_EQ(eth.at("error_in").as_uint64(), 3u);
    DOCTEST_CHECK_EQ(eth.at("error_out").as_uint64(), 5u);
    DOCTEST_CHECK_EQ(eth.at("dropout").as_uint64(), 10u);
}

DOCTEST_TEST_CASE("parse_proc_wireless reads link quality and level") {
    std::istringstream in(
        "Inter-| sta-|   Quality        |   Discarded packets               | Missed | WE\n"
        " face | tus | link level noise |  nwid  crypt   frag  retry   misc | beacon | 22\n"
        "wlan0: 0000   54.  -56.  -256        0      0      0      0     17        0\n");
    const auto links = parse_proc_wireless(in);
    DOCTEST_REQUIRE_EQ(links.size(), 1u);
    DOCTEST_CHECK_EQ(links[0].interface, "wlan0");
    DOCTEST_CHECK_EQ(links[0].link, 54.0);
    DOCTEST_CHECK_EQ(links[0].level, -56.0);

    std::istringstream headers_only(
        "Inter-| sta-|   Quality        |\n"
        " face | tus | link level noise |\n");
    DOCTEST_CHECK(parse_proc_wireless(headers_only).empty());
}

DOCTEST_TEST_CASE("channel_for_frequency covers 2.4, 5 and 6 GHz") {
    DOCTEST_CHECK_EQ(channel_for_frequency(2412), 1);
    DOCTEST_CHECK_EQ(channel_for_frequency(2437), 6);
    DOCTEST_CHECK_EQ(channel_for_frequency(2484), 14);
    DOCTEST_CHECK_EQ(channel_for_frequency(5180), 36);
    DOCTEST_CHECK_EQ(channel_for_frequency(5955), 1);
    DOCTEST_CHECK_EQ(channel_for_frequency(1234), 0);
}

DOCTEST_TEST_CASE("live network providers return the documented shapes") {
    const json::array names = interface_names().as_array();
    for (const auto& n : names) DOCTEST_CHECK(n.is_string());

    const json::object wireless = wireless_info().as_object();
    for (const char* key : {"name", "quality", "channel", "encryption", "address", "signal"}) {
        DOCTEST_CHECK(wireless.at(key).is_string());
    }

    DOCTEST_CHECK(interface_statistics().is_object());
}
