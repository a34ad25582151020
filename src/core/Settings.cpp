#include "core/Settings.h"

#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <pwd.h>
#include <unistd.h>

namespace json = boost::json;
namespace po = boost::program_options;

namespace psmonitor {

namespace {

std::string home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return ".";
}

std::int64_t get_int(const json::object& obj, const char* key, std::int64_t current) {
    const json::value* v = obj.if_contains(key);
    if (!v) return current;
    if (!v->is_int64() && !v->is_uint64()) {
        throw std::runtime_error(std::string("setting '") + key + "' must be an integer");
    }
    const std::int64_t n = v->is_int64() ? v->get_int64() : static_cast<std::int64_t>(v->get_uint64());
    if (n < 0) throw std::runtime_error(std::string("setting '") + key + "' must not be negative");
    return n;
}

std::string get_string(const json::object& obj, const char* key, const std::string& current) {
    const json::value* v = obj.if_contains(key);
    if (!v) return current;
    if (!v->is_string()) throw std::runtime_error(std::string("setting '") + key + "' must be a string");
    return json::value_to<std::string>(*v);
}

bool get_bool(const json::object& obj, const char* key, bool current) {
    const json::value* v = obj.if_contains(key);
    if (!v) return current;
    if (!v->is_bool()) throw std::runtime_error(std::string("setting '") + key + "' must be a boolean");
    return v->get_bool();
}

LogLevel level_or_throw(const std::string& name) {
    auto level = parse_log_level(name);
    if (!level) throw std::runtime_error("unknown log level '" + name + "'");
    return *level;
}

} // namespace

std::size_t Settings::default_pool_size() {
    const unsigned cores = std::max(1u, std::thread::hardware_concurrency());
    return std::min<std::size_t>(cores * 2u, 16u);
}

Settings Settings::defaults() {
    Settings s;
    const std::filesystem::path home(home_dir());
    s.data_dir = (home / ".psmonitor").string();
    s.log_file = (home / ".psmonitor-logs" / "server.log").string();
    return s;
}

void Settings::merge_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return;

    std::ostringstream text;
    text << in.rdbuf();
    merge_json(text.str());
}

void Settings::merge_json(const std::string& text) {
    boost::system::error_code ec;
    json::value doc = json::parse(text, ec);
    if (ec) throw std::runtime_error("settings are not valid JSON: " + ec.message());

    const json::object* obj = doc.if_object();
    if (!obj) throw std::runtime_error("settings must be a JSON object");

    address = get_string(*obj, "address", address);

    const auto p = get_int(*obj, "port", port);
    if (p > 65535) throw std::runtime_error("setting 'port' is out of range");
    port = static_cast<unsigned short>(p);

    max_ws_connections = static_cast<std::size_t>(get_int(*obj, "max_ws_connections",
                                                          static_cast<std::int64_t>(max_ws_connections)));
    pool_size = static_cast<std::size_t>(get_int(*obj, "pool_size", static_cast<std::int64_t>(pool_size)));
    if (pool_size == 0) throw std::runtime_error("setting 'pool_size' must be at least 1");

    worker_grace = std::chrono::seconds(get_int(*obj, "worker_grace_seconds", worker_grace.count()));
    sweep_interval = std::chrono::milliseconds(get_int(*obj, "sweep_interval_ms", sweep_interval.count()));
    publish_interval = std::chrono::milliseconds(get_int(*obj, "publish_interval_ms", publish_interval.count()));
    token_ttl = std::chrono::seconds(get_int(*obj, "token_ttl_seconds", token_ttl.count()));

    if (obj->if_contains("log_level")) log_level = level_or_throw(get_string(*obj, "log_level", ""));
    logging_enabled = get_bool(*obj, "logging_enabled", logging_enabled);
    log_file = get_string(*obj, "log_file", log_file);
    data_dir = get_string(*obj, "data_dir", data_dir);
}

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine out{Settings::defaults(), std::nullopt};

    po::options_description desc("psmonitor options");
    desc.add_options()
        ("help,h", "show this help and exit")
        ("config,c", po::value<std::string>(), "settings file (default: <data-dir>/settings.json)")
        ("data-dir", po::value<std::string>(), "directory holding credentials and settings")
        ("address", po::value<std::string>(), "listen address")
        ("port,p", po::value<unsigned short>(), "listen port")
        ("log-level", po::value<std::string>(), "DEBUG, INFO, WARNING or ERROR")
        ("log-file", po::value<std::string>(), "log file path (empty for console only)");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "[psmonitor] " << e.what() << "\n" << desc << "\n";
        out.exit_code = 2;
        return out;
    }

    if (vm.count("help")) {
        std::cout << desc << "\n";
        out.exit_code = 0;
        return out;
    }

    Settings& s = out.settings;
    if (vm.count("data-dir")) s.data_dir = vm["data-dir"].as<std::string>();

    const std::string config_path = vm.count("config")
        ? vm["config"].as<std::string>()
        : (std::filesystem::path(s.data_dir) / "settings.json").string();
    s.merge_file(config_path);

    // Command line wins over the settings file.
    if (vm.count("data-dir")) s.data_dir = vm["data-dir"].as<std::string>();
    if (vm.count("address")) s.address = vm["address"].as<std::string>();
    if (vm.count("port")) s.port = vm["port"].as<unsigned short>();
    if (vm.count("log-file")) s.log_file = vm["log-file"].as<std::string>();
    if (vm.count("log-level")) s.log_level = level_or_throw(vm["log-level"].as<std::string>());

    return out;
}

} // namespace psmonitor
