#pragma once

#include "core/Logger.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace psmonitor {

struct Settings {
    std::string address = "localhost";
    unsigned short port = 4500;

    std::size_t max_ws_connections = 20;
    std::size_t pool_size = default_pool_size();

    std::chrono::seconds worker_grace{5};
    std::chrono::milliseconds sweep_interval{1000};
    std::chrono::milliseconds publish_interval{1000};
    std::chrono::seconds token_ttl{60};

    LogLevel log_level = LogLevel::Info;
    bool logging_enabled = true;
    std::string log_file;   // empty => console only

    std::string data_dir;   // holds credentials.json and psmonitor.secret

    // min(2 * hardware threads, 16), at least 1.
    static std::size_t default_pool_size();

    // Defaults rooted at $HOME/.psmonitor and $HOME/.psmonitor-logs.
    static Settings defaults();

    // Overlays keys found in a JSON settings file. A missing file leaves the
    // settings untouched; unreadable JSON or a mistyped key throws
    // std::runtime_error.
    void merge_file(const std::string& path);

    // Overlays keys from a JSON document (same rules as merge_file).
    void merge_json(const std::string& text);
};

// Outcome of command line parsing. `exit_code` is set when the process
// should terminate immediately (--help, bad arguments).
struct CommandLine {
    Settings settings;
    std::optional<int> exit_code;
};

CommandLine parse_command_line(int argc, const char* const argv[]);

} // namespace psmonitor
