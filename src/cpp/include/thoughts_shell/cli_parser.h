#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace thoughts_shell {

// Port the sidecar listens on unless configured otherwise
constexpr int DEFAULT_PORT = 4318;

struct AppConfig {
    std::string command = "serve";  // serve, status or stop
    int port = DEFAULT_PORT;
    std::string server_binary;      // Located automatically when empty
    std::string log_level = "info";
    bool no_tray = false;
    bool dev_mode = false;
    bool json_output = false;
    int ready_timeout = 10;         // Seconds to wait for /health after spawn
};

class CLIParser {
public:
    CLIParser();

    // Parse command line arguments
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);

    AppConfig get_config() const { return config_; }

    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }

    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }

    bool should_show_version() const { return show_version_; }

private:
    // Environment defaults, overridden by command-line options
    void load_env_defaults();

    CLI::App app_;
    AppConfig config_;
    bool show_version_ = false;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace thoughts_shell
