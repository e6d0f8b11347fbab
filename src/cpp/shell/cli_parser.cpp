#include "thoughts_shell/cli_parser.h"
#include <cstdlib>

namespace thoughts_shell {

CLIParser::CLIParser()
    : app_("thoughts - desktop shell for the Thoughts server") {

    // Add version flag (help is automatically added by CLI11)
    app_.add_flag("-v,--version", show_version_, "Show version number");

    app_.add_option("command", config_.command, "serve (default), status or stop")
        ->check(CLI::IsMember({"serve", "status", "stop"}));

    app_.add_option("--port", config_.port, "Port the server listens on (env: THOUGHTS_PORT)")
        ->check(CLI::Range(1, 65535));

    app_.add_option("--server-binary", config_.server_binary,
                    "Path to the thoughts-server executable (env: THOUGHTS_SERVER_BINARY)");

    app_.add_option("--log-level", config_.log_level, "Log level (env: THOUGHTS_LOG_LEVEL)")
        ->check(CLI::IsMember({"error", "warning", "info", "debug"}));

    app_.add_flag("--no-tray", config_.no_tray, "Run without tray and hotkey (headless mode)");

    app_.add_flag("--dev", config_.dev_mode,
                  "Development mode: overlay stays visible, hotkey is Shift+Alt+Space");

    app_.add_option("--ready-timeout", config_.ready_timeout,
                    "Seconds to wait for the server health check after start (0 to skip)")
        ->check(CLI::NonNegativeNumber);

    app_.add_flag("--json", config_.json_output, "Print status as JSON");
}

void CLIParser::load_env_defaults() {
    // Helper to get environment variable with fallback
    auto getenv_or_default = [](const char* name, const std::string& default_val) -> std::string {
        const char* val = std::getenv(name);
        return (val && *val) ? std::string(val) : default_val;
    };

    // Helper to get integer environment variable with fallback
    auto getenv_int_or_default = [](const char* name, int default_val) -> int {
        const char* val = std::getenv(name);
        if (val) {
            try {
                return std::stoi(val);
            } catch (const std::exception&) {
                // Invalid integer, use default
                return default_val;
            }
        }
        return default_val;
    };

    config_.port = getenv_int_or_default("THOUGHTS_PORT", config_.port);
    config_.log_level = getenv_or_default("THOUGHTS_LOG_LEVEL", config_.log_level);
    config_.server_binary = getenv_or_default("THOUGHTS_SERVER_BINARY", config_.server_binary);
}

int CLIParser::parse(int argc, char** argv) {
    load_env_defaults();

    try {
        app_.parse(argc, argv);

        if (config_.port < 1 || config_.port > 65535) {
            throw CLI::ValidationError("--port", "port must be between 1 and 65535 (got " +
                                       std::to_string(config_.port) + ")");
        }

        should_continue_ = true;
        exit_code_ = 0;
        return 0;  // Success, continue
    } catch (const CLI::ParseError& e) {
        // Help/version requested or parse error occurred
        // Let CLI11 handle printing and get the exit code
        exit_code_ = app_.exit(e);
        should_continue_ = false;
        return exit_code_;
    }
}

} // namespace thoughts_shell
