#include "thoughts_shell/shell_app.h"
#include <thoughts/error_types.h>
#include <thoughts/server_client.h>
#include <thoughts/stale_reaper.h>
#include <thoughts/utils/path_utils.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <vector>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/select.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace thoughts_shell {

// Helper macro for debug logging
#define DEBUG_LOG(app, msg) \
    if ((app)->config_.log_level == "debug") { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace {

constexpr const char* SERVER_BINARY_NAME = "thoughts-server";

// Signals routed to the shutdown routine
const int HANDLED_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP};
struct sigaction g_previous_actions[3];
struct sigaction g_previous_sigpipe;

// Only write() here: async-signal-safe
void signal_handler(int signal) {
    int saved_errno = errno;
    char sig = static_cast<char>(signal);
    ssize_t written = write(ShellApp::signal_pipe_[1], &sig, 1);
    (void)written;
    errno = saved_errno;
}

} // namespace

int ShellApp::signal_pipe_[2] = {-1, -1};

const char* to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::Uninitialized: return "uninitialized";
        case LifecycleState::BaseDirReady: return "base_dir_ready";
        case LifecycleState::Reaped: return "reaped";
        case LifecycleState::SpawnedAndLocked: return "spawned_and_locked";
        case LifecycleState::Running: return "running";
        case LifecycleState::ShuttingDown: return "shutting_down";
        case LifecycleState::TerminatedAndUnlocked: return "terminated_and_unlocked";
    }
    return "unknown";
}

ShellApp::ShellApp(const AppConfig& config)
    : ShellApp(config, ShellDependencies{})
{
}

ShellApp::ShellApp(const AppConfig& config, ShellDependencies deps)
    : config_(config)
    , launcher_(std::move(deps.launcher))
    , tray_(std::move(deps.tray))
    , windows_(std::move(deps.windows))
    , log_sink_(std::move(deps.log_sink))
{
    if (!launcher_) {
        launcher_ = thoughts::utils::create_process_launcher();
    }
    if (!log_sink_) {
        log_sink_ = std::make_shared<thoughts::ConsoleLogSink>();
    }
}

ShellApp::~ShellApp() {
    stop_signal_monitor();

    // Only shutdown if we actually started something
    if (coordinator_) {
        shutdown("application exit");
    }

    restore_signal_handlers();
}

int ShellApp::run() {
    DEBUG_LOG(this, "ShellApp::run() starting...");
    DEBUG_LOG(this, "Command: " << config_.command);

    if (config_.command == "status") {
        return execute_status();
    } else if (config_.command == "stop") {
        return execute_stop();
    } else if (config_.command == "serve") {
        return execute_serve();
    }

    std::cerr << "Error: Unknown command '" << config_.command << "'" << std::endl;
    return 1;
}

void ShellApp::set_state(LifecycleState state) {
    state_ = state;
    DEBUG_LOG(this, "Lifecycle: " << to_string(state));
}

int ShellApp::execute_serve() {
    install_signal_handlers();

    start_supervision();

    if (config_.ready_timeout > 0) {
        thoughts::ServerClient client(config_.port);
        DEBUG_LOG(this, "Waiting for " << client.get_base_url() << "/health ...");
        bool interrupted = false;
        bool ready = client.wait_for_ready(config_.ready_timeout, [this, &interrupted]() {
            interrupted = wait_for_signal(1000);
            return interrupted;
        });
        if (interrupted) {
            std::cout << "\nReceived termination signal, shutting down..." << std::endl;
            shutdown("signal");
            return 0;
        }
        if (ready) {
            std::cout << "Server ready on port " << config_.port << std::endl;
        } else {
            std::cerr << "Warning: Server did not answer on port " << config_.port
                      << " within " << config_.ready_timeout << "s" << std::endl;
        }
    }

    int result = config_.no_tray ? run_headless() : run_tray();

    // Every way out of the event loop ends here
    shutdown("event loop exited");
    return result;
}

void ShellApp::start_supervision() {
    config_dir_ = thoughts::utils::resolve_config_dir();
    lock_file_ = std::make_unique<thoughts::LockFile>(config_dir_, config_.port);
    set_state(LifecycleState::BaseDirReady);
    DEBUG_LOG(this, "Lock file: " << lock_file_->path().string());

    // Cleanup any server left behind by a previous run
    thoughts::StaleInstanceReaper(*lock_file_).reap();
    set_state(LifecycleState::Reaped);

    if (config_.server_binary.empty() && !find_server_binary()) {
        throw thoughts::SpawnException(SERVER_BINARY_NAME,
            "not found next to the executable, in the current directory or in PATH");
    }
    DEBUG_LOG(this, "Using server binary: " << config_.server_binary);

    supervisor_ = std::make_unique<thoughts::ProcessSupervisor>(*launcher_, *lock_file_, config_.log_level);
    coordinator_ = std::make_unique<thoughts::ShutdownCoordinator>(*supervisor_, *lock_file_);

    thoughts::utils::CommandSpec spec;
    spec.executable = config_.server_binary;
    spec.env_vars = {
        {"SIDECAR_PORT", std::to_string(config_.port)},
        {thoughts::utils::CONFIG_PATH_ENV, config_dir_.string()}
    };

    auto output = supervisor_->start(spec);
    set_state(LifecycleState::SpawnedAndLocked);

    relay_.start(output, log_sink_);
    set_state(LifecycleState::Running);
}

void ShellApp::shutdown(const std::string& reason) {
    if (coordinator_) {
        set_state(LifecycleState::ShuttingDown);
        coordinator_->shutdown(reason);
        set_state(LifecycleState::TerminatedAndUnlocked);
    }

    if (tray_) {
        tray_->stop();
    }
}

int ShellApp::run_headless() {
    std::cout << "Server running on port " << config_.port
              << " (PID " << supervisor_->pid() << "). Press Ctrl+C to stop" << std::endl;

    while (supervisor_->is_child_running()) {
        if (wait_for_signal(1000)) {
            std::cout << "\nReceived termination signal, shutting down..." << std::endl;
            return 0;
        }
    }

    if (state_ == LifecycleState::Running) {
        std::cerr << "Error: Server exited unexpectedly" << std::endl;
        return 1;
    }
    return 0;
}

int ShellApp::run_tray() {
    if (!tray_) {
        tray_ = create_tray();
    }
    if (!windows_) {
        windows_ = create_window_host(config_.dev_mode);
    }
    commands_ = std::make_unique<ShellCommands>(*windows_, config_.dev_mode);

    tray_->set_log_level(config_.log_level);

    // Icon is optional; the tray falls back to a default
    fs::path icon_path = fs::path(thoughts::utils::get_executable_dir()) / "icons" / "32x32.png";
    if (!fs::exists(icon_path)) {
        DEBUG_LOG(this, "Icon not found at " << icon_path.string() << ", using default icon");
    }

    if (!tray_->initialize("Thoughts", icon_path.string())) {
        std::cerr << "Error: Failed to initialize tray" << std::endl;
        return 1;
    }

    build_menu();

    Hotkey hotkey = Hotkey::for_mode(config_.dev_mode);
    if (!tray_->register_hotkey(hotkey, [this]() { commands_->toggle_overlay(); })) {
        std::cerr << "Warning: Could not register shortcut " << hotkey.label() << std::endl;
    }

    start_signal_monitor();

    tray_->show_notification("Thoughts",
        "Server running on port " + std::to_string(config_.port) +
        " (PID " + std::to_string(supervisor_->pid()) + "). Press " +
        hotkey.label() + " for the quick panel");

    DEBUG_LOG(this, "Menu built, entering event loop...");
    tray_->run();
    DEBUG_LOG(this, "Event loop exited");

    stop_signal_monitor();
    return 0;
}

void ShellApp::build_menu() {
    Menu menu;
    std::string hint = Hotkey::for_mode(config_.dev_mode).label();

    menu.add_item(MenuItem::Action("open", "Open", [this]() {
        commands_->open_main_window();
    }, hint));
    menu.add_separator();
    menu.add_item(MenuItem::Action("quit", "Quit", [this]() {
        shutdown("quit requested");
    }));

    tray_->set_menu(menu);
}

int ShellApp::execute_status() {
    nlohmann::json status;
    try {
        config_dir_ = thoughts::utils::resolve_config_dir();
    } catch (const thoughts::ConfigException& e) {
        if (config_.json_output) {
            std::cout << e.to_json().dump(2) << std::endl;
        } else {
            std::cerr << "Error: " << e.what() << std::endl;
        }
        return 1;
    }

    thoughts::LockFile lock_file(config_dir_, config_.port);
    auto pid = lock_file.read();
    bool running = pid && thoughts::utils::ProcessManager::is_process_alive(*pid);

    bool healthy = false;
    if (running) {
        try {
            status["health"] = thoughts::ServerClient(config_.port).get_health();
            healthy = true;
        } catch (const thoughts::NetworkException& e) {
            DEBUG_LOG(this, "Health check failed: " << e.what());
        }
    }

    if (config_.json_output) {
        status["port"] = config_.port;
        status["pid"] = pid ? nlohmann::json(*pid) : nlohmann::json(nullptr);
        status["running"] = running;
        status["healthy"] = healthy;
        status["lock_file"] = lock_file.path().string();
        std::cout << status.dump(2) << std::endl;
    } else if (running) {
        std::cout << "Server is running on port " << config_.port << " (PID: " << *pid << ")"
                  << (healthy ? "" : ", health check not answering") << std::endl;
    } else if (pid) {
        std::cout << "Server is not running (stale lock record for PID " << *pid << " at "
                  << lock_file.path().string() << ")" << std::endl;
    } else {
        std::cout << "Server is not running" << std::endl;
    }

    return running ? 0 : 1;
}

int ShellApp::execute_stop() {
    config_dir_ = thoughts::utils::resolve_config_dir();
    thoughts::LockFile lock_file(config_dir_, config_.port);

    auto pid = thoughts::StaleInstanceReaper(lock_file).reap();
    if (pid) {
        std::cout << "Sent stop request to server (PID: " << *pid << ")" << std::endl;
    } else {
        std::cout << "No server recorded for port " << config_.port << std::endl;
    }
    return 0;
}

bool ShellApp::find_server_binary() {
    std::vector<fs::path> search_paths;

    // First priority: same directory as this executable
    search_paths.push_back(fs::path(thoughts::utils::get_executable_dir()) / SERVER_BINARY_NAME);

    // Current directory, then parent
    search_paths.push_back(SERVER_BINARY_NAME);
    search_paths.push_back(fs::path("..") / SERVER_BINARY_NAME);

    // Common install locations
    search_paths.push_back(fs::path("/usr/local/bin") / SERVER_BINARY_NAME);
    search_paths.push_back(fs::path("/usr/bin") / SERVER_BINARY_NAME);

    for (const auto& path : search_paths) {
        if (fs::exists(path)) {
            config_.server_binary = fs::absolute(path).string();
            return true;
        }
    }

    std::string on_path = thoughts::utils::find_on_path(SERVER_BINARY_NAME);
    if (!on_path.empty()) {
        config_.server_binary = on_path;
        return true;
    }

    return false;
}

void ShellApp::install_signal_handlers() {
    if (signals_installed_) {
        return;
    }

    // Create self-pipe for safe signal handling
    if (pipe2(signal_pipe_, O_CLOEXEC) == -1) {
        throw thoughts::ThoughtsException(std::string("Failed to create signal pipe: ") + strerror(errno));
    }

    // Set write end to non-blocking to prevent signal handler from blocking
    int flags = fcntl(signal_pipe_[1], F_GETFL);
    if (flags != -1) {
        fcntl(signal_pipe_[1], F_SETFL, flags | O_NONBLOCK);
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    for (size_t i = 0; i < 3; ++i) {
        sigaction(HANDLED_SIGNALS[i], &action, &g_previous_actions[i]);
    }

    // A closed pipe to the child must not kill us
    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, &g_previous_sigpipe);

    signals_installed_ = true;
    DEBUG_LOG(this, "Signal handlers installed");
}

void ShellApp::restore_signal_handlers() {
    if (!signals_installed_) {
        return;
    }

    for (size_t i = 0; i < 3; ++i) {
        sigaction(HANDLED_SIGNALS[i], &g_previous_actions[i], nullptr);
    }
    sigaction(SIGPIPE, &g_previous_sigpipe, nullptr);

    close(signal_pipe_[0]);
    close(signal_pipe_[1]);
    signal_pipe_[0] = signal_pipe_[1] = -1;
    signals_installed_ = false;
}

bool ShellApp::wait_for_signal(int timeout_ms) {
    if (signal_pipe_[0] == -1) {
        return false;
    }

    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(signal_pipe_[0], &readfds);

    struct timeval tv = {timeout_ms / 1000, (timeout_ms % 1000) * 1000};
    int result = select(signal_pipe_[0] + 1, &readfds, nullptr, nullptr, &tv);

    if (result > 0 && FD_ISSET(signal_pipe_[0], &readfds)) {
        char sig;
        ssize_t bytes_read = read(signal_pipe_[0], &sig, 1);
        (void)bytes_read;
        return true;
    }
    return false;
}

void ShellApp::start_signal_monitor() {
    stop_signal_monitor_ = false;
    signal_monitor_thread_ = std::thread([this]() {
        while (!stop_signal_monitor_) {
            if (wait_for_signal(100)) {
                std::cout << "\nReceived termination signal, shutting down..." << std::endl;
                // Not in signal context here, so the full shutdown is safe
                shutdown("signal");
                break;
            }
        }
        DEBUG_LOG(this, "Signal monitor thread exiting");
    });
}

void ShellApp::stop_signal_monitor() {
    if (signal_monitor_thread_.joinable()) {
        stop_signal_monitor_ = true;
        if (signal_monitor_thread_.get_id() != std::this_thread::get_id()) {
            signal_monitor_thread_.join();
        } else {
            signal_monitor_thread_.detach();
        }
    }
}

} // namespace thoughts_shell
