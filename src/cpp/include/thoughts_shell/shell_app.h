#pragma once

#include "platform/tray_interface.h"
#include "cli_parser.h"
#include "shell_commands.h"
#include "window_host.h"

#include <thoughts/lock_file.h>
#include <thoughts/output_relay.h>
#include <thoughts/process_supervisor.h>
#include <thoughts/shutdown_coordinator.h>
#include <thoughts/utils/process_manager.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

namespace thoughts_shell {

// Per-run lifecycle of the supervised server
enum class LifecycleState {
    Uninitialized,
    BaseDirReady,
    Reaped,
    SpawnedAndLocked,
    Running,
    ShuttingDown,
    TerminatedAndUnlocked
};

const char* to_string(LifecycleState state);

// Collaborators the app runs against; defaults are the real ones
struct ShellDependencies {
    std::unique_ptr<thoughts::utils::ProcessLauncher> launcher;
    std::unique_ptr<TrayInterface> tray;
    std::unique_ptr<WindowHost> windows;
    std::shared_ptr<thoughts::LogSink> log_sink;
};

class ShellApp {
public:
    explicit ShellApp(const AppConfig& config);
    ShellApp(const AppConfig& config, ShellDependencies deps);
    ~ShellApp();

    ShellApp(const ShellApp&) = delete;
    ShellApp& operator=(const ShellApp&) = delete;

    int run();

    // Single teardown routine; public for signal handlers and the tray
    void shutdown(const std::string& reason);

    LifecycleState state() const { return state_; }
    const std::filesystem::path& config_dir() const { return config_dir_; }
    ShellCommands* commands() { return commands_.get(); }

#ifndef _WIN32
    // Self-pipe written by the signal handler
    static int signal_pipe_[2];
#endif

private:
    // Command implementations
    int execute_serve();
    int execute_status();
    int execute_stop();

    // Startup sequence: base dir, reap, spawn + lock, relay
    void start_supervision();
    bool find_server_binary();

    // Event loops
    int run_headless();
    int run_tray();
    void build_menu();

    // Signal handling
    void install_signal_handlers();
    void restore_signal_handlers();
    void start_signal_monitor();
    void stop_signal_monitor();
    bool wait_for_signal(int timeout_ms);

    void set_state(LifecycleState state);

    AppConfig config_;
    std::atomic<LifecycleState> state_{LifecycleState::Uninitialized};
    std::filesystem::path config_dir_;

    std::unique_ptr<thoughts::utils::ProcessLauncher> launcher_;
    std::unique_ptr<TrayInterface> tray_;
    std::unique_ptr<WindowHost> windows_;
    std::shared_ptr<thoughts::LogSink> log_sink_;
    std::unique_ptr<ShellCommands> commands_;

    // Declared in dependency order: destroyed coordinator first, lock file last
    std::unique_ptr<thoughts::LockFile> lock_file_;
    std::unique_ptr<thoughts::ProcessSupervisor> supervisor_;
    std::unique_ptr<thoughts::ShutdownCoordinator> coordinator_;
    thoughts::OutputRelay relay_;

    bool signals_installed_ = false;
    std::atomic<bool> stop_signal_monitor_{false};
    std::thread signal_monitor_thread_;
};

} // namespace thoughts_shell
