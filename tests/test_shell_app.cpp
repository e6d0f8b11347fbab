#include <thoughts_shell/shell_app.h>
#include <thoughts_shell/platform/headless_tray.h>
#include <thoughts/error_types.h>
#include "test_utils/fakes.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <fstream>
#include <future>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace thoughts_shell;
using thoughts::LockFile;
using thoughts::test::FakeLauncher;
using thoughts::test::RecordingSink;
using thoughts::test::ScopedEnv;
using thoughts::test::TempDir;

namespace {

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

// A pid that is never live on Linux (above the default pid_max)
constexpr pid_t UNUSED_PID = 4194304 + 17;

// A localhost port with nothing listening on it
int unused_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return 0;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    int port = 0;
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
        getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port = ntohs(addr.sin_port);
    }
    close(fd);
    return port;
}

} // namespace

class ShellAppTest : public ::testing::Test {
protected:
    AppConfig serve_config(bool no_tray) const {
        AppConfig config;
        config.command = "serve";
        config.port = port_;
        config.server_binary = "thoughts-server";
        config.no_tray = no_tray;
        config.ready_timeout = 0;
        return config;
    }

    // Builds an app wired to fakes; raw pointers stay owned by the app
    std::unique_ptr<ShellApp> make_app(const AppConfig& config) {
        auto launcher = std::make_unique<FakeLauncher>(5555);
        auto tray = std::make_unique<HeadlessTray>();
        auto windows = std::make_unique<HeadlessWindowHost>();
        launcher_ = launcher.get();
        tray_ = tray.get();
        windows_ = windows.get();
        sink_ = std::make_shared<RecordingSink>();

        ShellDependencies deps;
        deps.launcher = std::move(launcher);
        deps.tray = std::move(tray);
        deps.windows = std::move(windows);
        deps.log_sink = sink_;
        return std::make_unique<ShellApp>(config, std::move(deps));
    }

    LockFile lock() const { return LockFile(dir_.path(), port_); }

    int port_ = 4000;
    TempDir dir_;
    ScopedEnv config_env_{thoughts::utils::CONFIG_PATH_ENV, dir_.path().c_str()};

    FakeLauncher* launcher_ = nullptr;
    HeadlessTray* tray_ = nullptr;
    HeadlessWindowHost* windows_ = nullptr;
    std::shared_ptr<RecordingSink> sink_;
};

TEST_F(ShellAppTest, StateNames) {
    EXPECT_STREQ(to_string(LifecycleState::Uninitialized), "uninitialized");
    EXPECT_STREQ(to_string(LifecycleState::Running), "running");
    EXPECT_STREQ(to_string(LifecycleState::TerminatedAndUnlocked), "terminated_and_unlocked");
}

TEST_F(ShellAppTest, QuitFromTrayStopsServerAndClearsRecord) {
    auto app = make_app(serve_config(false));
    auto result = std::async(std::launch::async, [&app] { return app->run(); });

    ASSERT_TRUE(wait_until([this] { return tray_->is_running(); }));
    EXPECT_EQ(app->state(), LifecycleState::Running);
    EXPECT_EQ(app->config_dir(), dir_.path());
    EXPECT_EQ(lock().read(), std::optional<pid_t>(5555));

    // Child gets the port and the base directory
    const auto& env = launcher_->last_spec.env_vars;
    EXPECT_NE(std::find(env.begin(), env.end(), std::make_pair(std::string("SIDECAR_PORT"), std::string("4000"))),
              env.end());
    EXPECT_NE(std::find(env.begin(), env.end(),
                        std::make_pair(std::string("THOUGHTS_CONFIG_PATH"), dir_.path().string())),
              env.end());

    ASSERT_TRUE(tray_->trigger_menu_item("quit"));
    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(result.get(), 0);

    EXPECT_EQ(launcher_->child_state->kill_count, 1);
    EXPECT_FALSE(lock().read().has_value());
    EXPECT_EQ(app->state(), LifecycleState::TerminatedAndUnlocked);
}

TEST_F(ShellAppTest, ServerOutputIsRelayed) {
    auto app = make_app(serve_config(false));
    auto result = std::async(std::launch::async, [&app] { return app->run(); });
    ASSERT_TRUE(wait_until([this] { return tray_->is_running(); }));

    launcher_->output->send({thoughts::OutputStream::Stdout, "ready"});
    launcher_->output->send({thoughts::OutputStream::Stderr, "warn: cache miss"});
    ASSERT_TRUE(wait_until([this] { return sink_->lines().size() == 2; }));

    auto lines = sink_->lines();
    EXPECT_EQ(lines[0].stream, thoughts::OutputStream::Stdout);
    EXPECT_EQ(lines[0].line, "ready");
    EXPECT_EQ(lines[1].stream, thoughts::OutputStream::Stderr);
    EXPECT_EQ(lines[1].line, "warn: cache miss");

    app->shutdown("exit requested");
    EXPECT_EQ(result.get(), 0);
}

TEST_F(ShellAppTest, MenuAndHotkeyDriveWindows) {
    auto app = make_app(serve_config(false));
    auto result = std::async(std::launch::async, [&app] { return app->run(); });
    ASSERT_TRUE(wait_until([this] { return tray_->is_running(); }));

    EXPECT_TRUE(tray_->trigger_menu_item("open"));
    EXPECT_TRUE(windows_->has_window(MAIN_WINDOW));

    EXPECT_FALSE(windows_->is_visible(OVERLAY_WINDOW));
    EXPECT_TRUE(tray_->trigger_hotkey());
    EXPECT_TRUE(windows_->is_visible(OVERLAY_WINDOW));
    EXPECT_TRUE(tray_->trigger_hotkey());
    EXPECT_FALSE(windows_->is_visible(OVERLAY_WINDOW));

    EXPECT_FALSE(tray_->trigger_menu_item("missing"));

    tray_->trigger_menu_item("quit");
    EXPECT_EQ(result.get(), 0);
}

TEST_F(ShellAppTest, RepeatedShutdownKillsOnce) {
    auto app = make_app(serve_config(false));
    auto result = std::async(std::launch::async, [&app] { return app->run(); });
    ASSERT_TRUE(wait_until([this] { return tray_->is_running(); }));

    auto child_state = launcher_->child_state;
    app->shutdown("quit requested");
    EXPECT_EQ(result.get(), 0);
    app->shutdown("exit requested");
    app.reset();

    EXPECT_EQ(child_state->kill_count, 1);
    EXPECT_FALSE(lock().read().has_value());
}

TEST_F(ShellAppTest, StaleRecordIsReapedAtStartup) {
    lock().write(UNUSED_PID);

    auto app = make_app(serve_config(false));
    auto result = std::async(std::launch::async, [&app] { return app->run(); });
    ASSERT_TRUE(wait_until([this] { return tray_->is_running(); }));

    // Replaced by the new child's pid
    EXPECT_EQ(lock().read(), std::optional<pid_t>(5555));

    tray_->trigger_menu_item("quit");
    EXPECT_EQ(result.get(), 0);
    EXPECT_FALSE(lock().read().has_value());
}

TEST_F(ShellAppTest, SpawnFailureLeavesNoRecord) {
    auto app = make_app(serve_config(false));
    launcher_->fail_spawn = true;

    EXPECT_THROW(app->run(), thoughts::SpawnException);
    EXPECT_FALSE(lock().read().has_value());
    EXPECT_EQ(app->state(), LifecycleState::Reaped);
}

TEST_F(ShellAppTest, HeadlessReportsUnexpectedServerExit) {
    auto app = make_app(serve_config(true));
    auto result = std::async(std::launch::async, [&app] { return app->run(); });
    ASSERT_TRUE(wait_until([&app] { return app->state() == LifecycleState::Running; }));

    launcher_->child_state->running = false;
    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(result.get(), 1);
    EXPECT_FALSE(lock().read().has_value());
    EXPECT_EQ(app->state(), LifecycleState::TerminatedAndUnlocked);
}

TEST_F(ShellAppTest, HeadlessStopsOnTerminationSignal) {
    auto app = make_app(serve_config(true));
    auto result = std::async(std::launch::async, [&app] { return app->run(); });
    ASSERT_TRUE(wait_until([&app] { return app->state() == LifecycleState::Running; }));

    // Handlers are installed before the state reaches Running
    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(result.get(), 0);

    EXPECT_EQ(launcher_->child_state->kill_count, 1);
    EXPECT_FALSE(lock().read().has_value());
}

TEST_F(ShellAppTest, TerminationSignalDuringHealthWaitStopsPromptly) {
    port_ = unused_port();
    ASSERT_GT(port_, 0);
    AppConfig config = serve_config(false);
    config.ready_timeout = 10;

    auto app = make_app(config);
    auto started = std::chrono::steady_clock::now();
    auto result = std::async(std::launch::async, [&app] { return app->run(); });
    ASSERT_TRUE(wait_until([&app] { return app->state() == LifecycleState::Running; }));

    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    ASSERT_EQ(result.wait_for(std::chrono::seconds(4)), std::future_status::ready);
    EXPECT_EQ(result.get(), 0);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));

    EXPECT_EQ(launcher_->child_state->kill_count, 1);
    EXPECT_FALSE(lock().read().has_value());
    EXPECT_EQ(app->state(), LifecycleState::TerminatedAndUnlocked);
    // Never got as far as the tray
    EXPECT_TRUE(tray_->notifications().empty());
}

TEST_F(ShellAppTest, TrayAnnouncesRunningServer) {
    auto app = make_app(serve_config(false));
    auto result = std::async(std::launch::async, [&app] { return app->run(); });
    ASSERT_TRUE(wait_until([this] { return tray_->is_running(); }));

    auto notifications = tray_->notifications();
    ASSERT_EQ(notifications.size(), 1u);
    EXPECT_NE(notifications[0].find("port 4000"), std::string::npos);
    EXPECT_NE(notifications[0].find("PID 5555"), std::string::npos);
    EXPECT_NE(notifications[0].find(Hotkey::for_mode(false).label()), std::string::npos);

    tray_->trigger_menu_item("quit");
    EXPECT_EQ(result.get(), 0);
}

TEST_F(ShellAppTest, StatusWithoutRecordReportsNotRunning) {
    AppConfig config;
    config.command = "status";
    config.port = 4000;
    config.json_output = true;
    auto app = make_app(config);

    testing::internal::CaptureStdout();
    int code = app->run();
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 1);
    auto status = nlohmann::json::parse(out);
    EXPECT_EQ(status["port"], 4000);
    EXPECT_TRUE(status["pid"].is_null());
    EXPECT_FALSE(status["running"].get<bool>());
    EXPECT_FALSE(status["healthy"].get<bool>());
    EXPECT_EQ(status["lock_file"], lock().path().string());
}

TEST_F(ShellAppTest, StatusWithLiveRecordReportsRunning) {
    lock().write(getpid());

    AppConfig config;
    config.command = "status";
    config.port = 4000;
    config.json_output = true;
    auto app = make_app(config);

    testing::internal::CaptureStdout();
    int code = app->run();
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    auto status = nlohmann::json::parse(out);
    EXPECT_EQ(status["pid"], getpid());
    EXPECT_TRUE(status["running"].get<bool>());
}

TEST_F(ShellAppTest, StatusReportsConfigErrorAsJson) {
    TempDir other;
    std::string file = (other.path() / "not-a-dir").string();
    std::ofstream(file) << "x";
    ScopedEnv env(thoughts::utils::CONFIG_PATH_ENV, file.c_str());

    AppConfig config;
    config.command = "status";
    config.json_output = true;
    auto app = make_app(config);

    testing::internal::CaptureStdout();
    int code = app->run();
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 1);
    auto error = nlohmann::json::parse(out);
    EXPECT_EQ(error["error"]["type"], std::string(thoughts::ErrorType::CONFIG_ERROR));
}

TEST_F(ShellAppTest, StopTerminatesRecordedServer) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
        _exit(127);
    }
    lock().write(pid);

    AppConfig config;
    config.command = "stop";
    config.port = 4000;
    auto app = make_app(config);
    EXPECT_EQ(app->run(), 0);

    EXPECT_FALSE(lock().read().has_value());
    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    EXPECT_TRUE(WIFSIGNALED(status));
}

TEST_F(ShellAppTest, StopWithoutRecordIsNoOp) {
    AppConfig config;
    config.command = "stop";
    config.port = 4000;
    auto app = make_app(config);

    EXPECT_EQ(app->run(), 0);
    EXPECT_FALSE(lock().read().has_value());
}
