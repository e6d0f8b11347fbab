#include <thoughts/stale_reaper.h>
#include <thoughts/process_supervisor.h>
#include <thoughts/utils/process_manager.h>
#include "test_utils/fakes.h"

#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace thoughts;
using thoughts::test::FakeLauncher;
using thoughts::test::TempDir;

class StaleInstanceReaperTest : public ::testing::Test {
protected:
    StaleInstanceReaper::SignalFn recorder() {
        return [this](pid_t pid) {
            signalled_.push_back(pid);
            return true;
        };
    }

    TempDir dir_;
    std::vector<pid_t> signalled_;
};

TEST_F(StaleInstanceReaperTest, NoRecordIsNoOp) {
    LockFile lock(dir_.path(), 4000);
    StaleInstanceReaper reaper(lock, recorder());

    EXPECT_FALSE(reaper.reap().has_value());
    EXPECT_TRUE(signalled_.empty());
}

TEST_F(StaleInstanceReaperTest, SignalsRecordedPidAndClears) {
    LockFile lock(dir_.path(), 4000);
    lock.write(5555);

    StaleInstanceReaper reaper(lock, recorder());
    auto reaped = reaper.reap();

    ASSERT_TRUE(reaped.has_value());
    EXPECT_EQ(*reaped, 5555);
    ASSERT_EQ(signalled_.size(), 1u);
    EXPECT_EQ(signalled_[0], 5555);
    EXPECT_FALSE(lock.read().has_value());
}

TEST_F(StaleInstanceReaperTest, ClearsEvenWhenSignalFails) {
    LockFile lock(dir_.path(), 4000);
    lock.write(5555);

    StaleInstanceReaper reaper(lock, [](pid_t) { return false; });
    EXPECT_TRUE(reaper.reap().has_value());
    EXPECT_FALSE(lock.read().has_value());
}

TEST_F(StaleInstanceReaperTest, ClearsEvenWhenSignalThrows) {
    LockFile lock(dir_.path(), 4000);
    lock.write(5555);

    StaleInstanceReaper reaper(lock, [](pid_t) -> bool { throw std::runtime_error("boom"); });
    EXPECT_NO_THROW(reaper.reap());
    EXPECT_FALSE(lock.read().has_value());
}

TEST_F(StaleInstanceReaperTest, CorruptRecordIsIgnored) {
    LockFile lock(dir_.path(), 4000);
    std::ofstream(lock.path()) << "garbage";

    StaleInstanceReaper reaper(lock, recorder());
    EXPECT_FALSE(reaper.reap().has_value());
    EXPECT_TRUE(signalled_.empty());
}

TEST_F(StaleInstanceReaperTest, ProcessThatDoesNotExistDoesNotAbort) {
    LockFile lock(dir_.path(), 4000);
    // Above the default pid_max, so never a live process
    lock.write(4194304 + 17);

    StaleInstanceReaper reaper(lock);
    EXPECT_NO_THROW(reaper.reap());
    EXPECT_FALSE(lock.read().has_value());
}

TEST_F(StaleInstanceReaperTest, CrashedRunIsReapedOnNextStartup) {
    LockFile lock(dir_.path(), 4000);

    // First run spawns and records, then "crashes" before any cleanup
    FakeLauncher launcher(5555);
    std::unique_ptr<utils::ChildProcess> abandoned;
    {
        ProcessSupervisor supervisor(launcher, lock);
        supervisor.start({"thoughts-server", {}, {}});
        abandoned = supervisor.take_child();
    }
    EXPECT_EQ(launcher.child_state->kill_count, 0);
    ASSERT_EQ(lock.read(), std::optional<pid_t>(5555));

    // Next startup
    StaleInstanceReaper reaper(lock, recorder());
    EXPECT_EQ(reaper.reap(), std::optional<pid_t>(5555));
    EXPECT_FALSE(lock.read().has_value());
    ASSERT_EQ(signalled_.size(), 1u);
    EXPECT_EQ(signalled_[0], 5555);

    // Immediate second run on the empty store does nothing
    EXPECT_FALSE(reaper.reap().has_value());
    EXPECT_EQ(signalled_.size(), 1u);
}

TEST_F(StaleInstanceReaperTest, TerminatesRealStaleProcess) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
        _exit(127);
    }

    LockFile lock(dir_.path(), 4000);
    lock.write(pid);

    StaleInstanceReaper reaper(lock);
    EXPECT_EQ(reaper.reap(), std::optional<pid_t>(pid));
    EXPECT_FALSE(lock.read().has_value());

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);
}
