#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>

#include <thoughts/lock_file.h>
#include <thoughts/output_channel.h>
#include <thoughts/utils/process_manager.h>

namespace thoughts {

// Owns the single supervised server process.
//
// The child handle lives in a mutex-guarded slot shared by the control
// thread and the shutdown path. Taking the handle empties the slot, so the
// child can be terminated at most once.
class ProcessSupervisor {
public:
    ProcessSupervisor(utils::ProcessLauncher& launcher,
                      const LockFile& lock_file,
                      const std::string& log_level = "info");
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Spawn the child and record its pid in the lock file.
    // Throws SpawnException if the child cannot be started, or
    // LockFileException if the pid cannot be recorded (the child is
    // killed first in that case).
    std::shared_ptr<OutputChannel> start(const utils::CommandSpec& spec);

    // Take the child out of the slot and kill it.
    // Returns false if there was nothing to terminate.
    // Throws TerminationException if the kill fails.
    bool terminate();

    // Empty the slot, returning whatever it held
    std::unique_ptr<utils::ChildProcess> take_child();

    bool has_child() const;
    bool is_child_running();

    // 0 if the slot is empty
    pid_t pid() const;

private:
    utils::ProcessLauncher& launcher_;
    const LockFile& lock_file_;
    std::string log_level_;

    mutable std::mutex child_mutex_;
    std::unique_ptr<utils::ChildProcess> child_;
};

} // namespace thoughts
