#include <thoughts/stale_reaper.h>
#include <thoughts/utils/process_manager.h>
#include <exception>
#include <iostream>

#include <signal.h>

namespace thoughts {

StaleInstanceReaper::StaleInstanceReaper(const LockFile& lock_file)
    : StaleInstanceReaper(lock_file, [](pid_t pid) {
          return utils::ProcessManager::send_signal(pid, SIGTERM);
      })
{
}

StaleInstanceReaper::StaleInstanceReaper(const LockFile& lock_file, SignalFn send_terminate)
    : lock_file_(lock_file)
    , send_terminate_(std::move(send_terminate))
{
}

std::optional<pid_t> StaleInstanceReaper::reap() {
    std::optional<pid_t> pid = lock_file_.read();
    if (!pid) {
        return std::nullopt;
    }

    std::cout << "[StaleInstanceReaper] Found lock record for PID " << *pid
              << " (" << lock_file_.path().string() << "), sending SIGTERM" << std::endl;

    try {
        if (!send_terminate_(*pid)) {
            std::cout << "[StaleInstanceReaper] PID " << *pid
                      << " was not signalled (already gone or not ours)" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[StaleInstanceReaper] Signal to PID " << *pid << " failed: " << e.what() << std::endl;
    }

    // Remove the record regardless of the signal outcome
    lock_file_.clear();
    return pid;
}

} // namespace thoughts
