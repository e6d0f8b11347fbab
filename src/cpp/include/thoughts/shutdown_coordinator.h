#pragma once

#include <mutex>
#include <string>

#include <thoughts/lock_file.h>
#include <thoughts/process_supervisor.h>

namespace thoughts {

// Single teardown routine called from every exit path (tray quit, exit
// request, signals, destruction).
//
// Each call takes and kills the child if one is still supervised, then
// clears the lock record. A failure in the first step never skips the
// second. Later calls find the slot empty and only re-clear the record.
class ShutdownCoordinator {
public:
    ShutdownCoordinator(ProcessSupervisor& supervisor, const LockFile& lock_file);

    // Returns true if this call terminated the child
    bool shutdown(const std::string& reason);

    bool has_shut_down() const;

private:
    ProcessSupervisor& supervisor_;
    const LockFile& lock_file_;

    mutable std::mutex mutex_;
    bool shut_down_ = false;
};

} // namespace thoughts
