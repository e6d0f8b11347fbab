#pragma once

#include <functional>
#include <optional>
#include <sys/types.h>

#include <thoughts/lock_file.h>

namespace thoughts {

// Terminates a server left behind by a previous run, as recorded in the
// lock file, then removes the record.
//
// The old process is signalled but not waited for, so it may still be
// shutting down while the new server starts.
class StaleInstanceReaper {
public:
    // Returns true if the signal was delivered; the result is only logged
    using SignalFn = std::function<bool(pid_t pid)>;

    explicit StaleInstanceReaper(const LockFile& lock_file);
    StaleInstanceReaper(const LockFile& lock_file, SignalFn send_terminate);

    // Returns the pid that was signalled, or nullopt if there was no record
    std::optional<pid_t> reap();

private:
    const LockFile& lock_file_;
    SignalFn send_terminate_;
};

} // namespace thoughts
