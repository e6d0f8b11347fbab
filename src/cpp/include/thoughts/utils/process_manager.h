#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

#include <thoughts/output_channel.h>

namespace thoughts {
namespace utils {

// What to launch
struct CommandSpec {
    std::string executable;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env_vars;
};

// Owned handle to a spawned child process
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual pid_t pid() const = 0;

    // Check if the child has not exited yet
    virtual bool is_running() = 0;

    // Request termination with SIGTERM and return without waiting for the
    // child to exit; it is reaped in the background.
    // Killing an already exited child is a no-op.
    // Throws TerminationException if the signal could not be delivered.
    virtual void kill() = 0;
};

struct SpawnedProcess {
    std::unique_ptr<ChildProcess> child;
    std::shared_ptr<OutputChannel> output;  // closes when both pipes reach EOF
};

// Abstract process launcher
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Start a process with its stdout/stderr captured line by line.
    // Throws SpawnException if the executable cannot be located or started.
    virtual SpawnedProcess spawn(const CommandSpec& spec) = 0;
};

// Factory function to create the platform launcher
std::unique_ptr<ProcessLauncher> create_process_launcher();

class ProcessManager {
public:
    // Send a signal to an arbitrary pid. Never throws.
    // Returns false if the process does not exist or is not ours to signal.
    static bool send_signal(pid_t pid, int signal);

    // Check if a process exists and is not a zombie
    static bool is_process_alive(pid_t pid);
};

} // namespace utils
} // namespace thoughts
