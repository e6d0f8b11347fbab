#include <thoughts/process_supervisor.h>
#include <thoughts/error_types.h>
#include <iostream>

// Helper macro for debug logging
#define DEBUG_LOG(sup, msg) \
    if ((sup)->log_level_ == "debug") { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace thoughts {

ProcessSupervisor::ProcessSupervisor(utils::ProcessLauncher& launcher,
                                     const LockFile& lock_file,
                                     const std::string& log_level)
    : launcher_(launcher)
    , lock_file_(lock_file)
    , log_level_(log_level)
{
}

ProcessSupervisor::~ProcessSupervisor() {
    try {
        if (terminate()) {
            std::cerr << "[ProcessSupervisor] Server was still running at teardown, killed it" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ProcessSupervisor] " << e.what() << std::endl;
    }
}

std::shared_ptr<OutputChannel> ProcessSupervisor::start(const utils::CommandSpec& spec) {
    if (has_child()) {
        throw SpawnException(spec.executable, "a server is already supervised");
    }

    DEBUG_LOG(this, "Spawning: " << spec.executable);
    utils::SpawnedProcess spawned = launcher_.spawn(spec);
    pid_t pid = spawned.child->pid();

    try {
        lock_file_.write(pid);
    } catch (const LockFileException&) {
        // Without a record the next run could not reap this child
        std::cerr << "[ProcessSupervisor] Could not record PID " << pid
                  << ", stopping the server" << std::endl;
        try {
            spawned.child->kill();
        } catch (const TerminationException& e) {
            std::cerr << "[ProcessSupervisor] " << e.what() << std::endl;
        }
        throw;
    }

    DEBUG_LOG(this, "Wrote lock file: " << lock_file_.path().string() << " (PID: " << pid << ")");

    {
        std::lock_guard<std::mutex> lock(child_mutex_);
        child_ = std::move(spawned.child);
    }

    std::cout << "[ProcessSupervisor] Server started (PID: " << pid << ")" << std::endl;
    return spawned.output;
}

std::unique_ptr<utils::ChildProcess> ProcessSupervisor::take_child() {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return std::move(child_);
}

bool ProcessSupervisor::terminate() {
    // Kill outside the lock; the slot is already empty
    std::unique_ptr<utils::ChildProcess> child = take_child();
    if (!child) {
        return false;
    }

    DEBUG_LOG(this, "Terminating server (PID: " << child->pid() << ")");
    child->kill();
    return true;
}

bool ProcessSupervisor::has_child() const {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return child_ != nullptr;
}

bool ProcessSupervisor::is_child_running() {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return child_ && child_->is_running();
}

pid_t ProcessSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return child_ ? child_->pid() : 0;
}

} // namespace thoughts
