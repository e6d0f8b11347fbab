#include <thoughts/shutdown_coordinator.h>
#include <exception>
#include <iostream>

namespace thoughts {

ShutdownCoordinator::ShutdownCoordinator(ProcessSupervisor& supervisor, const LockFile& lock_file)
    : supervisor_(supervisor)
    , lock_file_(lock_file)
{
}

bool ShutdownCoordinator::shutdown(const std::string& reason) {
    // Serializes concurrent exit paths; the second caller returns only
    // after the first has finished cleaning up
    std::lock_guard<std::mutex> lock(mutex_);

    if (!shut_down_) {
        std::cout << "[ShutdownCoordinator] Shutting down (" << reason << ")" << std::endl;
    }

    bool terminated = false;
    try {
        terminated = supervisor_.terminate();
        if (terminated) {
            std::cout << "[ShutdownCoordinator] Server stopped" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ShutdownCoordinator] Failed to stop server: " << e.what() << std::endl;
    }

    lock_file_.clear();
    shut_down_ = true;
    return terminated;
}

bool ShutdownCoordinator::has_shut_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shut_down_;
}

} // namespace thoughts
