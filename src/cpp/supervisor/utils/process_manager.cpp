#include <thoughts/utils/process_manager.h>
#include <thoughts/utils/path_utils.h>
#include <thoughts/error_types.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace thoughts {
namespace utils {

namespace {

// Read fd until EOF and forward complete lines to the channel
void pump_lines(int fd, OutputStream stream, std::shared_ptr<OutputChannel> channel) {
    char buffer[4096];
    std::string line_buffer;

    while (true) {
        ssize_t bytes_read = read(fd, buffer, sizeof(buffer));
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (bytes_read == 0) {
            break;
        }
        line_buffer.append(buffer, static_cast<size_t>(bytes_read));

        // Process complete lines
        size_t pos;
        while ((pos = line_buffer.find('\n')) != std::string::npos) {
            std::string line = line_buffer.substr(0, pos);
            line_buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            channel->send({stream, std::move(line)});
        }
    }

    // Forward any remaining partial line
    if (!line_buffer.empty()) {
        channel->send({stream, std::move(line_buffer)});
    }

    close(fd);
    channel->producer_done();
}

class PosixChildProcess : public ChildProcess {
public:
    explicit PosixChildProcess(pid_t pid) : pid_(pid) {}

    pid_t pid() const override { return pid_; }

    bool is_running() override {
        if (reaped_) {
            return false;
        }
        int status;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_ || (result < 0 && errno == ECHILD)) {
            reaped_ = true;
            return false;
        }
        return result == 0;  // 0 means still running
    }

    void kill() override {
        if (!is_running()) {
            return;
        }

        if (::kill(pid_, SIGTERM) != 0) {
            if (errno == ESRCH) {
                return;
            }
            throw TerminationException(pid_, std::strerror(errno));
        }

        if (is_running()) {
            // Reap in the background so the exit path never waits on the child
            pid_t pid = pid_;
            std::thread([pid]() {
                int status;
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
                    continue;
                }
            }).detach();
        }
    }

private:
    pid_t pid_;
    bool reaped_ = false;
};

// Closes both ends of a pipe unless released
struct PipePair {
    int fds[2] = {-1, -1};

    ~PipePair() {
        for (int& fd : fds) {
            if (fd != -1) {
                close(fd);
            }
        }
    }
};

std::string resolve_executable(const std::string& executable) {
    if (executable.find('/') != std::string::npos) {
        return access(executable.c_str(), X_OK) == 0 ? executable : "";
    }
    return find_on_path(executable);
}

class PosixProcessLauncher : public ProcessLauncher {
public:
    SpawnedProcess spawn(const CommandSpec& spec) override {
        std::string executable = resolve_executable(spec.executable);
        if (executable.empty()) {
            throw SpawnException(spec.executable, "executable not found");
        }

        PipePair out_pipe;
        PipePair err_pipe;
        if (pipe2(out_pipe.fds, O_CLOEXEC) != 0 || pipe2(err_pipe.fds, O_CLOEXEC) != 0) {
            throw SpawnException(spec.executable, std::string("pipe failed: ") + std::strerror(errno));
        }

        // Prepare argv
        std::vector<char*> argv_ptrs;
        argv_ptrs.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : spec.args) {
            argv_ptrs.push_back(const_cast<char*>(arg.c_str()));
        }
        argv_ptrs.push_back(nullptr);

        // Inherit our environment, with spec.env_vars taking precedence
        std::vector<std::string> env_storage;
        for (char** env = environ; env && *env; ++env) {
            std::string entry(*env);
            std::string key = entry.substr(0, entry.find('='));
            bool overridden = false;
            for (const auto& env_pair : spec.env_vars) {
                if (env_pair.first == key) {
                    overridden = true;
                    break;
                }
            }
            if (!overridden) {
                env_storage.push_back(entry);
            }
        }
        for (const auto& env_pair : spec.env_vars) {
            env_storage.push_back(env_pair.first + "=" + env_pair.second);
        }
        std::vector<char*> envp;
        for (auto& entry : env_storage) {
            envp.push_back(const_cast<char*>(entry.c_str()));
        }
        envp.push_back(nullptr);

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&actions, out_pipe.fds[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, err_pipe.fds[1], STDERR_FILENO);

        pid_t pid = 0;
        int status = posix_spawn(&pid, executable.c_str(), &actions, nullptr,
                                 argv_ptrs.data(), envp.data());
        posix_spawn_file_actions_destroy(&actions);

        if (status != 0) {
            throw SpawnException(spec.executable, std::strerror(status));
        }

        // Parent keeps only the read ends
        close(out_pipe.fds[1]);
        out_pipe.fds[1] = -1;
        close(err_pipe.fds[1]);
        err_pipe.fds[1] = -1;

        SpawnedProcess spawned;
        spawned.child = std::make_unique<PosixChildProcess>(pid);
        spawned.output = std::make_shared<OutputChannel>();

        spawned.output->add_producer();
        spawned.output->add_producer();
        std::thread(pump_lines, out_pipe.fds[0], OutputStream::Stdout, spawned.output).detach();
        out_pipe.fds[0] = -1;
        std::thread(pump_lines, err_pipe.fds[0], OutputStream::Stderr, spawned.output).detach();
        err_pipe.fds[0] = -1;

        return spawned;
    }
};

} // namespace

std::unique_ptr<ProcessLauncher> create_process_launcher() {
    return std::make_unique<PosixProcessLauncher>();
}

bool ProcessManager::send_signal(pid_t pid, int signal) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, signal) == 0;
}

bool ProcessManager::is_process_alive(pid_t pid) {
    if (pid <= 0) return false;

    // First check if process exists at all
    if (::kill(pid, 0) != 0) {
        return errno == EPERM;  // Exists but owned by someone else
    }

    // Check if it's a zombie by reading /proc/PID/stat
    // Format: PID (name) STATE ...
    std::string stat_path = "/proc/" + std::to_string(pid) + "/stat";
    std::ifstream stat_file(stat_path);
    if (!stat_file) {
        return true;  // No procfs, trust kill(0)
    }

    std::string line;
    std::getline(stat_file, line);

    // Find the state character (after the closing paren of the process name)
    size_t paren_pos = line.rfind(')');
    if (paren_pos != std::string::npos && paren_pos + 2 < line.length()) {
        char state = line[paren_pos + 2];
        return (state != 'Z');
    }

    // If we can't parse the state, assume alive to be safe
    return true;
}

} // namespace utils
} // namespace thoughts
