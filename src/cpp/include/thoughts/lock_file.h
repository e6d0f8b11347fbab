#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace thoughts {

// Persisted record of "a server for this port is believed running".
// Holds the child's pid as decimal text at <base_dir>/server-<port>.pid.
class LockFile {
public:
    LockFile(std::filesystem::path base_dir, int port);

    // Deterministic path for a (base_dir, port) pair
    static std::filesystem::path path_for(const std::filesystem::path& base_dir, int port);

    // Overwrite the record with pid. Throws LockFileException on I/O failure.
    void write(pid_t pid) const;

    // Returns nullopt when the file is absent, unreadable or not a number
    std::optional<pid_t> read() const;

    // Best-effort removal. Missing files and deletion errors are ignored.
    void clear() const noexcept;

    const std::filesystem::path& path() const { return path_; }
    int port() const { return port_; }

private:
    std::filesystem::path path_;
    int port_;
};

} // namespace thoughts
