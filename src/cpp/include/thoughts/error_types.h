#pragma once

#include <string>
#include <exception>
#include <nlohmann/json.hpp>

namespace thoughts {

using json = nlohmann::json;

// Error types as constants
namespace ErrorType {
    constexpr const char* CONFIG_ERROR = "config_error";
    constexpr const char* SPAWN_ERROR = "spawn_error";
    constexpr const char* LOCK_FILE_ERROR = "lock_file_error";
    constexpr const char* TERMINATION_ERROR = "termination_error";
    constexpr const char* NETWORK_ERROR = "network_error";
    constexpr const char* INTERNAL_ERROR = "internal_error";
}

// Base exception class for all Thoughts errors
class ThoughtsException : public std::exception {
public:
    ThoughtsException(const std::string& message, const std::string& type = ErrorType::INTERNAL_ERROR)
        : message_(message), type_(type) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    const std::string& type() const { return type_; }

    json to_json() const {
        return {
            {"error", {
                {"message", message_},
                {"type", type_}
            }}
        };
    }

protected:
    std::string message_;
    std::string type_;
};

// Base directory could not be determined or created
class ConfigException : public ThoughtsException {
public:
    ConfigException(const std::string& message)
        : ThoughtsException("Configuration error: " + message, ErrorType::CONFIG_ERROR) {}
};

// Child executable could not be located or started
class SpawnException : public ThoughtsException {
public:
    SpawnException(const std::string& executable, const std::string& reason)
        : ThoughtsException("Failed to spawn '" + executable + "': " + reason, ErrorType::SPAWN_ERROR),
          executable_(executable) {}

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
};

class LockFileException : public ThoughtsException {
public:
    LockFileException(const std::string& path, const std::string& reason)
        : ThoughtsException("Lock file '" + path + "': " + reason, ErrorType::LOCK_FILE_ERROR) {}
};

class TerminationException : public ThoughtsException {
public:
    TerminationException(int pid, const std::string& reason)
        : ThoughtsException("Failed to terminate process " + std::to_string(pid) + ": " + reason,
                            ErrorType::TERMINATION_ERROR) {}
};

class NetworkException : public ThoughtsException {
public:
    NetworkException(const std::string& message)
        : ThoughtsException("Network error: " + message, ErrorType::NETWORK_ERROR) {}
};

} // namespace thoughts
