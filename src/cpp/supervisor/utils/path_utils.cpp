#include <thoughts/utils/path_utils.h>
#include <thoughts/error_types.h>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

#include <pwd.h>
#include <unistd.h>
#include <limits.h>

namespace fs = std::filesystem;

namespace thoughts {
namespace utils {

std::string get_executable_dir() {
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len != -1) {
        buffer[len] = '\0';
        fs::path exe_path(buffer);
        return exe_path.parent_path().string();
    }
    // Fallback: return current directory
    return ".";
}

std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }

    long size = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(size > 0 ? static_cast<size_t>(size) : 16384);
    struct passwd pwd;
    struct passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 &&
        result && result->pw_dir && *result->pw_dir) {
        return result->pw_dir;
    }
    return "";
}

fs::path resolve_config_dir() {
    fs::path config_dir;

    const char* override_dir = std::getenv(CONFIG_PATH_ENV);
    if (override_dir && *override_dir) {
        config_dir = override_dir;
    } else {
        std::string home = home_dir();
        if (home.empty()) {
            throw ConfigException("Could not determine home directory");
        }
        std::cerr << "Warning: " << CONFIG_PATH_ENV
                  << " not set, using home directory as fallback" << std::endl;
        config_dir = fs::path(home) / ".thoughts";
    }

    std::error_code ec;
    fs::create_directories(config_dir, ec);
    if (ec) {
        throw ConfigException("Could not create '" + config_dir.string() + "': " + ec.message());
    }
    if (!fs::is_directory(config_dir, ec)) {
        throw ConfigException("'" + config_dir.string() + "' is not a directory");
    }

    return config_dir;
}

std::string find_on_path(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return "";
    }

    std::istringstream stream(path_env);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        fs::path candidate = fs::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

} // namespace utils
} // namespace thoughts
