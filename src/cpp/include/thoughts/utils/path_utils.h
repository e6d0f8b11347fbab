#pragma once

#include <string>
#include <filesystem>

namespace thoughts {
namespace utils {

// Environment variable that overrides the base directory
constexpr const char* CONFIG_PATH_ENV = "THOUGHTS_CONFIG_PATH";

/**
 * Get the directory where the executable is located.
 * This allows us to find the sidecar relative to the executable,
 * regardless of the current working directory.
 */
std::string get_executable_dir();

/**
 * Current user's home directory: $HOME, else the passwd entry.
 * @return Empty string if neither is available.
 */
std::string home_dir();

/**
 * Resolve the base directory holding the lock record.
 * Uses $THOUGHTS_CONFIG_PATH when set, otherwise home_dir()/.thoughts (with
 * a warning on stderr). The directory is created with its parents.
 * @throws ConfigException if no directory can be determined or created.
 */
std::filesystem::path resolve_config_dir();

/**
 * Search PATH for an executable with the given name.
 * @return Full path, or empty string if not found.
 */
std::string find_on_path(const std::string& name);

} // namespace utils
} // namespace thoughts
