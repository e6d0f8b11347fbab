#include <thoughts/lock_file.h>
#include <thoughts/error_types.h>
#include <fstream>
#include <sstream>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;

namespace thoughts {

LockFile::LockFile(fs::path base_dir, int port)
    : path_(path_for(base_dir, port))
    , port_(port)
{
}

fs::path LockFile::path_for(const fs::path& base_dir, int port) {
    return base_dir / ("server-" + std::to_string(port) + ".pid");
}

void LockFile::write(pid_t pid) const {
    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw LockFileException(path_.string(), std::strerror(errno));
    }

    out << pid;
    out.flush();
    if (!out) {
        throw LockFileException(path_.string(), "write failed");
    }
}

std::optional<pid_t> LockFile::read() const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();

    // Trim surrounding whitespace
    size_t start = 0;
    while (start < content.size() && std::isspace(static_cast<unsigned char>(content[start]))) {
        ++start;
    }
    size_t end = content.size();
    while (end > start && std::isspace(static_cast<unsigned char>(content[end - 1]))) {
        --end;
    }
    if (start == end) {
        return std::nullopt;
    }

    long long value = 0;
    for (size_t i = start; i < end; ++i) {
        char c = content[i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
        if (value > 0x7fffffffLL) {
            return std::nullopt;
        }
    }
    if (value <= 0) {
        return std::nullopt;
    }

    return static_cast<pid_t>(value);
}

void LockFile::clear() const noexcept {
    std::error_code ec;
    fs::remove(path_, ec);
}

} // namespace thoughts
