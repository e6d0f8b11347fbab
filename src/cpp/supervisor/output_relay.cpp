#include <thoughts/output_relay.h>
#include <exception>
#include <iostream>

#include <unistd.h>

namespace thoughts {

namespace {

constexpr const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

constexpr const char* ANSI_BLUE_BOLD = "\033[1;94m";
constexpr const char* ANSI_RED_BOLD = "\033[1;91m";
constexpr const char* ANSI_RESET = "\033[0m";

} // namespace

ConsoleLogSink::ConsoleLogSink(std::string tag)
    : tag_(std::move(tag))
    , use_color_(isatty(STDOUT_FILENO) != 0)
{
}

void ConsoleLogSink::write(OutputStream stream, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (use_color_) {
        const char* color = (stream == OutputStream::Stdout) ? ANSI_BLUE_BOLD : ANSI_RED_BOLD;
        std::cout << color << tag_ << ANSI_RESET << " " << line << std::endl;
    } else {
        std::cout << tag_ << (stream == OutputStream::Stderr ? " (stderr) " : " ") << line << std::endl;
    }
}

std::string sanitize_utf8(const std::string& bytes) {
    std::string result;
    result.reserve(bytes.size());

    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);

        if (c < 0x80) {
            result += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t length;
        unsigned int code_point;
        unsigned int min_code_point;
        if ((c & 0xE0) == 0xC0) {
            length = 2;
            code_point = c & 0x1F;
            min_code_point = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            length = 3;
            code_point = c & 0x0F;
            min_code_point = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            length = 4;
            code_point = c & 0x07;
            min_code_point = 0x10000;
        } else {
            // Stray continuation byte or invalid lead byte
            result += REPLACEMENT_CHARACTER;
            ++i;
            continue;
        }

        // Consume the longest valid prefix of continuation bytes
        size_t consumed = 1;
        while (consumed < length && i + consumed < n &&
               (static_cast<unsigned char>(bytes[i + consumed]) & 0xC0) == 0x80) {
            code_point = (code_point << 6) | (static_cast<unsigned char>(bytes[i + consumed]) & 0x3F);
            ++consumed;
        }

        bool valid = consumed == length &&
                     code_point >= min_code_point &&
                     code_point <= 0x10FFFF &&
                     !(code_point >= 0xD800 && code_point <= 0xDFFF);
        if (valid) {
            result.append(bytes, i, length);
        } else {
            result += REPLACEMENT_CHARACTER;
        }
        i += consumed;
    }

    return result;
}

OutputRelay::~OutputRelay() {
    // The child may leave descendants holding its pipes open; never block here
    if (thread_.joinable()) {
        thread_.detach();
    }
}

void OutputRelay::start(std::shared_ptr<OutputChannel> channel, std::shared_ptr<LogSink> sink) {
    if (thread_.joinable()) {
        thread_.detach();
    }
    thread_ = std::thread(&OutputRelay::run, std::move(channel), std::move(sink));
}

void OutputRelay::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void OutputRelay::run(std::shared_ptr<OutputChannel> channel, std::shared_ptr<LogSink> sink) {
    while (auto event = channel->receive()) {
        try {
            sink->write(event->stream, sanitize_utf8(event->line));
        } catch (const std::exception& e) {
            std::cerr << "[OutputRelay] Failed to forward line: " << e.what() << std::endl;
        }
    }
}

} // namespace thoughts
