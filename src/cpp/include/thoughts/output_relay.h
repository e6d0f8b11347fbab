#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <thoughts/output_channel.h>

namespace thoughts {

// Destination for relayed child output
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(OutputStream stream, const std::string& line) = 0;
};

// Writes "[server] line" to stdout, tag colored by stream when on a terminal
class ConsoleLogSink : public LogSink {
public:
    explicit ConsoleLogSink(std::string tag = "[server]");

    void write(OutputStream stream, const std::string& line) override;

private:
    std::string tag_;
    bool use_color_;
    std::mutex mutex_;
};

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string& bytes);

// Drains an OutputChannel into a LogSink on its own thread.
// The thread ends when the channel is closed and empty.
class OutputRelay {
public:
    OutputRelay() = default;
    ~OutputRelay();

    OutputRelay(const OutputRelay&) = delete;
    OutputRelay& operator=(const OutputRelay&) = delete;

    void start(std::shared_ptr<OutputChannel> channel, std::shared_ptr<LogSink> sink);

    // Wait for the channel to drain
    void join();

    bool is_started() const { return thread_.joinable(); }

private:
    static void run(std::shared_ptr<OutputChannel> channel, std::shared_ptr<LogSink> sink);

    std::thread thread_;
};

} // namespace thoughts
