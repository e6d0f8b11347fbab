#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace thoughts {

enum class OutputStream {
    Stdout,
    Stderr
};

// One line of child output, without the trailing newline.
// Bytes are raw; decoding happens in the relay.
struct OutputEvent {
    OutputStream stream;
    std::string line;
};

// Unbounded multi-producer queue of output events.
// Producers never block, so a slow consumer cannot stall the child.
class OutputChannel {
public:
    OutputChannel() = default;
    OutputChannel(const OutputChannel&) = delete;
    OutputChannel& operator=(const OutputChannel&) = delete;

    // Register a producer. The channel closes when every producer has
    // called producer_done().
    void add_producer();
    void producer_done();

    // Returns false if the channel is already closed
    bool send(OutputEvent event);

    // Blocks until an event is available. Returns nullopt once the channel
    // is closed and drained.
    std::optional<OutputEvent> receive();

    // Close immediately regardless of producers
    void close();

    bool is_closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutputEvent> queue_;
    int producers_ = 0;
    bool closed_ = false;
};

} // namespace thoughts
