#include <thoughts/output_channel.h>

namespace thoughts {

void OutputChannel::add_producer() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++producers_;
}

void OutputChannel::producer_done() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (producers_ > 0 && --producers_ == 0) {
            closed_ = true;
        }
    }
    cv_.notify_all();
}

bool OutputChannel::send(OutputEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<OutputEvent> OutputChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return std::nullopt;
    }

    OutputEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void OutputChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool OutputChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace thoughts
