#include "skyhop/control_channel.hpp"

namespace skyhop {

void ControlChannel::publish(ControlMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        messages_.push_back(std::move(message));
    }
    cv_.notify_one();
}

std::optional<ControlMessage> ControlChannel::poll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || !messages_.empty(); });
    if (messages_.empty()) {
        return std::nullopt;
    }
    auto message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

std::vector<ControlMessage> ControlChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ControlMessage> drained(std::make_move_iterator(messages_.begin()),
                                        std::make_move_iterator(messages_.end()));
    messages_.clear();
    return drained;
}

void ControlChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ControlChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace skyhop
