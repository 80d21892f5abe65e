#include "outbound_caller/agent/pipeline.hpp"

#include <utility>

namespace outbound_caller {

Utterance::Utterance(std::string id, std::string text)
    : id_(std::move(id)), text_(std::move(text)) {}

const std::string& Utterance::id() const {
    return id_;
}

const std::string& Utterance::text() const {
    return text_;
}

void Utterance::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return done_; });
}

bool Utterance::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return done_; });
}

bool Utterance::done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

bool Utterance::interrupted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interrupted_;
}

void Utterance::finish(bool interrupted) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (done_) {
            return;
        }
        done_ = true;
        interrupted_ = interrupted;
    }
    cv_.notify_all();
}

}
