#include "outbound_caller/utils/async.hpp"

#include <exception>
#include <memory>

#include "outbound_caller/logging.hpp"

namespace outbound_caller::utils {

std::future<void> run_async(std::function<void()> task) {
    auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
    auto future = packaged->get_future();
    std::thread worker([packaged]() { (*packaged)(); });
    worker.detach();
    return future;
}

PeriodicTask::~PeriodicTask() {
    stop();
    if (worker_.joinable()) {
        worker_.detach();
    }
}

void PeriodicTask::start(std::chrono::milliseconds interval, Tick tick) {
    stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    worker_ = std::thread([this, interval, tick = std::move(tick)]() { run(interval, tick); });
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (!worker_.joinable() || worker_.get_id() == std::this_thread::get_id()) {
        return;
    }
    worker_.join();
}

bool PeriodicTask::running() const {
    return running_;
}

void PeriodicTask::run(std::chrono::milliseconds interval, const Tick& tick) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                break;
            }
        }
        bool keep_going = true;
        try {
            keep_going = tick();
        } catch (const std::exception& ex) {
            logging::warn("Periodic task tick failed", {kv("error", ex.what())});
        }
        if (!keep_going) {
            break;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, interval, [this]() { return stop_requested_; })) {
            break;
        }
    }
    running_ = false;
}

}
