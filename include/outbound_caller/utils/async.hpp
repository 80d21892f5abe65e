#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

namespace outbound_caller {
namespace utils {

// Runs the task on a detached worker. The returned future becomes ready when the
// task returns and rethrows whatever it threw.
std::future<void> run_async(std::function<void()> task);

// Repeats a tick on its own thread until the tick returns false or stop() is called.
// The first tick runs immediately. stop() may be called from inside the tick; start()
// must not be.
class PeriodicTask {
public:
    using Tick = std::function<bool()>;

    PeriodicTask() = default;
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start(std::chrono::milliseconds interval, Tick tick);
    void stop();
    bool running() const;

private:
    void run(std::chrono::milliseconds interval, const Tick& tick);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

}
}
