#pragma once

#include "threadpool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace enricher {

/**
 * PeriodicTask - self-rescheduling job on the system thread pool
 *
 * Each cycle waits one interval, runs the body and pushes itself again;
 * the first run happens one interval after start(). stop() wakes a waiting cycle and blocks until no
 * cycle is queued or running, so the owner may be destroyed afterwards.
 */
class PeriodicTask {
public:
    PeriodicTask(std::shared_ptr<astp::ThreadPool> system_thread_pool,
                 std::string name,
                 int interval_ms,
                 std::function<void()> body);

    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool running() const { return running_; }
    uint64_t cycles() const { return cycles_; }

private:
    void schedule_next_run();
    void cycle();

    std::shared_ptr<astp::ThreadPool> system_thread_pool_;
    std::string name_;
    int interval_ms_;
    std::function<void()> body_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
    bool scheduled_ = false;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace enricher
