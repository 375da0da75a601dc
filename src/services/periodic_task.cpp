#include "enricher/periodic_task.hpp"
#include <spdlog/spdlog.h>

namespace enricher {

PeriodicTask::PeriodicTask(std::shared_ptr<astp::ThreadPool> system_thread_pool,
                           std::string name,
                           int interval_ms,
                           std::function<void()> body)
    : system_thread_pool_(std::move(system_thread_pool)),
      name_(std::move(name)),
      interval_ms_(interval_ms),
      body_(std::move(body)) {
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            spdlog::warn("[{}] Already running", name_);
            return;
        }
        running_ = true;
    }
    schedule_next_run();
    spdlog::info("[{}] Started: interval={}ms", name_, interval_ms_);
}

void PeriodicTask::stop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_ && !scheduled_) return;
    running_ = false;
    cv_.notify_all();
    cv_.wait(lock, [this] { return !scheduled_; });
    spdlog::info("[{}] Stopped after {} cycles", name_, cycles_.load());
}

void PeriodicTask::schedule_next_run() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    scheduled_ = true;
    system_thread_pool_->push([this]() {
        this->cycle();
    });
}

void PeriodicTask::cycle() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_), [this] { return !running_; });
        if (!running_) {
            scheduled_ = false;
            cv_.notify_all();
            return;
        }
    }

    try {
        body_();
    } catch (const std::exception& e) {
        spdlog::error("[{}] Cycle error: {}", name_, e.what());
    }
    cycles_++;

    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        // scheduled_ stays set for the follow-up cycle
        system_thread_pool_->push([this]() {
            this->cycle();
        });
        return;
    }
    scheduled_ = false;
    cv_.notify_all();
}

} // namespace enricher
