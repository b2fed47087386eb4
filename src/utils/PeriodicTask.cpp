// File: src/utils/PeriodicTask.cpp
#include "PeriodicTask.hpp"
#include "LoggingSystem/LogMacros.hpp"
#include <exception>
#include <utility>

namespace datasync {
namespace utils {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body)
    : name_(std::move(name))
    , interval_(interval)
    , body_(std::move(body))
{
}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start() {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    if (running_.load() || !body_) {
        return false;
    }

    running_ = true;
    thread_ = std::thread([this]() { loop(); });
    LOG_DEBUG("TASK", "Periodic task '" + name_ + "' started, interval " +
                      std::to_string(interval_.count()) + " ms");
    return true;
}

void PeriodicTask::stop() {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        LOG_DEBUG("TASK", "Periodic task '" + name_ + "' stopped after " +
                          std::to_string(run_count_.load()) + " runs");
    }
}

void PeriodicTask::run_once() {
    execute();
}

void PeriodicTask::loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            cv_.wait_for(lock, interval_, [this]() { return !running_; });
        }

        if (!running_) {
            break;
        }

        execute();
    }
}

void PeriodicTask::execute() {
    try {
        body_();
    } catch (const std::exception& e) {
        LOG_ERROR("TASK", "Periodic task '" + name_ + "' threw exception: " + e.what());
    }
    run_count_++;
}

} // namespace utils
} // namespace datasync
