// File: src/transaction/src/LockDurationGuard.cpp
#include "LockDurationGuard.hpp"
#include "../../utils/LoggingSystem/LogMacros.hpp"
#include <exception>
#include <utility>
#include <vector>

namespace datasync {
namespace transaction {

LockDurationGuard::LockDurationGuard(ExpiryHandler handler)
    : handler_(std::move(handler))
{
}

LockDurationGuard::~LockDurationGuard() {
    stop();
}

bool LockDurationGuard::start() {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    if (running_.load()) {
        return false;
    }
    running_ = true;
    thread_ = std::thread([this]() { run(); });
    return true;
}

void LockDurationGuard::stop() {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        dropped = deadlines_.size();
        deadlines_.clear();
        index_.clear();
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        LOG_DEBUG("LOCK", "Duration guard stopped, " + std::to_string(dropped) + " timers disarmed");
    }
}

TimerID LockDurationGuard::arm(const ResourceID& resource, TransactionID tid, Duration after) {
    TimerID id = 0;
    bool new_head = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return 0;
        }
        id = next_id_++;
        const TimePoint deadline = Clock::now() + after;
        auto it = deadlines_.emplace(deadline, Timer{id, resource, tid});
        index_[id] = it;
        new_head = (it == deadlines_.begin());
    }
    // 只有新的最早截止时间需要唤醒定时线程
    if (new_head) {
        cv_.notify_all();
    }
    return id;
}

bool LockDurationGuard::disarm(TimerID id) {
    if (id == 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    deadlines_.erase(it->second);
    index_.erase(it);
    return true;
}

size_t LockDurationGuard::armed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadlines_.size();
}

void LockDurationGuard::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (deadlines_.empty()) {
            cv_.wait(lock, [this]() { return !running_.load() || !deadlines_.empty(); });
            continue;
        }

        const TimePoint next = deadlines_.begin()->first;
        if (Clock::now() < next) {
            cv_.wait_until(lock, next);
            continue;
        }

        // 取出所有已到期的定时器
        std::vector<Timer> expired;
        const TimePoint now = Clock::now();
        while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
            expired.push_back(std::move(deadlines_.begin()->second));
            index_.erase(expired.back().id);
            deadlines_.erase(deadlines_.begin());
        }

        lock.unlock();
        for (const auto& timer : expired) {
            fired_count_++;
            try {
                handler_(timer.resource, timer.transaction_id);
            } catch (const std::exception& e) {
                LOG_ERROR("LOCK", "Duration guard handler failed for " + timer.resource +
                                  ": " + e.what());
            }
        }
        lock.lock();
    }
}

} // namespace transaction
} // namespace datasync
