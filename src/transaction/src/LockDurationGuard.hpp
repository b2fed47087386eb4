// File: src/transaction/src/LockDurationGuard.hpp
// 最大持有时长守卫
#pragma once

#include "../include/Transaction.hpp"
#include "LockTable.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace datasync {
namespace transaction {

/**
 * LockDurationGuard - 最大持有时长守卫
 *
 * 一个定时线程 + 按截止时间排序的队列。每次成功获取锁 arm() 一个一次性定时器，
 * end() 时 disarm()。到期时在定时线程上调用 ExpiryHandler（不持有内部锁）。
 *
 * 已经出队、正在回调的定时器 disarm() 无效，回调方按事务 ID 匹配保证不会误伤。
 */
class LockDurationGuard {
public:
    using ExpiryHandler = std::function<void(const ResourceID& resource, TransactionID tid)>;

    explicit LockDurationGuard(ExpiryHandler handler);
    ~LockDurationGuard();

    // 禁止拷贝
    LockDurationGuard(const LockDurationGuard&) = delete;
    LockDurationGuard& operator=(const LockDurationGuard&) = delete;

    /**
     * start - 启动定时线程
     */
    bool start();

    /**
     * stop - 停止定时线程并撤销所有定时器（可重复调用）
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * arm - 设置定时器
     * @param resource 资源
     * @param tid 事务 ID
     * @param after 多久后到期
     * @return 定时器 ID；守卫未运行时返回 0
     */
    TimerID arm(const ResourceID& resource, TransactionID tid, Duration after);

    /**
     * disarm - 撤销定时器
     * @return 定时器是否仍在队列中
     */
    bool disarm(TimerID id);

    size_t armed_count() const;
    uint64_t get_fired_count() const { return fired_count_.load(); }

private:
    struct Timer {
        TimerID id;
        ResourceID resource;
        TransactionID transaction_id;
    };
    using Queue = std::multimap<TimePoint, Timer>;

    void run();

    ExpiryHandler handler_;

    Queue deadlines_;
    std::unordered_map<TimerID, Queue::iterator> index_;
    TimerID next_id_ = 1;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> fired_count_{0};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::mutex lifecycle_mutex_;
};

} // namespace transaction
} // namespace datasync
