// File: src/transaction/src/LockManagerCore.hpp
// 锁管理器（与键类型无关的部分）
#pragma once

#include "../include/Transaction.hpp"
#include "DeadlockDetector.hpp"
#include "EvictionSweeper.hpp"
#include "LockDurationGuard.hpp"
#include "LockManagerConfig.hpp"
#include "LockTable.hpp"
#include "TransactionState.hpp"
#include "WaitForGraph.hpp"
#include <any>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace datasync {
namespace transaction {

/**
 * LockManagerCore - 锁管理器核心
 *
 * 以 ResourceID 为键管理排他锁，类型化的键以 std::any 保存在锁表项中，
 * 由 LockManager<Key> 在外层还原。
 *
 * 组件：
 * - LockTable：锁表
 * - WaitForGraph：等待图
 * - LockDurationGuard：最大持有时长守卫
 * - EvictionSweeper：空闲锁表项清理
 * - DeadlockDetector：死锁检测与处理
 *
 * 锁顺序：分片锁 -> 锁表项锁；等待图、守卫、持有表各自独立，互不嵌套。
 */
class LockManagerCore {
public:
    /**
     * TerminationListener - 强制终止通知
     *
     * 在终止线程上、所有内部锁之外调用。回调中不得调用 dispose()。
     */
    using TerminationListener =
        std::function<void(const std::any& key, const ResourceID& resource, TransactionOutcome outcome)>;

    struct Stats {
        uint64_t acquisitions = 0;
        uint64_t releases = 0;
        uint64_t acquisition_timeouts = 0;
        uint64_t deadlock_aborts = 0;
        uint64_t duration_expiries = 0;
        uint64_t evictions = 0;
        uint64_t deadlock_detections = 0;
        uint64_t deadlocks_found = 0;
        size_t table_size = 0;
        size_t held_locks = 0;
        size_t armed_timers = 0;
        size_t graph_edges = 0;

        std::string to_string() const;
    };

    /**
     * @throws std::invalid_argument 配置不合法
     */
    explicit LockManagerCore(LockManagerConfig config, TerminationListener listener = nullptr);
    ~LockManagerCore();

    // 禁止拷贝
    LockManagerCore(const LockManagerCore&) = delete;
    LockManagerCore& operator=(const LockManagerCore&) = delete;

    /**
     * try_start - 为当前上下文获取资源的排他锁
     * @param resource 资源标识
     * @param key 类型化的键
     * @param timeout 最长等待时间，0 表示不等待
     * @return 新事务的结局槽；超时或获取后立即被强制终止时返回 nullptr（不抛异常）
     */
    std::shared_ptr<TransactionState> try_start(const ResourceID& resource,
                                                const std::any& key,
                                                Duration timeout);

    /**
     * end - 当前上下文释放资源
     * @return 是否真正释放（不是当前上下文持有时为安全的空操作）
     */
    bool end(const ResourceID& resource);

    /**
     * end_all - 释放当前上下文持有的所有资源
     * @return 释放的数量
     */
    size_t end_all();

    /**
     * terminate - 强制结束指定事务
     *
     * 只在资源当前事务仍是 tid 时生效
     * @param outcome ABORTED 或 TIMED_OUT
     */
    bool terminate(const ResourceID& resource, TransactionID tid, TransactionOutcome outcome);

    // 当前上下文在 resource 上的事务，不持有时返回 nullptr
    std::shared_ptr<TransactionState> current_transaction(const ResourceID& resource) const;

    // ctx 持有的所有资源的类型化键（按资源标识排序）
    std::vector<std::any> held_keys(ContextID ctx) const;

    bool is_locked(const ResourceID& resource) const;

    /**
     * evict_expired - 立即执行一次空闲清理
     */
    size_t evict_expired();

    /**
     * detect_deadlocks - 立即执行一次死锁检测与处理
     */
    std::optional<DeadlockDetector::DeadlockInfo> detect_deadlocks();

    /**
     * dispose - 停止后台任务并撤销所有定时器（可重复调用）
     *
     * 仍被持有的锁保持持有，由持有者自行 end()
     */
    void dispose();
    bool is_disposed() const { return disposed_.load(); }

    Stats get_stats() const;
    const LockManagerConfig& config() const { return config_; }

    const LockTable& lock_table() const { return table_; }
    const WaitForGraph& wait_for_graph() const { return graph_; }
    const DeadlockDetector& deadlock_detector() const { return detector_; }

private:
    static LockManagerConfig validated(LockManagerConfig config);

    // end/terminate 共用的清理：撤销定时器、删除持有边、更新持有表
    void finish_release(const ResourceID& resource, const LockEntry::Released& released);

    void record_hold(ContextID ctx, const ResourceID& resource, const std::any& key);

    // 返回 ctx 是否已不再持有任何资源
    bool forget_hold(ContextID ctx, const ResourceID& resource);

    bool holds_any(ContextID ctx) const;

    std::optional<VictimCandidate> candidate_for(const ResourceID& resource) const;

    const LockManagerConfig config_;
    TerminationListener listener_;

    std::atomic<TransactionID> next_transaction_id_{1};

    LockTable table_;
    WaitForGraph graph_;

    // 上下文 -> 持有的资源及其类型化键
    std::unordered_map<ContextID, std::map<ResourceID, std::any>> context_locks_;
    mutable std::mutex holds_mutex_;

    // 统计信息
    std::atomic<uint64_t> acquisitions_{0};
    std::atomic<uint64_t> releases_{0};
    std::atomic<uint64_t> acquisition_timeouts_{0};
    std::atomic<uint64_t> deadlock_aborts_{0};
    std::atomic<uint64_t> duration_expiries_{0};

    std::atomic<bool> disposed_{false};
    std::mutex dispose_mutex_;

    // 后台组件最后构造、最先析构
    LockDurationGuard guard_;
    EvictionSweeper sweeper_;
    DeadlockDetector detector_;
};

} // namespace transaction
} // namespace datasync
