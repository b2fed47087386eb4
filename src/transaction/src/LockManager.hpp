// File: src/transaction/src/LockManager.hpp
// 键控锁管理器（含死锁检测）
#pragma once

#include "../include/LockKey.hpp"
#include "../include/Transaction.hpp"
#include "LockManagerConfig.hpp"
#include "LockManagerCore.hpp"
#include <any>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace datasync {
namespace transaction {

/**
 * LockManager - 锁管理器
 *
 * 为任意键提供进程内的排他"事务"：
 * - try_start/start 获取，阻塞不超过给定的超时
 * - end 释放，不是调用者持有时为空操作
 * - 空闲锁表项定期清理，持有中的永不清理
 * - 超过最大持有时长的事务被强制结束（TIMED_OUT）
 * - 后台死锁检测按策略选出牺牲者强制结束（ABORTED）
 *
 * 强制结束通过 TransactionHandle 通知原持有者，也可在构造时注册回调。
 * 锁不可重入，也不保证公平。
 *
 * @tparam Key 键类型，需可拷贝
 * @tparam Identity 键 -> ResourceID 的单射映射
 */
template<typename Key, typename Identity = NodeIdentity<Key>>
class LockManager {
public:
    using KeyType = Key;
    using Stats = LockManagerCore::Stats;
    using DeadlockInfo = DeadlockDetector::DeadlockInfo;

    /**
     * TerminationCallback - 强制结束回调（在后台线程上调用，回调中不得调用 dispose()）
     */
    using TerminationCallback = std::function<void(const Key& key, TransactionOutcome outcome)>;

    /**
     * @throws std::invalid_argument 配置不合法
     */
    explicit LockManager(LockManagerConfig config = LockManagerConfig(),
                         TerminationCallback on_terminated = nullptr)
        : core_(std::move(config), make_listener(std::move(on_terminated)))
    {
    }

    ~LockManager() = default;

    // 禁止拷贝
    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    /**
     * try_start - 以默认超时获取锁
     */
    bool try_start(const Key& key) {
        return start(key).valid();
    }

    /**
     * try_start - 获取锁
     * @param timeout 最长等待时间，0 表示不等待
     * @return 是否获取成功（超时返回 false，不抛异常）
     */
    bool try_start(const Key& key, Duration timeout) {
        return start(key, timeout).valid();
    }

    /**
     * start - 以默认超时获取锁并返回句柄
     */
    TransactionHandle start(const Key& key) {
        return start(key, core_.config().acquisition_timeout);
    }

    /**
     * start - 获取锁并返回句柄
     * @return 获取失败时返回无效句柄
     */
    TransactionHandle start(const Key& key, Duration timeout) {
        return TransactionHandle(core_.try_start(Identity::of(key), std::any(key), timeout));
    }

    /**
     * end - 释放调用者持有的锁（可重复调用）
     * @return 是否真正释放
     */
    bool end(const Key& key) {
        return core_.end(Identity::of(key));
    }

    /**
     * end_all - 释放调用者持有的所有锁
     */
    size_t end_all() {
        return core_.end_all();
    }

    /**
     * current_transaction - 调用者在 key 上的事务，未持有时返回无效句柄
     */
    TransactionHandle current_transaction(const Key& key) const {
        return TransactionHandle(core_.current_transaction(Identity::of(key)));
    }

    bool is_held_by_current_context(const Key& key) const {
        return core_.current_transaction(Identity::of(key)) != nullptr;
    }

    /**
     * held_by_current_context - 调用者当前持有的所有键
     */
    std::vector<Key> held_by_current_context() const {
        std::vector<Key> keys;
        for (const auto& any_key : core_.held_keys(current_context_id())) {
            if (const Key* key = std::any_cast<Key>(&any_key)) {
                keys.push_back(*key);
            }
        }
        return keys;
    }

    bool is_locked(const Key& key) const {
        return core_.is_locked(Identity::of(key));
    }

    size_t evict_expired() {
        return core_.evict_expired();
    }

    std::optional<DeadlockInfo> detect_deadlocks() {
        return core_.detect_deadlocks();
    }

    /**
     * dispose - 停止后台任务（可重复调用，析构时自动调用）
     *
     * 不会强制释放仍被持有的锁
     */
    void dispose() {
        core_.dispose();
    }

    bool is_disposed() const { return core_.is_disposed(); }

    Stats get_stats() const { return core_.get_stats(); }
    const LockManagerConfig& config() const { return core_.config(); }

    static ResourceID resource_of(const Key& key) { return Identity::of(key); }

    const LockManagerCore& core() const { return core_; }

private:
    static LockManagerCore::TerminationListener make_listener(TerminationCallback callback) {
        if (!callback) {
            return nullptr;
        }
        return [callback](const std::any& key, const ResourceID&, TransactionOutcome outcome) {
            if (const Key* typed = std::any_cast<Key>(&key)) {
                callback(*typed, outcome);
            }
        };
    }

    LockManagerCore core_;
};

} // namespace transaction
} // namespace datasync
