// File: src/transaction/src/TransactionState.hpp
// 事务结局通道
#pragma once

#include "../include/Transaction.hpp"
#include <condition_variable>
#include <mutex>

namespace datasync {
namespace transaction {

/**
 * TransactionState - 单个事务的结局槽
 *
 * 由 LockEntry 在成功获取时创建，句柄与锁表项共享。
 * 结局只写一次：持有者 end()、最大时长守卫、死锁处理器谁先调用 conclude() 谁生效。
 */
class TransactionState {
public:
    TransactionState(TransactionID tid, ResourceID resource, ContextID owner, TimePoint acquired_at);

    TransactionState(const TransactionState&) = delete;
    TransactionState& operator=(const TransactionState&) = delete;

    TransactionID id() const { return id_; }
    const ResourceID& resource() const { return resource_; }
    ContextID owner() const { return owner_; }
    TimePoint acquired_at() const { return acquired_at_; }

    TransactionOutcome outcome() const;

    /**
     * conclude - 写入结局
     * @param outcome 非 ACTIVE 的结局
     * @return 本次调用是否写入（已结束的事务返回 false）
     */
    bool conclude(TransactionOutcome outcome);

    TransactionOutcome wait() const;
    bool wait_for(Duration timeout) const;

private:
    const TransactionID id_;
    const ResourceID resource_;
    const ContextID owner_;
    const TimePoint acquired_at_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    TransactionOutcome outcome_ = TransactionOutcome::ACTIVE;
};

} // namespace transaction
} // namespace datasync
