// File: src/transaction/include/Transaction.hpp
// 事务接口定义
#pragma once

#include "datasync/Types.h"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace datasync {
namespace transaction {

// 前向声明
class TransactionState;

/**
 * TransactionID - 事务 ID 类型（每次成功获取锁分配一个新的 ID）
 */
using TransactionID = uint64_t;

/**
 * ContextID - 执行上下文 ID 类型
 *
 * 锁的持有者是执行上下文（线程），而不是线程对象本身
 */
using ContextID = uint64_t;

/**
 * ResourceID - 资源标识（由键经 NodeIdentity 映射得到，保证单射）
 */
using ResourceID = std::string;

/**
 * current_context_id - 当前线程的上下文 ID
 *
 * 进程内唯一、永不复用，首次调用时分配，从 1 开始
 */
ContextID current_context_id();

/**
 * TransactionOutcome - 事务结局
 *
 * 只会从 ACTIVE 变为其它三种之一，且只变一次
 */
enum class TransactionOutcome {
    ACTIVE,      // 仍持有锁
    RELEASED,    // 持有者正常 end()
    ABORTED,     // 被死锁处理器选为牺牲者强制终止
    TIMED_OUT    // 超过最大持有时长被强制终止
};

const char* ToString(TransactionOutcome outcome);

/**
 * TransactionTerminatedError - 事务被强制终止
 */
class TransactionTerminatedError : public std::runtime_error {
public:
    TransactionTerminatedError(const std::string& message,
                               TransactionID tid,
                               ResourceID resource,
                               TransactionOutcome outcome)
        : std::runtime_error(message)
        , transaction_id_(tid)
        , resource_(std::move(resource))
        , outcome_(outcome) {}

    TransactionID transaction_id() const { return transaction_id_; }
    const ResourceID& resource() const { return resource_; }
    TransactionOutcome outcome() const { return outcome_; }

private:
    TransactionID transaction_id_;
    ResourceID resource_;
    TransactionOutcome outcome_;
};

/**
 * TransactionAbortedError - 死锁牺牲者
 */
class TransactionAbortedError : public TransactionTerminatedError {
public:
    TransactionAbortedError(TransactionID tid, const ResourceID& resource)
        : TransactionTerminatedError("transaction " + std::to_string(tid) + " on " + resource +
                                     " aborted to break a deadlock",
                                     tid, resource, TransactionOutcome::ABORTED) {}
};

/**
 * TransactionTimedOutError - 超过最大持有时长
 */
class TransactionTimedOutError : public TransactionTerminatedError {
public:
    TransactionTimedOutError(TransactionID tid, const ResourceID& resource)
        : TransactionTerminatedError("transaction " + std::to_string(tid) + " on " + resource +
                                     " exceeded the maximum lock duration",
                                     tid, resource, TransactionOutcome::TIMED_OUT) {}
};

/**
 * TransactionHandle - 事务句柄
 *
 * 原始获取者（或其监督者）通过句柄观察事务结局：
 * - outcome() 轮询
 * - wait()/wait_for() 等待结局写入
 * - rethrow_if_terminated() 在调用者自己的上下文里抛出终止异常
 *
 * 默认构造的句柄无效（获取失败时返回）；对无效句柄访问事务信息抛出 std::logic_error
 */
class TransactionHandle {
public:
    TransactionHandle() = default;
    explicit TransactionHandle(std::shared_ptr<TransactionState> state);

    bool valid() const { return state_ != nullptr; }
    explicit operator bool() const { return valid(); }

    TransactionID id() const;
    const ResourceID& resource() const;
    ContextID owner() const;
    TimePoint acquired_at() const;

    TransactionOutcome outcome() const;
    bool is_active() const { return outcome() == TransactionOutcome::ACTIVE; }
    bool is_released() const { return outcome() == TransactionOutcome::RELEASED; }
    bool is_aborted() const { return outcome() == TransactionOutcome::ABORTED; }
    bool is_timed_out() const { return outcome() == TransactionOutcome::TIMED_OUT; }

    /**
     * wait - 阻塞直到事务结束
     * @return 最终结局
     */
    TransactionOutcome wait() const;

    /**
     * wait_for - 最多等待 timeout
     * @return 事务是否已经结束
     */
    bool wait_for(Duration timeout) const;

    /**
     * rethrow_if_terminated - 事务被强制终止时抛出对应异常
     * @throws TransactionAbortedError / TransactionTimedOutError
     */
    void rethrow_if_terminated() const;

private:
    const TransactionState& state() const;

    std::shared_ptr<TransactionState> state_;
};

} // namespace transaction
} // namespace datasync
