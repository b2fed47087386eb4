// File: src/transaction/src/LockTable.hpp
// 锁表实现
#pragma once

#include "../include/Transaction.hpp"
#include "TransactionState.hpp"
#include <any>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace datasync {
namespace transaction {

/**
 * TimerID - 最大时长守卫的定时器 ID，0 表示未设置
 */
using TimerID = uint64_t;

/**
 * LockEntry - 锁表项
 *
 * 表示一个键上的排他锁。所有字段都由 mutex_ 保护，
 * 后台清理读取时间戳和前台修改持有状态走同一把锁。
 */
class LockEntry {
public:
    /**
     * Snapshot - 锁表项的一致快照
     */
    struct Snapshot {
        ResourceID resource;
        bool locked = false;
        ContextID owner = 0;
        TransactionID transaction_id = 0;
        TimePoint acquired_at;
        TimePoint last_accessed;
        size_t pins = 0;
    };

    /**
     * Released - 一次释放的结果，由调用者完成后续清理
     */
    struct Released {
        std::shared_ptr<TransactionState> transaction;
        ContextID owner = 0;
        TimerID timer = 0;
    };

    LockEntry(ResourceID resource, std::any key);
    ~LockEntry() = default;

    // 禁止拷贝
    LockEntry(const LockEntry&) = delete;
    LockEntry& operator=(const LockEntry&) = delete;

    const ResourceID& resource() const { return resource_; }

    // 首次创建该项时的类型化键
    const std::any& key() const { return key_; }

    /**
     * try_acquire - 非阻塞获取
     * @param ctx 请求者上下文
     * @param tid 成功时分配给新事务的 ID
     * @return 新事务的结局槽；锁已被占用时返回 nullptr
     */
    std::shared_ptr<TransactionState> try_acquire(ContextID ctx, TransactionID tid);

    /**
     * acquire - 最多等待 timeout 获取锁
     *
     * 不保证公平，也不可重入：持有者再次获取同一把锁会等到超时
     */
    std::shared_ptr<TransactionState> acquire(ContextID ctx, TransactionID tid, Duration timeout);

    /**
     * release - 持有者释放
     * @return 不是 ctx 持有时返回 std::nullopt
     */
    std::optional<Released> release(ContextID ctx);

    /**
     * force_release - 强制释放指定事务
     *
     * 只有当前事务 ID 与 tid 相同才释放，过期的定时器或牺牲者不会误伤后来的事务
     */
    std::optional<Released> force_release(TransactionID tid);

    /**
     * set_timer - 记录守卫定时器
     * @return 事务 tid 已不是当前事务时返回 false
     */
    bool set_timer(TransactionID tid, TimerID timer);

    bool is_locked() const;
    bool is_held_by(ContextID ctx) const;

    // ctx 当前持有的事务，不持有时返回 nullptr
    std::shared_ptr<TransactionState> transaction_of(ContextID ctx) const;

    Snapshot snapshot() const;

    /**
     * is_evictable - 未持有、未被引用、空闲超过 expiration
     */
    bool is_evictable(TimePoint now, Duration expiration) const;

    // 引用计数，由 LockTable 在分片锁内增加
    void pin() { pins_.fetch_add(1); }
    void unpin() { pins_.fetch_sub(1); }
    size_t pins() const { return pins_.load(); }

private:
    std::shared_ptr<TransactionState> take_locked(ContextID ctx, TransactionID tid);
    Released clear_locked();

    const ResourceID resource_;
    const std::any key_;

    bool locked_ = false;
    ContextID owner_ = 0;
    TimePoint acquired_at_;
    TimePoint last_accessed_;
    std::shared_ptr<TransactionState> transaction_;
    TimerID timer_ = 0;

    std::atomic<size_t> pins_{0};

    // 互斥锁
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * LockTable - 锁表
 *
 * ResourceID -> LockEntry，按哈希分片，每个分片一把锁。
 * 锁表项在首次访问时创建，只由 evict_idle() 删除。
 */
class LockTable {
public:
    /**
     * EntryRef - 锁表项引用
     *
     * 存活期间锁表项被钉住，清理线程不会删除它
     */
    class EntryRef {
    public:
        EntryRef() = default;
        explicit EntryRef(std::shared_ptr<LockEntry> entry);
        ~EntryRef();

        EntryRef(EntryRef&& other) noexcept;
        EntryRef& operator=(EntryRef&& other) noexcept;
        EntryRef(const EntryRef&) = delete;
        EntryRef& operator=(const EntryRef&) = delete;

        LockEntry* get() const { return entry_.get(); }
        LockEntry* operator->() const { return entry_.get(); }
        LockEntry& operator*() const { return *entry_; }
        explicit operator bool() const { return entry_ != nullptr; }

        void reset();

    private:
        std::shared_ptr<LockEntry> entry_;
    };

    struct Stats {
        size_t entries = 0;
        size_t held = 0;
        size_t shards = 0;
        uint64_t created = 0;
        uint64_t evicted = 0;
    };

    explicit LockTable(size_t shard_count = 16);
    ~LockTable() = default;

    // 禁止拷贝
    LockTable(const LockTable&) = delete;
    LockTable& operator=(const LockTable&) = delete;

    /**
     * get_or_create - 获取锁表项，不存在时创建
     * @param resource 资源标识
     * @param key 创建时保存的类型化键
     */
    EntryRef get_or_create(const ResourceID& resource, const std::any& key);

    /**
     * find - 查找锁表项，不存在时返回空引用
     */
    EntryRef find(const ResourceID& resource) const;

    bool contains(const ResourceID& resource) const;

    /**
     * evict_idle - 删除所有可清理的锁表项
     *
     * 被持有或被引用的项永远不会删除
     * @return 删除的数量
     */
    size_t evict_idle(TimePoint now, Duration expiration);

    size_t size() const;
    std::vector<LockEntry::Snapshot> snapshot() const;
    Stats get_stats() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<ResourceID, std::shared_ptr<LockEntry>> entries;
    };

    Shard& shard_for(const ResourceID& resource) const;

    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> evicted_{0};
};

} // namespace transaction
} // namespace datasync
