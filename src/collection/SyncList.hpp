// File: src/collection/SyncList.hpp
// 按下标加锁的同步列表
#pragma once

#include "../transaction/src/LockManager.hpp"
#include <algorithm>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace datasync {
namespace collection {

/**
 * LockAcquisitionError - 未能在超时内获取下标锁
 */
class LockAcquisitionError : public std::runtime_error {
public:
    explicit LockAcquisitionError(size_t index)
        : std::runtime_error("could not acquire lock for index " + std::to_string(index))
        , index_(index) {}

    size_t index() const { return index_; }

private:
    size_t index_;
};

/**
 * SyncList - 同步列表
 *
 * get/set/insert/remove/remove_at 先为下标获取锁（同一上下文已持有时不重复获取），
 * 获取失败抛出 LockAcquisitionError。add/size/contains/index_of/clear 不加锁。
 *
 * 锁在操作后继续持有，直到该上下文调用 release()（或 Scope 析构）。
 * 列表析构时释放析构线程所在上下文获取的下标锁。
 * 元素本身另由一把互斥锁保护。
 */
template<typename T>
class SyncList {
public:
    using LockManagerType = transaction::LockManager<size_t>;

    /**
     * Scope - 作用域结束时释放当前上下文获取的所有下标锁
     */
    class Scope {
    public:
        explicit Scope(SyncList& list) : list_(list) {}
        ~Scope() { list_.release(); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        SyncList& list_;
    };

    explicit SyncList(transaction::LockManagerConfig config = transaction::LockManagerConfig())
        : locks_(std::make_shared<LockManagerType>(std::move(config)))
    {
    }

    // 与其它组件共享同一个锁管理器
    explicit SyncList(std::shared_ptr<LockManagerType> locks)
        : locks_(std::move(locks))
    {
        if (!locks_) {
            throw std::invalid_argument("SyncList requires a lock manager");
        }
    }

    ~SyncList() {
        release();
    }

    SyncList(const SyncList&) = delete;
    SyncList& operator=(const SyncList&) = delete;

    T get(size_t index) {
        acquire(index);
        std::lock_guard<std::mutex> lock(items_mutex_);
        check_index(index, items_.size());
        return items_[index];
    }

    void set(size_t index, T value) {
        acquire(index);
        std::lock_guard<std::mutex> lock(items_mutex_);
        check_index(index, items_.size());
        items_[index] = std::move(value);
    }

    // index == size() 时追加到末尾
    void insert(size_t index, T value) {
        acquire(index);
        std::lock_guard<std::mutex> lock(items_mutex_);
        check_index(index, items_.size() + 1);
        items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
    }

    /**
     * remove - 删除第一个等于 value 的元素
     * @return 是否找到
     */
    bool remove(const T& value) {
        for (;;) {
            const size_t index = index_of(value);
            if (index == npos) {
                return false;
            }
            acquire(index);

            std::lock_guard<std::mutex> lock(items_mutex_);
            // 等锁期间元素可能被移动到别的下标，只删除已加锁下标上的元素
            if (index < items_.size() && items_[index] == value) {
                items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
                return true;
            }
        }
    }

    void remove_at(size_t index) {
        acquire(index);
        std::lock_guard<std::mutex> lock(items_mutex_);
        check_index(index, items_.size());
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    }

    void add(T value) {
        std::lock_guard<std::mutex> lock(items_mutex_);
        items_.push_back(std::move(value));
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(items_mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    bool contains(const T& value) const {
        return index_of(value) != npos;
    }

    // 未找到返回 npos
    size_t index_of(const T& value) const {
        std::lock_guard<std::mutex> lock(items_mutex_);
        auto it = std::find(items_.begin(), items_.end(), value);
        return it == items_.end() ? npos : static_cast<size_t>(it - items_.begin());
    }

    // 只清空元素，已获取的下标锁不受影响
    void clear() {
        std::lock_guard<std::mutex> lock(items_mutex_);
        items_.clear();
    }

    std::vector<T> to_vector() const {
        std::lock_guard<std::mutex> lock(items_mutex_);
        return items_;
    }

    /**
     * get_acquired_locks - 所有上下文当前标记为已获取的下标（升序）
     */
    std::vector<size_t> get_acquired_locks() const {
        std::lock_guard<std::mutex> lock(tracking_mutex_);
        std::set<size_t> indices;
        for (const auto& pair : acquired_) {
            indices.insert(pair.second.begin(), pair.second.end());
        }
        return std::vector<size_t>(indices.begin(), indices.end());
    }

    // 当前上下文获取的下标（升序）
    std::vector<size_t> get_acquired_locks_of_current_context() const {
        std::lock_guard<std::mutex> lock(tracking_mutex_);
        auto it = acquired_.find(transaction::current_context_id());
        if (it == acquired_.end()) {
            return {};
        }
        return std::vector<size_t>(it->second.begin(), it->second.end());
    }

    /**
     * release - 释放当前上下文获取的所有下标锁（可重复调用）
     * @return 释放的下标数
     */
    size_t release() {
        std::set<size_t> indices;
        {
            std::lock_guard<std::mutex> lock(tracking_mutex_);
            auto it = acquired_.find(transaction::current_context_id());
            if (it == acquired_.end()) {
                return 0;
            }
            indices.swap(it->second);
            acquired_.erase(it);
        }
        for (size_t index : indices) {
            locks_->end(index);
        }
        return indices.size();
    }

    LockManagerType& lock_manager() { return *locks_; }

    static constexpr size_t npos = static_cast<size_t>(-1);

private:
    static void check_index(size_t index, size_t limit) {
        if (index >= limit) {
            throw std::out_of_range("SyncList index " + std::to_string(index) +
                                    " out of range (size " + std::to_string(limit) + ")");
        }
    }

    void acquire(size_t index) {
        const transaction::ContextID ctx = transaction::current_context_id();
        {
            std::lock_guard<std::mutex> lock(tracking_mutex_);
            auto it = acquired_.find(ctx);
            if (it != acquired_.end() && it->second.count(index) > 0) {
                // 锁可能已被强制终止，此时重新获取
                if (locks_->is_held_by_current_context(index)) {
                    return;
                }
                it->second.erase(index);
            }
        }

        if (!locks_->try_start(index)) {
            throw LockAcquisitionError(index);
        }

        std::lock_guard<std::mutex> lock(tracking_mutex_);
        acquired_[ctx].insert(index);
    }

    std::shared_ptr<LockManagerType> locks_;

    std::vector<T> items_;
    mutable std::mutex items_mutex_;

    // 上下文 -> 该上下文获取的下标
    std::map<transaction::ContextID, std::set<size_t>> acquired_;
    mutable std::mutex tracking_mutex_;
};

} // namespace collection
} // namespace datasync
