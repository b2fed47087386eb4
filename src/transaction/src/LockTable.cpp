// File: src/transaction/src/LockTable.cpp
#include "LockTable.hpp"
#include <functional>
#include <utility>

namespace datasync {
namespace transaction {

// ==================== LockEntry 实现 ====================

LockEntry::LockEntry(ResourceID resource, std::any key)
    : resource_(std::move(resource))
    , key_(std::move(key))
    , acquired_at_(Clock::now())
    , last_accessed_(acquired_at_)
{
}

std::shared_ptr<TransactionState> LockEntry::take_locked(ContextID ctx, TransactionID tid) {
    const TimePoint now = Clock::now();
    locked_ = true;
    owner_ = ctx;
    acquired_at_ = now;
    last_accessed_ = now;
    timer_ = 0;
    transaction_ = std::make_shared<TransactionState>(tid, resource_, ctx, now);
    return transaction_;
}

LockEntry::Released LockEntry::clear_locked() {
    Released released;
    released.transaction = std::move(transaction_);
    released.owner = owner_;
    released.timer = timer_;

    locked_ = false;
    owner_ = 0;
    timer_ = 0;
    transaction_.reset();
    last_accessed_ = Clock::now();
    return released;
}

std::shared_ptr<TransactionState> LockEntry::try_acquire(ContextID ctx, TransactionID tid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (locked_) {
        return nullptr;
    }
    return take_locked(ctx, tid);
}

std::shared_ptr<TransactionState> LockEntry::acquire(ContextID ctx, TransactionID tid, Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!locked_) {
        return take_locked(ctx, tid);
    }
    if (timeout.count() <= 0) {
        return nullptr;
    }
    if (!cv_.wait_for(lock, timeout, [this]() { return !locked_; })) {
        return nullptr;
    }
    return take_locked(ctx, tid);
}

std::optional<LockEntry::Released> LockEntry::release(ContextID ctx) {
    std::optional<Released> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!locked_ || owner_ != ctx) {
            return std::nullopt;
        }
        released = clear_locked();
    }
    cv_.notify_one();
    return released;
}

std::optional<LockEntry::Released> LockEntry::force_release(TransactionID tid) {
    std::optional<Released> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!locked_ || !transaction_ || transaction_->id() != tid) {
            return std::nullopt;
        }
        released = clear_locked();
    }
    cv_.notify_one();
    return released;
}

bool LockEntry::set_timer(TransactionID tid, TimerID timer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!locked_ || !transaction_ || transaction_->id() != tid) {
        return false;
    }
    timer_ = timer;
    return true;
}

bool LockEntry::is_locked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

bool LockEntry::is_held_by(ContextID ctx) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_ && owner_ == ctx;
}

std::shared_ptr<TransactionState> LockEntry::transaction_of(ContextID ctx) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!locked_ || owner_ != ctx) {
        return nullptr;
    }
    return transaction_;
}

LockEntry::Snapshot LockEntry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot s;
    s.resource = resource_;
    s.locked = locked_;
    s.owner = owner_;
    s.transaction_id = transaction_ ? transaction_->id() : 0;
    s.acquired_at = acquired_at_;
    s.last_accessed = last_accessed_;
    s.pins = pins_.load();
    return s;
}

bool LockEntry::is_evictable(TimePoint now, Duration expiration) const {
    if (pins_.load() != 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return !locked_ && now - last_accessed_ > expiration;
}

// ==================== LockTable::EntryRef 实现 ====================

LockTable::EntryRef::EntryRef(std::shared_ptr<LockEntry> entry)
    : entry_(std::move(entry))
{
}

LockTable::EntryRef::~EntryRef() {
    reset();
}

LockTable::EntryRef::EntryRef(EntryRef&& other) noexcept
    : entry_(std::move(other.entry_))
{
}

LockTable::EntryRef& LockTable::EntryRef::operator=(EntryRef&& other) noexcept {
    if (this != &other) {
        reset();
        entry_ = std::move(other.entry_);
    }
    return *this;
}

void LockTable::EntryRef::reset() {
    if (entry_) {
        entry_->unpin();
        entry_.reset();
    }
}

// ==================== LockTable 实现 ====================

LockTable::LockTable(size_t shard_count) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

LockTable::Shard& LockTable::shard_for(const ResourceID& resource) const {
    const size_t index = std::hash<ResourceID>()(resource) % shards_.size();
    return *shards_[index];
}

LockTable::EntryRef LockTable::get_or_create(const ResourceID& resource, const std::any& key) {
    Shard& shard = shard_for(resource);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto& slot = shard.entries[resource];
    if (!slot) {
        slot = std::make_shared<LockEntry>(resource, key);
        created_++;
    }
    // 在分片锁内加引用，evict_idle() 看到的引用数与删除是原子的
    slot->pin();
    return EntryRef(slot);
}

LockTable::EntryRef LockTable::find(const ResourceID& resource) const {
    Shard& shard = shard_for(resource);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(resource);
    if (it == shard.entries.end()) {
        return EntryRef();
    }
    it->second->pin();
    return EntryRef(it->second);
}

bool LockTable::contains(const ResourceID& resource) const {
    Shard& shard = shard_for(resource);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.entries.count(resource) > 0;
}

size_t LockTable::evict_idle(TimePoint now, Duration expiration) {
    size_t evicted = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->entries.begin(); it != shard->entries.end();) {
            if (it->second->is_evictable(now, expiration)) {
                it = shard->entries.erase(it);
                evicted++;
            } else {
                ++it;
            }
        }
    }
    evicted_ += evicted;
    return evicted;
}

size_t LockTable::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

std::vector<LockEntry::Snapshot> LockTable::snapshot() const {
    std::vector<LockEntry::Snapshot> result;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& pair : shard->entries) {
            result.push_back(pair.second->snapshot());
        }
    }
    return result;
}

LockTable::Stats LockTable::get_stats() const {
    Stats stats;
    stats.shards = shards_.size();
    stats.created = created_.load();
    stats.evicted = evicted_.load();
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        stats.entries += shard->entries.size();
        for (const auto& pair : shard->entries) {
            if (pair.second->is_locked()) {
                stats.held++;
            }
        }
    }
    return stats;
}

} // namespace transaction
} // namespace datasync
