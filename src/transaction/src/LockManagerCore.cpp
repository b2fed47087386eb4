// File: src/transaction/src/LockManagerCore.cpp
// 锁管理器实现
#include "LockManagerCore.hpp"
#include "../../utils/LoggingSystem/LogMacros.hpp"
#include <exception>
#include <sstream>
#include <utility>

namespace datasync {
namespace transaction {

std::string LockManagerCore::Stats::to_string() const {
    std::ostringstream oss;
    oss << "LockManagerStats{acquisitions=" << acquisitions
        << ", releases=" << releases
        << ", timeouts=" << acquisition_timeouts
        << ", deadlock_aborts=" << deadlock_aborts
        << ", duration_expiries=" << duration_expiries
        << ", evictions=" << evictions
        << ", detections=" << deadlock_detections
        << ", deadlocks=" << deadlocks_found
        << ", table_size=" << table_size
        << ", held=" << held_locks
        << ", timers=" << armed_timers
        << ", graph_edges=" << graph_edges << "}";
    return oss.str();
}

LockManagerConfig LockManagerCore::validated(LockManagerConfig config) {
    config.validate();
    return config;
}

LockManagerCore::LockManagerCore(LockManagerConfig config, TerminationListener listener)
    : config_(validated(std::move(config)))
    , listener_(std::move(listener))
    , table_(config_.lock_table_shards)
    , guard_([this](const ResourceID& resource, TransactionID tid) {
          terminate(resource, tid, TransactionOutcome::TIMED_OUT);
      })
    , sweeper_(table_, config_.expiration_time, config_.eviction_interval)
    , detector_(graph_,
                [this](const ResourceID& resource) { return candidate_for(resource); },
                [this](const VictimCandidate& victim) {
                    return terminate(victim.resource, victim.transaction_id, TransactionOutcome::ABORTED);
                },
                MakeVictimSelector(config_.resolution_strategy),
                config_.deadlock_detection_interval)
{
    guard_.start();
    if (config_.enable_eviction) {
        sweeper_.start();
    }
    if (config_.enable_deadlock_detection) {
        detector_.start_background_detection();
    }
    LOG_INFO("LOCK", "Lock manager started: " + config_.to_string());
}

LockManagerCore::~LockManagerCore() {
    dispose();
}

std::shared_ptr<TransactionState> LockManagerCore::try_start(const ResourceID& resource,
                                                             const std::any& key,
                                                             Duration timeout) {
    const ContextID ctx = current_context_id();
    LockTable::EntryRef entry = table_.get_or_create(resource, key);
    const TransactionID tid = next_transaction_id_++;

    auto state = entry->try_acquire(ctx, tid);
    if (!state) {
        // 自己已持有时不记等待边，否则会形成自环被当作死锁处理
        const bool self_held = entry->is_held_by(ctx);
        if (!self_held && timeout.count() > 0) {
            graph_.add_wait(ctx, resource);
        }

        state = entry->acquire(ctx, tid, timeout);
        if (!state) {
            acquisition_timeouts_++;
            if (!self_held) {
                // 仍持有其它资源时保留等待边，供死锁检测使用
                if (holds_any(ctx)) {
                    graph_.add_wait(ctx, resource);
                } else {
                    graph_.remove_wait(ctx, resource);
                }
            }
            LOG_DEBUG("LOCK", "Context " + std::to_string(ctx) + " timed out on " + resource +
                              " after " + DurationToString(timeout) +
                              (self_held ? " (already held by this context)" : ""));
            return nullptr;
        }
    }

    graph_.remove_wait(ctx, resource);
    graph_.add_hold(resource, ctx);
    record_hold(ctx, resource, key);

    const TimerID timer = guard_.arm(resource, tid, config_.max_lock_duration);
    if (!entry->set_timer(tid, timer)) {
        // 记录完成前事务已被强制终止，撤销本次记录
        guard_.disarm(timer);
        graph_.remove_hold(resource, ctx);
        if (forget_hold(ctx, resource)) {
            graph_.remove_waits_of(ctx);
        }
        LOG_DEBUG("LOCK", "Transaction " + std::to_string(tid) + " on " + resource +
                          " was terminated before it was recorded");
        return nullptr;
    }

    acquisitions_++;
    LOG_DEBUG("LOCK", "Context " + std::to_string(ctx) + " acquired " + resource +
                      " (txn " + std::to_string(tid) + ")");
    return state;
}

bool LockManagerCore::end(const ResourceID& resource) {
    const ContextID ctx = current_context_id();
    LockTable::EntryRef entry = table_.find(resource);
    if (!entry) {
        LOG_DEBUG("LOCK", "end(" + resource + ") ignored: no lock entry");
        return false;
    }

    auto released = entry->release(ctx);
    if (!released) {
        LOG_DEBUG("LOCK", "end(" + resource + ") ignored: not held by context " + std::to_string(ctx));
        return false;
    }

    finish_release(resource, *released);
    released->transaction->conclude(TransactionOutcome::RELEASED);
    releases_++;
    LOG_DEBUG("LOCK", "Context " + std::to_string(ctx) + " released " + resource +
                      " (txn " + std::to_string(released->transaction->id()) + ")");
    return true;
}

size_t LockManagerCore::end_all() {
    const ContextID ctx = current_context_id();
    std::vector<ResourceID> resources;
    {
        std::lock_guard<std::mutex> lock(holds_mutex_);
        auto it = context_locks_.find(ctx);
        if (it != context_locks_.end()) {
            for (const auto& pair : it->second) {
                resources.push_back(pair.first);
            }
        }
    }

    size_t released = 0;
    for (const auto& resource : resources) {
        if (end(resource)) {
            released++;
        }
    }
    return released;
}

bool LockManagerCore::terminate(const ResourceID& resource, TransactionID tid, TransactionOutcome outcome) {
    LockTable::EntryRef entry = table_.find(resource);
    if (!entry) {
        return false;
    }

    auto released = entry->force_release(tid);
    if (!released) {
        // 事务已经结束或已被后来的事务取代
        return false;
    }

    finish_release(resource, *released);

    if (outcome == TransactionOutcome::TIMED_OUT) {
        duration_expiries_++;
        LOG_WARN("LOCK", "Transaction " + std::to_string(tid) + " on " + resource +
                         " exceeded max duration " + DurationToString(config_.max_lock_duration) +
                         ", lock released");
    } else {
        deadlock_aborts_++;
        LOG_WARN("LOCK", "Transaction " + std::to_string(tid) + " on " + resource +
                         " aborted, context " + std::to_string(released->owner));
    }

    if (listener_) {
        try {
            listener_(entry->key(), resource, outcome);
        } catch (const std::exception& e) {
            LOG_ERROR("LOCK", std::string("Termination listener threw: ") + e.what());
        }
    }
    // 最后写入结局：等待句柄的一方醒来时统计和回调都已完成
    released->transaction->conclude(outcome);
    return true;
}

void LockManagerCore::finish_release(const ResourceID& resource, const LockEntry::Released& released) {
    guard_.disarm(released.timer);
    graph_.remove_hold(resource, released.owner);
    if (forget_hold(released.owner, resource)) {
        // 不再持有任何资源的上下文不可能处在环上
        graph_.remove_waits_of(released.owner);
    }
}

void LockManagerCore::record_hold(ContextID ctx, const ResourceID& resource, const std::any& key) {
    std::lock_guard<std::mutex> lock(holds_mutex_);
    context_locks_[ctx][resource] = key;
}

bool LockManagerCore::forget_hold(ContextID ctx, const ResourceID& resource) {
    std::lock_guard<std::mutex> lock(holds_mutex_);
    auto it = context_locks_.find(ctx);
    if (it == context_locks_.end()) {
        return true;
    }
    it->second.erase(resource);
    if (it->second.empty()) {
        context_locks_.erase(it);
        return true;
    }
    return false;
}

bool LockManagerCore::holds_any(ContextID ctx) const {
    std::lock_guard<std::mutex> lock(holds_mutex_);
    auto it = context_locks_.find(ctx);
    return it != context_locks_.end() && !it->second.empty();
}

std::shared_ptr<TransactionState> LockManagerCore::current_transaction(const ResourceID& resource) const {
    LockTable::EntryRef entry = table_.find(resource);
    if (!entry) {
        return nullptr;
    }
    return entry->transaction_of(current_context_id());
}

std::vector<std::any> LockManagerCore::held_keys(ContextID ctx) const {
    std::vector<std::any> keys;
    std::lock_guard<std::mutex> lock(holds_mutex_);
    auto it = context_locks_.find(ctx);
    if (it != context_locks_.end()) {
        for (const auto& pair : it->second) {
            keys.push_back(pair.second);
        }
    }
    return keys;
}

bool LockManagerCore::is_locked(const ResourceID& resource) const {
    LockTable::EntryRef entry = table_.find(resource);
    return entry && entry->is_locked();
}

std::optional<VictimCandidate> LockManagerCore::candidate_for(const ResourceID& resource) const {
    LockTable::EntryRef entry = table_.find(resource);
    if (!entry) {
        return std::nullopt;
    }
    const LockEntry::Snapshot snap = entry->snapshot();
    if (!snap.locked) {
        return std::nullopt;
    }
    VictimCandidate candidate;
    candidate.resource = resource;
    candidate.owner = snap.owner;
    candidate.transaction_id = snap.transaction_id;
    candidate.acquired_at = snap.acquired_at;
    return candidate;
}

size_t LockManagerCore::evict_expired() {
    return sweeper_.sweep_once();
}

std::optional<DeadlockDetector::DeadlockInfo> LockManagerCore::detect_deadlocks() {
    return detector_.detect_and_resolve();
}

void LockManagerCore::dispose() {
    std::lock_guard<std::mutex> lock(dispose_mutex_);
    if (disposed_.exchange(true)) {
        return;
    }

    detector_.stop_background_detection();
    sweeper_.stop();
    guard_.stop();

    const auto stats = table_.get_stats();
    LOG_INFO("LOCK", "Lock manager disposed, " + std::to_string(stats.held) +
                     " locks still held by their owners");
}

LockManagerCore::Stats LockManagerCore::get_stats() const {
    Stats stats;
    stats.acquisitions = acquisitions_.load();
    stats.releases = releases_.load();
    stats.acquisition_timeouts = acquisition_timeouts_.load();
    stats.deadlock_aborts = deadlock_aborts_.load();
    stats.duration_expiries = duration_expiries_.load();
    stats.evictions = sweeper_.get_evicted_total();
    stats.deadlock_detections = detector_.get_detection_count();
    stats.deadlocks_found = detector_.get_deadlock_count();

    const auto table_stats = table_.get_stats();
    stats.table_size = table_stats.entries;
    stats.held_locks = table_stats.held;
    stats.armed_timers = guard_.armed_count();
    stats.graph_edges = graph_.edge_count();
    return stats;
}

} // namespace transaction
} // namespace datasync
