// File: src/transaction/src/TransactionState.cpp
#include "TransactionState.hpp"
#include <atomic>
#include <utility>

namespace datasync {
namespace transaction {

namespace {
std::atomic<ContextID> g_next_context_id{1};
} // namespace

ContextID current_context_id() {
    thread_local const ContextID id = g_next_context_id.fetch_add(1);
    return id;
}

const char* ToString(TransactionOutcome outcome) {
    switch (outcome) {
        case TransactionOutcome::ACTIVE:    return "ACTIVE";
        case TransactionOutcome::RELEASED:  return "RELEASED";
        case TransactionOutcome::ABORTED:   return "ABORTED";
        case TransactionOutcome::TIMED_OUT: return "TIMED_OUT";
    }
    return "UNKNOWN";
}

// ==================== TransactionState ====================

TransactionState::TransactionState(TransactionID tid, ResourceID resource,
                                   ContextID owner, TimePoint acquired_at)
    : id_(tid)
    , resource_(std::move(resource))
    , owner_(owner)
    , acquired_at_(acquired_at)
{
}

TransactionOutcome TransactionState::outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_;
}

bool TransactionState::conclude(TransactionOutcome outcome) {
    if (outcome == TransactionOutcome::ACTIVE) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome_ != TransactionOutcome::ACTIVE) {
            return false;
        }
        outcome_ = outcome;
    }
    cv_.notify_all();
    return true;
}

TransactionOutcome TransactionState::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return outcome_ != TransactionOutcome::ACTIVE; });
    return outcome_;
}

bool TransactionState::wait_for(Duration timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return outcome_ != TransactionOutcome::ACTIVE; });
}

// ==================== TransactionHandle ====================

TransactionHandle::TransactionHandle(std::shared_ptr<TransactionState> state)
    : state_(std::move(state))
{
}

const TransactionState& TransactionHandle::state() const {
    if (!state_) {
        throw std::logic_error("empty TransactionHandle");
    }
    return *state_;
}

TransactionID TransactionHandle::id() const {
    return state().id();
}

const ResourceID& TransactionHandle::resource() const {
    return state().resource();
}

ContextID TransactionHandle::owner() const {
    return state().owner();
}

TimePoint TransactionHandle::acquired_at() const {
    return state().acquired_at();
}

TransactionOutcome TransactionHandle::outcome() const {
    return state().outcome();
}

TransactionOutcome TransactionHandle::wait() const {
    return state().wait();
}

bool TransactionHandle::wait_for(Duration timeout) const {
    return state().wait_for(timeout);
}

void TransactionHandle::rethrow_if_terminated() const {
    const TransactionState& s = state();
    switch (s.outcome()) {
        case TransactionOutcome::ABORTED:
            throw TransactionAbortedError(s.id(), s.resource());
        case TransactionOutcome::TIMED_OUT:
            throw TransactionTimedOutError(s.id(), s.resource());
        case TransactionOutcome::ACTIVE:
        case TransactionOutcome::RELEASED:
            break;
    }
}

} // namespace transaction
} // namespace datasync
