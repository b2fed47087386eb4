// File: src/transaction/src/EvictionSweeper.cpp
#include "EvictionSweeper.hpp"
#include "../../utils/LoggingSystem/LogMacros.hpp"

namespace datasync {
namespace transaction {

EvictionSweeper::EvictionSweeper(LockTable& table, Duration expiration, Duration interval)
    : table_(table)
    , expiration_(expiration)
    , task_("lock-eviction", interval, [this]() { sweep_once(); })
{
}

EvictionSweeper::~EvictionSweeper() {
    stop();
}

bool EvictionSweeper::start() {
    return task_.start();
}

void EvictionSweeper::stop() {
    task_.stop();
}

size_t EvictionSweeper::sweep_once() {
    const size_t evicted = table_.evict_idle(Clock::now(), expiration_);
    sweep_count_++;
    evicted_total_ += evicted;

    if (evicted > 0) {
        LOG_INFO("LOCK", "Evicted " + std::to_string(evicted) + " idle lock entries, " +
                         std::to_string(table_.size()) + " remaining");
    } else {
        LOG_DEBUG("LOCK", "Eviction sweep found nothing to evict");
    }
    return evicted;
}

} // namespace transaction
} // namespace datasync
