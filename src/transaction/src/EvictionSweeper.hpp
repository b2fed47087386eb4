// File: src/transaction/src/EvictionSweeper.hpp
// 空闲锁表项清理
#pragma once

#include "LockTable.hpp"
#include "../../utils/PeriodicTask.hpp"
#include <atomic>
#include <cstdint>

namespace datasync {
namespace transaction {

/**
 * EvictionSweeper - 定期删除未持有且空闲超过 expiration 的锁表项
 *
 * 被删除的项在下次访问时重新创建，不会丢失持有状态
 */
class EvictionSweeper {
public:
    EvictionSweeper(LockTable& table, Duration expiration, Duration interval);
    ~EvictionSweeper();

    // 禁止拷贝
    EvictionSweeper(const EvictionSweeper&) = delete;
    EvictionSweeper& operator=(const EvictionSweeper&) = delete;

    bool start();
    void stop();
    bool is_running() const { return task_.is_running(); }

    /**
     * sweep_once - 立即执行一次清理
     * @return 本次删除的数量
     */
    size_t sweep_once();

    uint64_t get_sweep_count() const { return sweep_count_.load(); }
    uint64_t get_evicted_total() const { return evicted_total_.load(); }

private:
    LockTable& table_;
    const Duration expiration_;

    std::atomic<uint64_t> sweep_count_{0};
    std::atomic<uint64_t> evicted_total_{0};

    utils::PeriodicTask task_;
};

} // namespace transaction
} // namespace datasync
