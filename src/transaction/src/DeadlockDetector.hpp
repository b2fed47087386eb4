// File: src/transaction/src/DeadlockDetector.hpp
// 死锁检测
#pragma once

#include "../include/Transaction.hpp"
#include "LockManagerConfig.hpp"
#include "WaitForGraph.hpp"
#include "../../utils/PeriodicTask.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace datasync {
namespace transaction {

/**
 * VictimCandidate - 环中一个被持有的资源及其当前事务
 */
struct VictimCandidate {
    ResourceID resource;
    ContextID owner = 0;
    TransactionID transaction_id = 0;
    TimePoint acquired_at;
};

/**
 * VictimSelector - 牺牲者选择接口
 */
class VictimSelector {
public:
    virtual ~VictimSelector() = default;

    /**
     * choose_victim - 从候选中选出一个牺牲者
     * @return 候选为空时返回 std::nullopt
     */
    virtual std::optional<VictimCandidate> choose_victim(
        const std::vector<VictimCandidate>& candidates) const;

    /**
     * rank_victims - 按被选中的优先级排序
     */
    virtual std::vector<VictimCandidate> rank_victims(
        const std::vector<VictimCandidate>& candidates) const = 0;

    virtual std::string name() const = 0;
};

/**
 * AgeBasedVictimSelector - 按获取时间选择
 *
 * TERMINATE_OLDEST 选 acquired_at 最小者，TERMINATE_NEWEST 选最大者；
 * 时间相同按事务 ID 同向比较，保证结果确定
 */
class AgeBasedVictimSelector : public VictimSelector {
public:
    explicit AgeBasedVictimSelector(ResolutionStrategy strategy);

    std::vector<VictimCandidate> rank_victims(
        const std::vector<VictimCandidate>& candidates) const override;

    std::string name() const override;

    ResolutionStrategy strategy() const { return strategy_; }

private:
    ResolutionStrategy strategy_;
};

std::unique_ptr<VictimSelector> MakeVictimSelector(ResolutionStrategy strategy);

/**
 * DeadlockDetector - 死锁检测器
 *
 * 定期在等待图中找环，从环上被持有的资源中选一个牺牲者强制终止。
 * 每次检测最多终止一个牺牲者，剩余的争用留给下一次检测。
 */
class DeadlockDetector {
public:
    /**
     * DeadlockInfo - 一次检测的结果
     */
    struct DeadlockInfo {
        std::vector<GraphNode> cycle;               // 环上的节点
        std::vector<VictimCandidate> candidates;    // 环上被持有的资源
        std::optional<VictimCandidate> victim;      // 选中的牺牲者
        bool resolved = false;                      // 牺牲者是否已被终止
    };

    // 资源 -> 候选（资源未被持有时返回 std::nullopt）
    using CandidateProvider = std::function<std::optional<VictimCandidate>(const ResourceID&)>;

    // 终止牺牲者，返回是否真正终止
    using VictimHandler = std::function<bool(const VictimCandidate&)>;

    DeadlockDetector(const WaitForGraph& graph,
                     CandidateProvider candidates,
                     VictimHandler on_victim,
                     std::unique_ptr<VictimSelector> selector,
                     Duration interval);
    ~DeadlockDetector();

    // 禁止拷贝
    DeadlockDetector(const DeadlockDetector&) = delete;
    DeadlockDetector& operator=(const DeadlockDetector&) = delete;

    /**
     * start_background_detection - 启动后台检测
     */
    bool start_background_detection();

    /**
     * stop_background_detection - 停止后台检测（可重复调用）
     */
    void stop_background_detection();

    bool is_running() const { return task_.is_running(); }

    /**
     * detect_only - 只检测并选出牺牲者，不终止
     */
    std::optional<DeadlockInfo> detect_only() const;

    /**
     * detect_and_resolve - 检测并终止牺牲者
     */
    std::optional<DeadlockInfo> detect_and_resolve();

    const VictimSelector& selector() const { return *selector_; }

    uint64_t get_detection_count() const { return detection_count_.load(); }
    uint64_t get_deadlock_count() const { return deadlock_count_.load(); }
    uint64_t get_resolved_count() const { return resolved_count_.load(); }

private:
    const WaitForGraph& graph_;
    CandidateProvider candidates_;
    VictimHandler on_victim_;
    std::unique_ptr<VictimSelector> selector_;

    // 统计信息
    mutable std::atomic<uint64_t> detection_count_{0};
    std::atomic<uint64_t> deadlock_count_{0};
    std::atomic<uint64_t> resolved_count_{0};

    utils::PeriodicTask task_;
};

} // namespace transaction
} // namespace datasync
