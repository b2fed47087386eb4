// File: src/transaction/src/DeadlockDetector.cpp
// 死锁检测实现
#include "DeadlockDetector.hpp"
#include "../../utils/LoggingSystem/LogMacros.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace datasync {
namespace transaction {

namespace {

std::string describe_cycle(const std::vector<GraphNode>& cycle) {
    std::ostringstream oss;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) {
            oss << " -> ";
        }
        oss << cycle[i].to_string();
    }
    if (!cycle.empty()) {
        oss << " -> " << cycle.front().to_string();
    }
    return oss.str();
}

} // namespace

// ========== VictimSelector ==========

std::optional<VictimCandidate> VictimSelector::choose_victim(
    const std::vector<VictimCandidate>& candidates) const {
    if (candidates.empty()) {
        return std::nullopt;
    }
    auto ranked = rank_victims(candidates);
    if (ranked.empty()) {
        return std::nullopt;
    }
    return ranked.front();
}

// ========== AgeBasedVictimSelector 实现 ==========

AgeBasedVictimSelector::AgeBasedVictimSelector(ResolutionStrategy strategy)
    : strategy_(strategy)
{
}

std::vector<VictimCandidate> AgeBasedVictimSelector::rank_victims(
    const std::vector<VictimCandidate>& candidates) const {
    std::vector<VictimCandidate> ranked = candidates;

    auto older = [](const VictimCandidate& a, const VictimCandidate& b) {
        if (a.acquired_at != b.acquired_at) {
            return a.acquired_at < b.acquired_at;
        }
        return a.transaction_id < b.transaction_id;
    };

    switch (strategy_) {
        case ResolutionStrategy::TERMINATE_OLDEST:
            std::sort(ranked.begin(), ranked.end(), older);
            break;
        case ResolutionStrategy::TERMINATE_NEWEST:
            std::sort(ranked.begin(), ranked.end(),
                      [&older](const VictimCandidate& a, const VictimCandidate& b) {
                          return older(b, a);
                      });
            break;
    }
    return ranked;
}

std::string AgeBasedVictimSelector::name() const {
    return std::string("AgeBased(") + ToString(strategy_) + ")";
}

std::unique_ptr<VictimSelector> MakeVictimSelector(ResolutionStrategy strategy) {
    return std::make_unique<AgeBasedVictimSelector>(strategy);
}

// ========== DeadlockDetector 实现 ==========

DeadlockDetector::DeadlockDetector(const WaitForGraph& graph,
                                   CandidateProvider candidates,
                                   VictimHandler on_victim,
                                   std::unique_ptr<VictimSelector> selector,
                                   Duration interval)
    : graph_(graph)
    , candidates_(std::move(candidates))
    , on_victim_(std::move(on_victim))
    , selector_(std::move(selector))
    , task_("deadlock-detection", interval, [this]() { detect_and_resolve(); })
{
    if (!selector_) {
        selector_ = MakeVictimSelector(ResolutionStrategy::TERMINATE_OLDEST);
    }
}

DeadlockDetector::~DeadlockDetector() {
    stop_background_detection();
}

bool DeadlockDetector::start_background_detection() {
    return task_.start();
}

void DeadlockDetector::stop_background_detection() {
    task_.stop();
}

std::optional<DeadlockDetector::DeadlockInfo> DeadlockDetector::detect_only() const {
    detection_count_++;

    auto cycle = graph_.cycle_nodes();
    if (!cycle) {
        return std::nullopt;
    }

    DeadlockInfo info;
    info.cycle = std::move(*cycle);
    for (const auto& node : info.cycle) {
        if (!node.is_resource()) {
            continue;
        }
        auto candidate = candidates_(node.id);
        if (candidate) {
            info.candidates.push_back(std::move(*candidate));
        }
    }
    info.victim = selector_->choose_victim(info.candidates);
    return info;
}

std::optional<DeadlockDetector::DeadlockInfo> DeadlockDetector::detect_and_resolve() {
    auto info = detect_only();
    if (!info) {
        return std::nullopt;
    }
    deadlock_count_++;

    if (!info->victim) {
        // 环上的资源在检测期间已被释放
        LOG_DEBUG("DEADLOCK", "Cycle without held resources: " + describe_cycle(info->cycle));
        return info;
    }

    const VictimCandidate& victim = *info->victim;
    LOG_WARN("DEADLOCK", "Deadlock detected: " + describe_cycle(info->cycle) +
                         "; victim " + victim.resource + " (txn " +
                         std::to_string(victim.transaction_id) + ", context " +
                         std::to_string(victim.owner) + ", " + selector_->name() + ")");

    info->resolved = on_victim_ && on_victim_(victim);
    if (info->resolved) {
        resolved_count_++;
    }
    return info;
}

} // namespace transaction
} // namespace datasync
