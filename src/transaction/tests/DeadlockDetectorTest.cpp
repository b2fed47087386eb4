// File: src/transaction/tests/DeadlockDetectorTest.cpp
// 死锁检测测试

#include "../src/DeadlockDetector.hpp"
#include "../src/LockManager.hpp"
#include "../include/Transaction.hpp"
#include "../../utils/tests/TestUtil.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace datasync;
using namespace datasync::transaction;
using datasync::test::ContextThread;
using namespace std::chrono_literals;

namespace {

LockManagerConfig manual_config(ResolutionStrategy strategy) {
    LockManagerConfig config;
    config.enable_eviction = false;
    config.enable_deadlock_detection = false;
    config.resolution_strategy = strategy;
    return config;
}

VictimCandidate candidate(const std::string& resource, TransactionID tid, TimePoint at) {
    VictimCandidate c;
    c.resource = resource;
    c.transaction_id = tid;
    c.acquired_at = at;
    return c;
}

/**
 * ThreeWayDeadlock - A、B、C 依次获取 k1、k2、k3，
 * 然后各自零超时请求下一个键失败，留下的等待边构成环
 */
struct ThreeWayDeadlock {
    LockManager<std::string> manager;
    ContextThread a;
    ContextThread b;
    ContextThread c;
    TransactionHandle h1;
    TransactionHandle h2;
    TransactionHandle h3;

    explicit ThreeWayDeadlock(ResolutionStrategy strategy)
        : manager(manual_config(strategy))
    {
        h1 = a.run([this]() { return manager.start("k1", 0ms); });
        std::this_thread::sleep_for(2ms);
        h2 = b.run([this]() { return manager.start("k2", 0ms); });
        std::this_thread::sleep_for(2ms);
        h3 = c.run([this]() { return manager.start("k3", 0ms); });

        a.run([this]() { return manager.try_start("k2", 0ms); });
        b.run([this]() { return manager.try_start("k3", 0ms); });
        c.run([this]() { return manager.try_start("k1", 0ms); });
    }
};

} // namespace

void test_age_based_selector() {
    TEST_CASE("按获取时间选择牺牲者");

    const TimePoint base = Clock::now();
    std::vector<VictimCandidate> candidates = {
        candidate("b", 2, base + 20ms),
        candidate("a", 1, base + 10ms),
        candidate("c", 3, base + 30ms),
    };

    AgeBasedVictimSelector oldest(ResolutionStrategy::TERMINATE_OLDEST);
    AgeBasedVictimSelector newest(ResolutionStrategy::TERMINATE_NEWEST);
    ASSERT(oldest.choose_victim(candidates)->resource == "a", "最早获取的被选中");
    ASSERT(newest.choose_victim(candidates)->resource == "c", "最晚获取的被选中");
    ASSERT(!oldest.choose_victim({}).has_value(), "没有候选时不选");

    // 时间相同时按事务 ID
    std::vector<VictimCandidate> tied = {
        candidate("x", 8, base),
        candidate("y", 5, base),
    };
    ASSERT(oldest.choose_victim(tied)->transaction_id == 5, "时间相同选较小的事务 ID");
    ASSERT(newest.choose_victim(tied)->transaction_id == 8, "时间相同选较大的事务 ID");

    auto ranked = oldest.rank_victims(candidates);
    ASSERT(ranked.size() == 3 && ranked[1].resource == "b", "完整排序");

    TEST_PASS("牺牲者选择通过");
}

void test_terminate_oldest() {
    TEST_CASE("三方死锁：终止最早的事务");

    ThreeWayDeadlock scenario(ResolutionStrategy::TERMINATE_OLDEST);
    auto& manager = scenario.manager;
    using Manager = LockManager<std::string>;

    auto info = manager.detect_deadlocks();
    ASSERT(info.has_value(), "检测到死锁");
    ASSERT(info->cycle.size() == 6, "环上有三个上下文和三个资源");
    ASSERT(info->candidates.size() == 3, "三个被持有的资源都是候选");
    ASSERT(info->victim && info->victim->resource == Manager::resource_of("k1"), "牺牲者是 k1");
    ASSERT(info->resolved, "牺牲者已被终止");

    ASSERT(scenario.h1.is_aborted(), "A 的事务结局为 ABORTED");
    ASSERT(scenario.h2.is_active() && scenario.h3.is_active(), "其余事务不受影响");
    ASSERT(!manager.is_locked("k1"), "k1 已释放");

    bool thrown = false;
    try {
        scenario.h1.rethrow_if_terminated();
    } catch (const TransactionAbortedError& e) {
        thrown = e.outcome() == TransactionOutcome::ABORTED;
    }
    ASSERT(thrown, "rethrow_if_terminated 抛出 TransactionAbortedError");

    ASSERT(!manager.detect_deadlocks().has_value(), "环已被打破");
    ASSERT(scenario.c.run([&]() { return manager.try_start("k1", 0ms); }), "C 现在可以获取 k1");

    auto stats = manager.get_stats();
    ASSERT(stats.deadlock_aborts == 1, "只终止一个牺牲者");
    ASSERT(stats.deadlocks_found == 1, "统计死锁次数");

    TEST_PASS("终止最早的事务通过");
}

void test_terminate_newest() {
    TEST_CASE("三方死锁：终止最晚的事务");

    ThreeWayDeadlock scenario(ResolutionStrategy::TERMINATE_NEWEST);
    using Manager = LockManager<std::string>;

    auto info = scenario.manager.detect_deadlocks();
    ASSERT(info.has_value() && info->victim, "检测到死锁");
    ASSERT(info->victim->resource == Manager::resource_of("k3"), "牺牲者是 k3");
    ASSERT(scenario.h3.is_aborted(), "C 的事务结局为 ABORTED");
    ASSERT(scenario.h1.is_active() && scenario.h2.is_active(), "其余事务不受影响");

    TEST_PASS("终止最晚的事务通过");
}

void test_detect_only_and_no_cycle() {
    TEST_CASE("只检测不处理");

    ThreeWayDeadlock scenario(ResolutionStrategy::TERMINATE_OLDEST);
    const auto& detector = scenario.manager.core().deadlock_detector();

    auto info = detector.detect_only();
    ASSERT(info.has_value() && info->victim, "检测到死锁并选出牺牲者");
    ASSERT(!info->resolved, "detect_only 不终止");
    ASSERT(scenario.h1.is_active(), "事务仍然活跃");

    LockManager<std::string> idle(manual_config(ResolutionStrategy::TERMINATE_OLDEST));
    ContextThread a;
    a.run([&]() { return idle.try_start("k", 0ms); });
    ASSERT(!idle.detect_deadlocks().has_value(), "没有等待时无死锁");

    TEST_PASS("只检测不处理通过");
}

void test_termination_callback() {
    TEST_CASE("终止回调");

    std::mutex mutex;
    std::vector<std::pair<int, TransactionOutcome>> notified;

    LockManager<int> manager(manual_config(ResolutionStrategy::TERMINATE_NEWEST),
                             [&](const int& key, TransactionOutcome outcome) {
                                 std::lock_guard<std::mutex> lock(mutex);
                                 notified.emplace_back(key, outcome);
                             });
    ContextThread a;
    ContextThread b;
    a.run([&]() { return manager.try_start(1, 0ms); });
    std::this_thread::sleep_for(2ms);
    b.run([&]() { return manager.try_start(2, 0ms); });
    a.run([&]() { return manager.try_start(2, 0ms); });
    b.run([&]() { return manager.try_start(1, 0ms); });

    auto info = manager.detect_deadlocks();
    ASSERT(info && info->resolved, "死锁被处理");

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT(notified.size() == 1, "回调被调用一次");
    ASSERT(notified[0].first == 2, "回调收到类型化的键 2");
    ASSERT(notified[0].second == TransactionOutcome::ABORTED, "回调收到 ABORTED");

    TEST_PASS("终止回调通过");
}

void test_end_to_end_background_resolution() {
    TEST_CASE("端到端：后台检测打破互相等待");

    LockManagerConfig config;
    config.enable_eviction = false;
    config.deadlock_detection_interval = Duration(100);
    config.resolution_strategy = ResolutionStrategy::TERMINATE_OLDEST;
    LockManager<std::string> manager(config);

    ContextThread a;
    ContextThread b;

    TransactionHandle a_k1 = a.run([&]() { return manager.start("k1", 0ms); });
    std::this_thread::sleep_for(5ms);
    TransactionHandle b_k2 = b.run([&]() { return manager.start("k2", 0ms); });
    ASSERT(a_k1.valid() && b_k2.valid(), "A 持有 k1，B 持有 k2");

    auto a_wants_k2 = a.async([&]() { return manager.try_start("k2", 5000ms); });
    auto b_wants_k1 = b.async([&]() { return manager.try_start("k1", 5000ms); });

    ASSERT(b_wants_k1.wait_for(3s) == std::future_status::ready, "B 在检测后继续");
    ASSERT(b_wants_k1.get(), "B 获取了 k1");
    ASSERT(a_k1.wait_for(1s) && a_k1.is_aborted(), "A 的 k1 事务被终止");
    ASSERT(b_k2.is_active(), "B 的 k2 事务不受影响");

    // A 仍在等待 k2，直到 B 释放
    ASSERT(a_wants_k2.wait_for(50ms) == std::future_status::timeout, "A 仍在等待 k2");
    b.run([&]() { return manager.end_all(); });
    ASSERT(a_wants_k2.get(), "B 释放后 A 获取 k2");
    ASSERT(a.run([&]() { return manager.end("k2"); }), "A 释放 k2");

    auto stats = manager.get_stats();
    ASSERT(stats.deadlock_aborts == 1, "恰好终止一个事务");
    ASSERT(stats.held_locks == 0, "没有剩余持有");

    TEST_PASS("后台检测通过");
}

int main() {
    std::cout << "\n╔══════════════════════════════════════╗\n";
    std::cout << "║         死锁检测测试                 ║\n";
    std::cout << "╚══════════════════════════════════════╝\n";

    datasync::test::TestRunner runner("DeadlockDetector");
    runner.run("牺牲者选择", test_age_based_selector);
    runner.run("终止最早的事务", test_terminate_oldest);
    runner.run("终止最晚的事务", test_terminate_newest);
    runner.run("只检测不处理", test_detect_only_and_no_cycle);
    runner.run("终止回调", test_termination_callback);
    runner.run("后台检测", test_end_to_end_background_resolution);
    return runner.summary();
}
