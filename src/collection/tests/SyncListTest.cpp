// File: src/collection/tests/SyncListTest.cpp
// 同步列表测试

#include "../SyncList.hpp"
#include "../../utils/tests/TestUtil.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace datasync;
using namespace datasync::collection;
using datasync::test::ContextThread;
using datasync::transaction::LockManagerConfig;

namespace {

LockManagerConfig list_config() {
    LockManagerConfig config;
    config.acquisition_timeout = std::chrono::milliseconds(50);
    config.enable_eviction = false;
    config.enable_deadlock_detection = false;
    return config;
}

} // namespace

void test_basic_operations() {
    TEST_CASE("基本操作");

    SyncList<std::string> list(list_config());
    ASSERT(list.empty(), "初始为空");

    list.add("a");
    list.add("b");
    list.add("c");
    ASSERT(list.size() == 3, "添加 3 个元素");
    ASSERT(list.get(1) == "b", "按下标读取");

    list.set(1, "B");
    ASSERT(list.get(1) == "B", "按下标写入");

    ASSERT(list.contains("c"), "包含 c");
    ASSERT(list.index_of("c") == 2, "c 在下标 2");
    ASSERT(list.index_of("z") == SyncList<std::string>::npos, "不存在返回 npos");

    ASSERT(list.get_acquired_locks() == (std::vector<size_t>{1}), "只为访问过的下标加锁");
    ASSERT(list.release() == 1, "释放一个下标锁");
    ASSERT(list.get_acquired_locks().empty(), "释放后没有下标锁");
    ASSERT(list.release() == 0, "重复释放为空操作");

    list.clear();
    ASSERT(list.empty(), "清空元素");

    TEST_PASS("基本操作通过");
}

void test_insert_and_remove() {
    TEST_CASE("插入与删除");

    SyncList<int> list(list_config());
    list.add(10);
    list.add(30);

    list.insert(1, 20);
    list.insert(3, 40);    // 等于 size 时追加
    ASSERT(list.to_vector() == (std::vector<int>{10, 20, 30, 40}), "插入位置正确");

    ASSERT(list.remove(30), "按值删除");
    ASSERT(!list.remove(99), "不存在的值返回 false");
    list.remove_at(0);
    ASSERT(list.to_vector() == (std::vector<int>{20, 40}), "删除后内容正确");

    bool thrown = false;
    try {
        list.get(5);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    ASSERT(thrown, "越界读取抛出 out_of_range");

    thrown = false;
    try {
        list.insert(7, 1);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    ASSERT(thrown, "越界插入抛出 out_of_range");

    list.release();
    TEST_PASS("插入与删除通过");
}

void test_contention_between_contexts() {
    TEST_CASE("上下文之间的下标争用");

    SyncList<int> list(list_config());
    list.add(1);
    list.add(2);

    ContextThread a;
    ContextThread b;

    ASSERT(a.run([&]() { return list.get(0); }) == 1, "A 读取下标 0");

    bool blocked = b.run([&]() {
        try {
            list.get(0);
            return false;
        } catch (const LockAcquisitionError& e) {
            return e.index() == 0;
        }
    });
    ASSERT(blocked, "A 持有下标 0 时 B 获取失败");
    ASSERT(b.run([&]() { return list.get(1); }) == 2, "不同下标互不影响");

    ASSERT(list.get_acquired_locks() == (std::vector<size_t>{0, 1}), "汇总所有上下文的下标");
    ASSERT(a.run([&]() { return list.get_acquired_locks_of_current_context(); }) ==
               (std::vector<size_t>{0}),
           "A 只持有下标 0");

    ASSERT(a.run([&]() { return list.release(); }) == 1, "A 释放");
    ASSERT(b.run([&]() { return list.get(0); }) == 1, "A 释放后 B 可以读取下标 0");

    b.run([&]() { return list.release(); });
    ASSERT(list.get_acquired_locks().empty(), "全部释放");

    TEST_PASS("下标争用通过");
}

void test_same_context_reuse() {
    TEST_CASE("同一上下文重复访问");

    SyncList<int> list(list_config());
    list.add(5);

    for (int i = 0; i < 10; ++i) {
        list.set(0, i);
        ASSERT(list.get(0) == i, "重复访问不阻塞自己");
    }
    ASSERT(list.lock_manager().get_stats().acquisitions == 1, "只获取一次锁");

    list.release();
    TEST_PASS("重复访问通过");
}

void test_scope_and_shared_manager() {
    TEST_CASE("作用域与共享锁管理器");

    auto manager = std::make_shared<SyncList<int>::LockManagerType>(list_config());
    SyncList<int> first(manager);
    SyncList<int> second(manager);
    first.add(1);
    second.add(2);

    ContextThread other;
    {
        SyncList<int>::Scope scope(first);
        first.get(0);
        ASSERT(manager->is_locked(0), "共享管理器上下标 0 已加锁");

        // 同一个管理器上两个列表的下标 0 是同一把锁
        bool blocked = other.run([&]() {
            try {
                second.get(0);
                return false;
            } catch (const LockAcquisitionError&) {
                return true;
            }
        });
        ASSERT(blocked, "共享管理器时下标锁互斥");
    }
    ASSERT(!manager->is_locked(0), "作用域结束后释放");
    ASSERT(other.run([&]() { return second.get(0); }) == 2, "释放后其它上下文可以访问");
    other.run([&]() { return second.release(); });

    bool thrown = false;
    try {
        SyncList<int> invalid(std::shared_ptr<SyncList<int>::LockManagerType>{});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    ASSERT(thrown, "空管理器抛出 invalid_argument");

    TEST_PASS("作用域与共享锁管理器通过");
}

void test_destructor_releases_locks() {
    TEST_CASE("析构释放下标锁");

    auto manager = std::make_shared<SyncList<int>::LockManagerType>(list_config());

    ContextThread owner;
    owner.run([&]() {
        SyncList<int> list(manager);
        list.add(1);
        list.add(2);
        list.set(0, 10);
        list.get(1);
        return manager->is_locked(0) && manager->is_locked(1);
    });
    ASSERT(!manager->is_locked(0), "列表析构后下标 0 已释放");
    ASSERT(!manager->is_locked(1), "列表析构后下标 1 已释放");

    ContextThread other;
    ASSERT(other.run([&]() {
        bool acquired = manager->try_start(0);
        manager->end_all();
        return acquired;
    }), "其它上下文可以获取下标 0");
    ASSERT(manager->get_stats().releases == 3, "两次析构释放加一次手动释放");

    TEST_PASS("析构释放下标锁通过");
}

void test_remove_after_shift() {
    TEST_CASE("等锁期间元素移动后的按值删除");

    LockManagerConfig config = list_config();
    config.acquisition_timeout = std::chrono::milliseconds(3000);
    SyncList<int> list(config);
    list.add(10);
    list.add(30);

    ContextThread a;
    ContextThread b;
    a.run([&]() { return list.get(1); });

    // B 找到 30 在下标 1，等待 A 释放
    auto removed = b.async([&]() { return list.remove(30); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // A 在前面插入，30 移到下标 2
    a.run([&]() {
        list.insert(0, 5);
        return list.release();
    });

    ASSERT(removed.get(), "删除成功");
    ASSERT(list.to_vector() == (std::vector<int>{5, 10}), "删除的是 30");
    auto held = b.run([&]() { return list.get_acquired_locks_of_current_context(); });
    ASSERT(std::find(held.begin(), held.end(), size_t(2)) != held.end(),
           "删除前已为元素所在的下标 2 加锁");

    b.run([&]() { return list.release(); });
    TEST_PASS("元素移动后删除通过");
}

int main() {
    std::cout << "\n╔══════════════════════════════════════╗\n";
    std::cout << "║         同步列表测试                 ║\n";
    std::cout << "╚══════════════════════════════════════╝\n";

    datasync::test::TestRunner runner("SyncList");
    runner.run("基本操作", test_basic_operations);
    runner.run("插入与删除", test_insert_and_remove);
    runner.run("下标争用", test_contention_between_contexts);
    runner.run("同一上下文重复访问", test_same_context_reuse);
    runner.run("作用域与共享锁管理器", test_scope_and_shared_manager);
    runner.run("析构释放下标锁", test_destructor_releases_locks);
    runner.run("元素移动后删除", test_remove_after_shift);
    return runner.summary();
}
