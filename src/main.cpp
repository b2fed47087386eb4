// File: src/main.cpp

#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "collection/SyncList.hpp"
#include "transaction/src/LockManager.hpp"
#include "utils/ConfigManager.hpp"
#include "utils/LoggingSystem/ConsoleSink.hpp"
#include "utils/LoggingSystem/LogMacros.hpp"

using namespace datasync;
using namespace std::chrono_literals;

namespace {

// 两个线程争用同一个键：第二个在第一个释放后获得
void run_contention_demo(transaction::LockManager<std::string>& locks) {
    std::cout << "\n--- Contention ---" << std::endl;

    if (!locks.try_start("account:42", 0ms)) {
        std::cerr << "failed to lock account:42" << std::endl;
        return;
    }
    std::cout << "main thread holds account:42" << std::endl;

    auto worker = std::async(std::launch::async, [&locks]() {
        const auto begin = std::chrono::steady_clock::now();
        const bool acquired = locks.try_start("account:42", 2000ms);
        const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - begin);
        std::cout << "worker " << (acquired ? "acquired" : "timed out on")
                  << " account:42 after " << waited.count() << " ms" << std::endl;
        if (acquired) {
            locks.end("account:42");
        }
        return acquired;
    });

    std::this_thread::sleep_for(200ms);
    locks.end("account:42");
    std::cout << "main thread released account:42" << std::endl;
    worker.get();
}

// 两个线程交叉加锁形成死锁，由后台检测打破
void run_deadlock_demo(transaction::LockManager<std::string>& locks) {
    std::cout << "\n--- Deadlock resolution ---" << std::endl;

    std::promise<void> a_ready;
    std::promise<void> b_ready;
    auto a_ready_future = a_ready.get_future().share();
    auto b_ready_future = b_ready.get_future().share();

    auto actor = [&locks](const std::string& first, const std::string& second,
                          std::promise<void>& ready, std::shared_future<void> other_ready) {
        transaction::TransactionHandle held = locks.start(first, 0ms);
        ready.set_value();
        if (!held) {
            return;
        }
        other_ready.wait();

        const bool acquired = locks.try_start(second, 5000ms);
        std::cout << "context holding " << first << ": "
                  << (held.is_aborted() ? "was chosen as victim" : "kept its lock")
                  << ", " << (acquired ? "acquired " : "gave up on ") << second << std::endl;
        locks.end_all();
    };

    std::thread a(actor, "ledger:1", "ledger:2", std::ref(a_ready), b_ready_future);
    std::this_thread::sleep_for(20ms);
    std::thread b(actor, "ledger:2", "ledger:1", std::ref(b_ready), a_ready_future);
    a.join();
    b.join();
}

// 同步列表：第二个上下文访问被占用的下标时失败
void run_sync_list_demo(const transaction::LockManagerConfig& base) {
    std::cout << "\n--- SyncList ---" << std::endl;

    transaction::LockManagerConfig config = base;
    config.acquisition_timeout = 100ms;
    collection::SyncList<std::string> list(config);
    list.add("alpha");
    list.add("beta");

    collection::SyncList<std::string>::Scope scope(list);
    list.set(0, "ALPHA");

    auto other = std::async(std::launch::async, [&list]() {
        try {
            list.get(0);
            return std::string("unexpectedly read index 0");
        } catch (const collection::LockAcquisitionError& e) {
            return std::string("other context: ") + e.what();
        }
    });
    std::cout << other.get() << std::endl;
    std::cout << "held indices: " << list.get_acquired_locks().size() << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "=== DataSync Lock Manager Demo ===" << std::endl;
    try {
        std::cout << "1. Setting up logging..." << std::endl;
        auto console = std::make_shared<LoggingSystem::ConsoleSink>();
        console->setErrorToStdErr(true);
        LOGGER->addSink(console);
        LOGGER->setMinimumLogLevel(LoggingSystem::LogLevel::INFO);

        std::cout << "2. Loading configuration..." << std::endl;
        // 默认值 <- datasync.conf <- DATASYNC_* 环境变量 <- --key=value
        auto settings = utils::ConfigManager::create()
            .set_default("lock.deadlock.interval.ms", utils::ConfigValue(int64_t(200)))
            .add_file("datasync.conf")
            .add_env_vars("DATASYNC_")
            .add_command_line(argc, argv)
            .build();
        if (!settings->load()) {
            std::cerr << "   some configuration sources failed to load, using defaults" << std::endl;
        }
        auto config = transaction::LockManagerConfig::from_config(*settings);
        std::cout << "   " << config.to_string() << std::endl;

        std::cout << "3. Creating lock manager..." << std::endl;
        transaction::LockManager<std::string> locks(
            config,
            [](const std::string& key, transaction::TransactionOutcome outcome) {
                LOG_WARN("DEMO", "Lock on " + key + " force-ended: " + transaction::ToString(outcome));
            });

        run_contention_demo(locks);
        run_deadlock_demo(locks);
        run_sync_list_demo(config);

        std::cout << "\n4. " << locks.get_stats().to_string() << std::endl;
        locks.dispose();
        LOGGER->flush();
    } catch (const std::exception& e) {
        std::cerr << "Exception in main: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
