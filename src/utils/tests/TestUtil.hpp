// File: src/utils/tests/TestUtil.hpp
// 测试辅助宏与工具
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

// 测试辅助宏
#define TEST_CASE(name) \
    do { \
        std::cout << "\n========== " << name << " ==========" << std::endl; \
    } while(0)

// 失败时抛出，由 TestRunner 记录
#define ASSERT(condition, msg) \
    do { \
        if (!(condition)) { \
            std::ostringstream assert_oss_; \
            assert_oss_ << "断言失败: " << msg << " (文件: " << __FILE__ << ", 行: " << __LINE__ << ")"; \
            throw std::runtime_error(assert_oss_.str()); \
        } \
    } while(0)

#define TEST_PASS(msg) \
    do { \
        std::cout << "✓ " << msg << std::endl; \
    } while(0)

namespace datasync {
namespace test {

/**
 * TestRunner - 运行测试函数并汇总
 */
class TestRunner {
public:
    explicit TestRunner(std::string suite) : suite_(std::move(suite)) {}

    void run(const std::string& name, const std::function<void()>& test) {
        try {
            test();
            passed_++;
            std::cout << "\n✓ 测试通过: " << name << "\n";
        } catch (const std::exception& e) {
            failed_++;
            std::cerr << "\n✗ 测试失败: " << name << " - " << e.what() << "\n";
        }
    }

    // 输出总结，返回进程退出码
    int summary() const {
        std::cout << "\n========== " << suite_ << " 测试总结 ==========\n";
        std::cout << "  通过: " << passed_ << " 个测试\n";
        std::cout << "  失败: " << failed_ << " 个测试\n";
        std::cout << "  总计: " << (passed_ + failed_) << " 个测试\n";
        return failed_ == 0 ? 0 : 1;
    }

private:
    std::string suite_;
    int passed_ = 0;
    int failed_ = 0;
};

/**
 * ContextThread - 在一个固定线程上依次执行提交的任务
 *
 * 锁归执行上下文所有，一个测试角色的多个步骤必须在同一线程上执行
 */
class ContextThread {
public:
    ContextThread() : thread_([this]() { loop(); }) {}

    ~ContextThread() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    ContextThread(const ContextThread&) = delete;
    ContextThread& operator=(const ContextThread&) = delete;

    // 异步提交，返回结果的 future（异常经 future 传回）
    template<typename F>
    auto async(F&& f) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.push_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    // 同步执行
    template<typename F>
    auto run(F&& f) -> std::invoke_result_t<F> {
        return async(std::forward<F>(f)).get();
    }

private:
    void loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace test
} // namespace datasync
