// File: src/utils/PeriodicTask.hpp
// 周期性后台任务
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace datasync {
namespace utils {

/**
 * PeriodicTask - 周期性后台任务
 *
 * 独占一个后台线程，每隔 interval 执行一次 body。
 * stop() 立即唤醒等待中的线程并 join；正在执行的 body 会先跑完。
 * body 抛出的 std::exception 记录为 ERROR 日志，任务继续运行。
 */
class PeriodicTask {
public:
    using Body = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * start - 启动后台线程（重复调用无效）
     * @return 本次调用是否真正启动了线程
     */
    bool start();

    /**
     * stop - 停止并等待后台线程退出（可重复调用）
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * run_once - 在调用线程上同步执行一次 body
     */
    void run_once();

    /**
     * get_run_count - body 已执行次数（含 run_once）
     */
    uint64_t get_run_count() const { return run_count_.load(); }

    const std::string& name() const { return name_; }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void loop();
    void execute();

    const std::string name_;
    const std::chrono::milliseconds interval_;
    Body body_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> run_count_{0};
    std::thread thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    // 保护 thread_ 的启停
    std::mutex lifecycle_mutex_;
};

} // namespace utils
} // namespace datasync
