#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <nlohmann/json.hpp>
#include "common/status.hpp"
#include "monitor/monitor.hpp"
#include "runner/classifier.hpp"

namespace sandbox {

void to_json(nlohmann::json &j, const import_failure &value);

/**
 * @brief 进程内所有请求共享的统计计数
 * 所有计数和最近一次模块缺失错误样本都由同一个互斥锁保护，
 * 输出统计时只在锁内生成摘要，在锁外交给 monitor 输出。
 */
struct run_statistics {
    /**
     * @param sink 统计摘要的输出目标
     * @param log_every_requests 每处理这么多个请求输出一次统计，0 表示不按请求数输出
     * @param log_every_seconds 距离上次输出超过这么久之后输出统计，0 表示不按时间输出
     */
    run_statistics(monitor &sink, uint64_t log_every_requests, std::chrono::duration<double> log_every_seconds);

    /**
     * @brief 记录一个请求的结果，满足输出条件时输出统计
     */
    void record(run_status status, failure_reason reason);

    /**
     * @brief 更新最近一次模块缺失错误样本
     */
    void update_import_failure(import_failure sample);

    /**
     * @brief 距离上次输出超过 log_every_seconds 时输出统计
     * 按请求数的输出在 record 中判断。
     * 还没有处理过任何请求时不会输出。monitor 抛出的异常只记录日志。
     * @param force 为 true 时忽略输出条件
     * @return 是否输出了统计
     */
    bool flush(bool force = false);

    /**
     * @brief 生成统计摘要
     * {
     *     "total_requests": 10,
     *     "success_count": 8,
     *     "failed_count": 1,
     *     "sandbox_error_count": 1,
     *     "success_rate": 0.8,
     *     "failure_breakdown": { "run_timeout": { "count": 1, "ratio": 0.1 }, ... },
     *     "import_error_example": null
     * }
     */
    nlohmann::json summary() const;

    std::chrono::duration<double> log_interval() const;

private:
    nlohmann::json summary_nolock() const;

    /**
     * @brief 满足输出条件时生成摘要并更新上次输出时间，调用方需持有锁
     */
    std::optional<nlohmann::json> take_summary_nolock(bool force);

    void emit(const nlohmann::json &summary);

    mutable std::mutex mut;
    monitor &sink;
    const uint64_t log_every_requests;
    const std::chrono::duration<double> log_every_seconds;

    uint64_t total = 0;
    std::map<run_status, uint64_t> status_count;
    std::map<failure_reason, uint64_t> reason_count;
    std::optional<import_failure> last_import_failure;
    std::optional<std::chrono::steady_clock::time_point> last_flush;
};

/**
 * @brief 定时输出统计的后台线程
 * 每隔 max(log_interval, 1s) 强制输出一次统计，与请求是否到达无关。
 * stop 会等待正在进行的输出完成，返回之后不会再输出统计。
 */
struct statistics_reporter {
    explicit statistics_reporter(run_statistics &stats);
    statistics_reporter(const statistics_reporter &) = delete;
    ~statistics_reporter();

    statistics_reporter &operator=(const statistics_reporter &) = delete;

    /**
     * @brief 启动后台线程，log_interval 为 0 时不启动
     * @return 是否启动了后台线程
     */
    bool start();

    void stop();

    bool running() const;

private:
    void loop();

    run_statistics &stats;
    std::thread worker;
    std::mutex mut;
    std::condition_variable cv;
    bool stopping = false;
};

}  // namespace sandbox
