#pragma once

#include <cstddef>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "common/concurrent_queue.hpp"
#include "server/service.hpp"

/**
 * 请求处理相关函数
 * 主线程从输入流中逐行读取请求（每行一个 JSON 对象），放入请求队列；
 * 每个 worker 从请求队列中取出请求交给 sandbox_service 处理，
 * 处理完成后将响应作为一行 JSON 写入输出流。
 * 请求之间互不影响，响应的顺序和请求的顺序不一定一致，调用方通过 request_id 对应。
 */
namespace sandbox {

/**
 * @brief 请求队列中的元素
 */
struct request_task {
    /**
     * @brief 请求在输入流中的行号，从 1 开始，用于日志
     */
    size_t line_number = 0;

    std::string line;
};

/**
 * @brief 多个 worker 共享的输出流，每次写入一整行
 */
struct response_writer {
    explicit response_writer(std::ostream &os);

    void write(const nlohmann::json &response);

private:
    std::mutex mut;
    std::ostream &os;
};

/**
 * @brief 停止接收新请求
 * 调用该函数后，read_requests 不再读取新请求，关闭请求队列。
 * worker 处理完队列中剩余的请求后退出。
 * 可以在信号处理函数中调用。
 */
void stop_workers();

bool workers_stopped();

/**
 * @brief 从输入流中读取请求直到输入结束或者 stop_workers 被调用，然后关闭请求队列
 * 空行会被忽略。
 * @return 读取的请求数
 */
size_t read_requests(std::istream &is, concurrent_queue<request_task> &task_queue);

/**
 * @brief 处理一行请求，JSON 格式错误时返回 {"error": 原因}
 */
nlohmann::json process_request(sandbox_service &service, const request_task &task);

/**
 * @brief 启动 worker 线程
 * @param worker_id worker 编号，用于日志
 * @param service 处理请求的服务，可以被多个 worker 并发调用
 * @param task_queue 请求队列
 * @param writer 响应输出
 * @return 产生的线程
 */
std::thread start_worker(size_t worker_id, sandbox_service &service, concurrent_queue<request_task> &task_queue, response_writer &writer);

}  // namespace sandbox
