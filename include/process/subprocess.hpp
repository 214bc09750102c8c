#pragma once

#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "process/pipe.hpp"
#include "process/reaper.hpp"

namespace sandbox::process {

using clock_type = std::chrono::steady_clock;

/**
 * @brief 超时时间的上限，更长的超时按该值处理
 */
extern const std::chrono::hours MAX_TIMEOUT;

/**
 * @brief 计算从现在开始经过 timeout 之后的截止时间
 * timeout 被限制在 [0, MAX_TIMEOUT] 之内，NaN 视为 0，避免换算成时钟刻度时溢出。
 */
clock_type::time_point deadline_after(std::chrono::duration<double> timeout);

struct spawn_options {
    /**
     * @brief 要执行的 shell 命令，通过 /bin/bash -c 执行
     */
    std::string command;

    /**
     * @brief 子进程的工作目录
     */
    std::filesystem::path workdir;

    /**
     * @brief 是否为子进程创建 stdin 管道，否则 stdin 重定向到 /dev/null
     */
    bool pipe_stdin = false;

    /**
     * @brief 内存上限（字节），为空表示不限制
     * 通过 RLIMIT_AS 和 RLIMIT_DATA 在 exec 之前设置，超出时程序通常会因为
     * 内存分配失败而异常退出，不会单独报告为内存超限。
     */
    std::optional<uint64_t> memory_limit;

    /**
     * @brief 额外的环境变量，会覆盖继承自沙盒进程的同名变量
     */
    std::map<std::string, std::string> env;
};

/**
 * @brief 一个正在运行的子进程及其标准输入输出管道
 *
 * 子进程通过 setsid 成为新会话的首进程，它派生出的进程都属于该会话，
 * 以便 process_tree_reaper 找到整棵进程树。
 * 检测子进程退出时使用 WNOWAIT 保留僵尸进程，在进程树被杀死之后才真正回收，
 * 保证杀进程树时根进程的 pid 不会被系统复用。
 * 析构时如果子进程还没有被回收，将杀死进程树并阻塞回收。
 */
struct subprocess {
    /**
     * @brief 启动子进程
     * @throw std::system_error 无法创建管道、fork 失败，或者子进程在 exec 之前出错
     */
    explicit subprocess(const spawn_options &options, process_tree_reaper &reaper = default_reaper());
    subprocess(const subprocess &) = delete;
    ~subprocess();

    subprocess &operator=(const subprocess &) = delete;

    pid_t pid() const;

    /**
     * @brief 子进程的 stdin，若没有 stdin 管道返回 nullptr
     */
    writable_stream *input();

    /**
     * @brief 等待并处理一轮 IO 事件
     * 读取 stdout/stderr 中已经到达的数据，在 stdin 可写时让 feeder 写入，检查子进程是否退出。
     * @param deadline 最多等待到这个时间点
     * @param feeder 正在写入 stdin 的 feeder，可以为空
     * @return false 若已经到达 deadline
     * @throw std::system_error poll 或读取管道失败
     */
    bool pump(clock_type::time_point deadline, stdin_feeder *feeder = nullptr);

    /**
     * @brief 非阻塞地读取管道中所有剩余的数据
     */
    void drain();

    /**
     * @brief 子进程是否已经退出（可能尚未被回收）
     */
    bool exited();

    /**
     * @brief stdout 和 stderr 是否都已经读到 EOF
     */
    bool outputs_closed() const;

    std::string &stdout_data();

    std::string &stderr_data();

    /**
     * @brief 杀死子进程及其所有后代
     * 已经回收的子进程不会再发送信号，避免误杀复用了该 pid 的进程。
     */
    void terminate();

    /**
     * @brief 等待子进程退出并回收
     * @return false 若到达 deadline 时子进程仍未退出
     */
    bool reap(clock_type::time_point deadline);

    bool reaped() const;

    /**
     * @brief 子进程的返回码，被信号杀死时为 128 + 信号值
     * 子进程未回收时为空。
     */
    std::optional<int> return_code() const;

private:
    void spawn(const spawn_options &options);

    bool check_exited();

    void wait_exit_event(clock_type::time_point deadline);

    void read_available(file_descriptor &fd, std::string &buffer);

    process_tree_reaper &reaper;
    pid_t child_pid = -1;
    file_descriptor pidfd;
    std::unique_ptr<pipe_writer> stdin_pipe;
    file_descriptor stdout_pipe, stderr_pipe;
    std::string stdout_buffer, stderr_buffer;
    bool has_exited = false;
    bool has_reaped = false;
    std::optional<int> exitcode;
};

/**
 * @brief 将 SIGPIPE 设置为忽略
 * 子进程提前关闭 stdin 后继续写入会触发 SIGPIPE，默认行为会直接终止整个服务。
 * 只需要调用一次，子进程在 exec 之前会恢复默认行为。
 */
void ignore_sigpipe();

}  // namespace sandbox::process
