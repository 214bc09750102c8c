#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "process/reaper.hpp"

namespace sandbox {

/**
 * @brief 一条命令的执行结果，创建后不再修改
 */
struct command_run_result {
    command_run_status status = command_run_status::ERROR;

    /**
     * @brief 进程的返回码，超时或者无法启动时为空
     * 被信号杀死时为 128 + 信号值。
     */
    std::optional<int> return_code;

    std::string stdout_data;

    std::string stderr_data;

    /**
     * @brief 墙上时间（秒）
     */
    double execution_time = 0;
};

}  // namespace sandbox

namespace sandbox::process {

/**
 * @brief 进程超时或出错被杀死之后，等待它被回收的最长时间
 */
extern const std::chrono::milliseconds KILL_GRACE;

struct command_options {
    /**
     * @brief shell 命令，通过 /bin/bash -c 执行
     */
    std::string command;

    std::filesystem::path workdir;

    /**
     * @brief 写入进程 stdin 的数据，为空时 stdin 为 /dev/null
     */
    std::optional<std::string> stdin_data;

    std::chrono::duration<double> timeout = std::chrono::seconds(10);

    /**
     * @brief 内存上限（字节），为空表示不限制
     */
    std::optional<uint64_t> memory_limit;

    std::map<std::string, std::string> env;
};

/**
 * @brief 运行一条命令直到结束或超时
 *
 * 1. 启动子进程，stdout/stderr 通过管道读取，需要时创建 stdin 管道；
 * 2. 写入 stdin 之前检查输入流是否已经关闭（子进程可能立刻退出），若已关闭则跳过写入，
 *    写完或跳过之后关闭输入流；
 * 3. 在同一个 poll 循环里同时读取 stdout、stderr，写入 stdin，等待子进程退出和超时，
 *    避免任何一个管道写满导致死锁；
 * 4. 超时则杀死整棵进程树，返回 TIME_LIMIT_EXCEEDED 和已经读到的输出；
 * 5. 无法启动或者内部出错返回 ERROR，错误信息保存在 stderr；
 * 6. 无论以哪种方式结束，都会杀死进程树，根进程退出并不代表它的子进程都已退出。
 *
 * 该函数不会抛出异常。
 */
command_run_result run_command(const command_options &options, process_tree_reaper &reaper = default_reaper());

}  // namespace sandbox::process
