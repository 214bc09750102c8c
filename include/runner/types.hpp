#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "process/executor.hpp"
#include "runner/language.hpp"

namespace sandbox {

/**
 * @brief 请求中的文件表，键为工作目录内的相对路径，值为 base64 编码的内容
 * 值为空时创建一个空文件。
 */
using file_map = std::map<std::string, std::optional<std::string>>;

/**
 * @brief 执行结束后读回的文件，键为相对路径，值为 base64 编码的内容
 */
using fetched_files = std::map<std::string, std::string>;

struct code_run_args {
    std::string code;

    language lang = language::PYTHON;

    std::chrono::duration<double> compile_timeout = std::chrono::seconds(10);

    std::chrono::duration<double> run_timeout = std::chrono::seconds(10);

    /**
     * @brief 内存上限（字节），为空表示不限制
     */
    std::optional<uint64_t> memory_limit;

    /**
     * @brief 写入运行步骤 stdin 的数据
     */
    std::optional<std::string> stdin_data;

    file_map files;

    /**
     * @brief 执行结束后需要读回的文件，保持请求中的顺序且没有重复
     */
    std::vector<std::string> fetch_files;
};

struct code_run_result {
    /**
     * @brief 编译结果，解释型语言没有编译步骤时为空
     */
    std::optional<command_run_result> compile_result;

    /**
     * @brief 运行结果，编译失败时跳过运行，此时为空
     */
    std::optional<command_run_result> run_result;

    fetched_files files;
};

struct cell_run_result {
    std::string stdout_data;

    std::string stderr_data;

    /**
     * @brief 单元格输出的富文本内容（比如图片），原样保存驱动进程给出的字符串
     */
    std::vector<std::string> display;

    /**
     * @brief 单元格的执行序号，从 1 开始
     */
    int execution_count = 0;

    /**
     * @brief 单元格是否执行成功，"ok" 或 "error"
     */
    std::string status;
};

struct run_jupyter_args {
    std::vector<std::string> cells;

    std::chrono::duration<double> cell_timeout = std::chrono::seconds(10);

    std::chrono::duration<double> total_timeout = std::chrono::seconds(45);

    std::optional<uint64_t> memory_limit;

    /**
     * @brief 内核名，用于选择驱动进程的配置
     */
    std::string kernel = "python3";

    file_map files;

    std::vector<std::string> fetch_files;
};

struct run_jupyter_result {
    /**
     * @brief 驱动进程的执行结果
     */
    command_run_result driver;

    /**
     * @brief 已经执行完成的单元格结果，驱动进程中途退出时会少于请求的单元格数
     */
    std::vector<cell_run_result> cells;

    fetched_files files;
};

}  // namespace sandbox
