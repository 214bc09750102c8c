#pragma once

namespace sandbox {

/**
 * @brief 单条命令（编译或运行）的执行结果
 */
enum class command_run_status {
    /**
     * @brief 命令在时间限制内结束，返回码有效
     * 返回码可能非零，由调用方判断程序是否运行成功。
     */
    FINISHED = 0,

    /**
     * @brief 命令运行时间超出限制，进程树已被杀死
     * 此时没有返回码，stdout/stderr 为超时前已经读到的部分输出。
     */
    TIME_LIMIT_EXCEEDED = 1,

    /**
     * @brief 沙盒无法启动或管理该命令
     * 比如 fork 失败、工作目录不存在、管道出错，错误信息保存在 stderr 中。
     */
    ERROR = 2
};

/**
 * @brief 整个请求的聚合状态，返回给调用方
 */
enum class run_status {
    /**
     * @brief 所有命令都正常结束且返回码为 0
     */
    SUCCESS = 0,

    /**
     * @brief 用户代码运行失败：超时或者返回码非零
     */
    FAILED = 1,

    /**
     * @brief 沙盒自身出错，与用户代码无关
     */
    SANDBOX_ERROR = 2
};

/**
 * @brief 失败原因，仅用于统计，不属于返回给调用方的结果
 */
enum class failure_reason {
    SUCCESS,
    SANDBOX_ERROR,
    COMPILE_TIMEOUT,
    IMPORT_ERROR,
    COMPILE_ERROR,
    COMPILE_NON_ZERO_EXIT,
    RUN_TIMEOUT,
    RUN_RUNTIME_ERROR,
    RUN_NON_ZERO_EXIT,

    /**
     * @brief 以上规则都没有匹配
     * 说明分类规则不完整，出现时需要检查并补充规则。
     */
    FAILED_UNKNOWN
};

const char *get_display_message(command_run_status);

const char *get_display_message(run_status);

const char *get_display_message(failure_reason);

}  // namespace sandbox
