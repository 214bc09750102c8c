#pragma once

#include <optional>
#include <string>
#include <utility>
#include <boost/regex.hpp>
#include "common/status.hpp"
#include "runner/types.hpp"

namespace sandbox {

/**
 * @brief 默认的模块缺失错误的匹配模式，第 2 个分组为模块名
 */
extern const char *DEFAULT_IMPORT_ERROR_PATTERN;

/**
 * @brief 匹配 stderr 中 "找不到模块/导入失败" 的错误信息
 * stderr 完全由用户程序控制，匹配不能递归，超出复杂度限制时视为不匹配。
 * "." 不匹配换行符。
 */
struct import_error_matcher {
    /**
     * @throw boost::regex_error 模式不是合法的正则表达式
     */
    explicit import_error_matcher(const std::string &pattern = DEFAULT_IMPORT_ERROR_PATTERN);

    bool matches(const std::string &stderr_data) const;

    /**
     * @brief 查找第一处匹配
     * @return {匹配到的错误行, 模块名}，模块名可能为空（比如 ImportError 的情况）
     */
    std::optional<std::pair<std::string, std::string>> search(const std::string &stderr_data) const;

private:
    boost::regex pattern;
};

/**
 * @brief 最近一次模块缺失错误的样本，用于诊断运行环境缺少哪些依赖
 */
struct import_failure {
    std::string lang;

    std::string module;

    std::string error;

    /**
     * @brief 用户代码的前 CODE_PREVIEW_LENGTH 个字符
     */
    std::string code_preview;

    static constexpr size_t CODE_PREVIEW_LENGTH = 200;
};

/**
 * @brief 根据编译和运行结果计算请求的整体状态
 * 优先级：出错（ERROR）> 超时 > 返回值非 0 > 成功。
 * @return {整体状态, 消息}，只有 SANDBOX_ERROR 时消息为出错步骤的 stderr
 */
std::pair<run_status, std::string> parse_run_status(const std::optional<command_run_result> &compile_result,
                                                     const std::optional<command_run_result> &run_result);

/**
 * @brief 将失败的请求进一步细分为失败原因，仅用于统计
 * 无法归类的失败返回 FAILED_UNKNOWN 并打印警告，说明分类需要补充。
 */
failure_reason classify_reason(run_status status,
                               const std::optional<command_run_result> &compile_result,
                               const std::optional<command_run_result> &run_result,
                               const import_error_matcher &matcher);

/**
 * @brief 从编译结果（优先）或者运行结果的 stderr 中提取模块缺失错误
 */
std::optional<import_failure> extract_import_failure(const std::string &code, language lang,
                                                     const std::optional<command_run_result> &compile_result,
                                                     const std::optional<command_run_result> &run_result,
                                                     const import_error_matcher &matcher);

}  // namespace sandbox
