#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "monitor/monitor.hpp"
#include "monitor/statistics.hpp"
#include "runner/classifier.hpp"
#include "runner/language_config.hpp"
#include "runner/recipe.hpp"

namespace sandbox {

/**
 * @brief 请求的处理入口
 * 将 JSON 请求转换为执行参数，执行后计算整体状态和失败原因，记录统计。
 * 用户代码失败（Failed）和沙盒自身出错（SandboxError）总是可以区分的：
 * 执行过程中的任何异常都会被捕获并转换为 SandboxError，不会影响其他请求。
 */
struct sandbox_service {
    /**
     * @param config 语言和内核配置
     * @param env 运行环境
     * @param matcher 模块缺失错误的匹配模式
     * @param stats 统计计数
     * @param mon 异常上报
     * @param pod_name 写入响应的 executor_pod_name，为空时写入 null
     */
    sandbox_service(const language_config &config, recipe_environment env, import_error_matcher matcher,
                    run_statistics &stats, monitor &mon, std::optional<std::string> pod_name);

    /**
     * @brief 编译运行一段代码
     * @return RunCodeResponse 格式的响应
     * @throw std::invalid_argument 请求中的语言无法识别或者没有配置
     * @throw nlohmann::json::exception 请求格式错误
     */
    nlohmann::json run_code(const nlohmann::json &request, const std::string &request_id);

    /**
     * @brief 在 notebook 中依次执行多个单元格
     * @return RunJupyterResponse 格式的响应
     * @throw std::invalid_argument 请求中的内核没有配置
     * @throw nlohmann::json::exception 请求格式错误
     */
    nlohmann::json run_jupyter(const nlohmann::json &request, const std::string &request_id);

    /**
     * @brief 根据 endpoint 字段分发请求
     * 请求格式错误时不会执行，也不会计入统计，返回 {"error": 原因}。
     * 响应中总会带上 request_id（请求中没有时随机生成）和 endpoint。
     */
    nlohmann::json handle(const nlohmann::json &request);

    const recipe_registry &registry() const;

private:
    recipe_registry recipes;
    std::map<std::string, std::string> kernels;
    recipe_environment env;
    import_error_matcher matcher;
    run_statistics &stats;
    monitor &mon;
    std::optional<std::string> pod_name;
};

}  // namespace sandbox
