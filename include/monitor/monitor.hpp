#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace sandbox {

/**
 * @brief 执行监控行为
 * 统计信息和请求异常最终交给 monitor 输出，默认实现什么都不做。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报当前的请求统计
     * @param summary 统计摘要，格式见 run_statistics::summary
     */
    virtual void report_statistics(const nlohmann::json &summary);

    /**
     * @brief 监控上报请求处理过程中出现的沙盒内部错误
     * @param endpoint 请求的类型，比如 run_code
     * @param request_id 请求 id
     * @param message 错误原因，用于日志记录
     */
    virtual void report_exception(const std::string &endpoint, const std::string &request_id, const std::string &message);
};

/**
 * @brief 通过 glog 输出监控信息，统计摘要以 WARNING 级别输出，便于在线上日志中检索
 */
struct glog_monitor : public monitor {
    void report_statistics(const nlohmann::json &summary) override;

    void report_exception(const std::string &endpoint, const std::string &request_id, const std::string &message) override;
};

}  // namespace sandbox
