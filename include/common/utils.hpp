#pragma once

#include <fmt/format.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <string>

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return fmt::formatter<std::string>::format(p.string(), ctx);
    }
};

namespace sandbox {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 读取环境变量并转换为指定类型
 * @throw boost::bad_lexical_cast 环境变量存在但无法转换
 */
template <typename T>
T get_env_as(const std::string &key, const T &def_value) {
    const char *value = getenv(key.c_str());
    if (!value || !*value) return def_value;
    return boost::lexical_cast<T>(value);
}

/**
 * @brief 生成一个随机的 uuid 字符串，用作工作目录名、请求 id 等
 */
std::string random_uuid();

/**
 * @brief 计时器，基于单调时钟，不受系统时间调整影响
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的秒数
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace sandbox
