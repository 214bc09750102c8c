#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "runner/language.hpp"

namespace sandbox {

/**
 * @brief 一种语言的编译运行命令模板
 * 命令模板中可以使用以下占位符：
 * {source} 源代码文件名（相对于工作目录）
 * {workdir} 工作目录的绝对路径
 * {script_dir} 辅助脚本目录的绝对路径
 */
struct language_template {
    /**
     * @brief 用户代码在工作目录中的文件名，比如 main.py、Main.java
     */
    std::string source;

    /**
     * @brief 编译命令，解释型语言为空
     */
    std::optional<std::string> compile;

    std::string run;
};

/**
 * @brief 语言及 notebook 内核的配置
 *
 * 配置文件示例：
 * {
 *     "languages": {
 *         "python": { "source": "main.py", "run": "python3 {source}" },
 *         "cpp": { "source": "main.cpp", "compile": "g++ -O2 -o main {source}", "run": "./main" }
 *     },
 *     "kernels": {
 *         "python3": "python3 -u {script_dir}/notebook_driver.py"
 *     }
 * }
 */
struct language_config {
    std::map<language, language_template> templates;

    /**
     * @brief 内核名到 notebook 驱动进程命令模板的映射
     */
    std::map<std::string, std::string> kernels;

    /**
     * @throw sandbox_exception 配置中出现无法识别的语言
     * @throw nlohmann::json::exception 配置格式错误
     */
    static language_config parse(const nlohmann::json &j);

    /**
     * @throw std::system_error 文件无法读取
     */
    static language_config load(const std::filesystem::path &path);
};

void from_json(const nlohmann::json &j, language_template &value);

/**
 * @brief 展开命令模板中的占位符
 * @throw fmt::format_error 模板中有无法识别的占位符
 */
std::string expand_command(const std::string &command_template, const std::string &source,
                           const std::filesystem::path &workdir, const std::filesystem::path &script_dir);

}  // namespace sandbox
