#pragma once

#include <nlohmann/json.hpp>
#include "runner/types.hpp"

/**
 * 请求和响应的 JSON 格式
 *
 * run_code 请求示例：
 * {
 *     "code": "print(input())",
 *     "language": "python",
 *     "compile_timeout": 10,
 *     "run_timeout": 10,
 *     "memory_limit_MB": -1, // -1 表示不限制
 *     "stdin": "hello",
 *     "files": { "data/a.txt": "aGVsbG8=" },
 *     "fetch_files": ["out.txt"]
 * }
 *
 * command_run_result 示例：
 * {
 *     "status": "Finished", // 或者 TimeLimitExceeded、Error
 *     "execution_time": 0.023,
 *     "return_code": 0,
 *     "stdout": "hello\n",
 *     "stderr": ""
 * }
 */
namespace sandbox {

void to_json(nlohmann::json &j, const command_run_result &value);

void to_json(nlohmann::json &j, const cell_run_result &value);

/**
 * @throw std::invalid_argument 语言无法识别
 * @throw nlohmann::json::exception 缺少字段或者字段类型错误
 */
void from_json(const nlohmann::json &j, code_run_args &value);

void from_json(const nlohmann::json &j, run_jupyter_args &value);

}  // namespace sandbox
