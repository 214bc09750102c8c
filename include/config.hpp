#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 请求工作目录的根目录
 * 每个请求都会在这里创建一个以随机 uuid 命名的目录，请求结束后删除。
 * 若将这个文件夹放进内存盘，可以加速用户程序的 IO 性能。
 *
 * WORKSPACE_DIR
 * ├── 0a1b2c3d-... // 某个请求的工作目录
 * │   ├── main.py // 用户代码
 * │   └── ... // 请求附带的文件和程序产生的文件
 * └── ...
 * @defaultValue 系统临时目录下的 sandbox 文件夹
 */
extern std::filesystem::path WORKSPACE_DIR;

/**
 * @brief 存放辅助脚本（比如 notebook 驱动进程）的路径
 * 必须和源代码仓库根目录下的 script 文件夹一致
 */
extern std::filesystem::path SCRIPT_DIR;

/**
 * @brief 语言编译运行命令和 notebook 内核的配置文件
 */
extern std::filesystem::path LANGUAGE_CONFIG;

/**
 * @brief 每处理这么多个请求输出一次统计，0 表示不按请求数输出
 */
extern uint64_t STATS_LOG_EVERY;

/**
 * @brief 每隔这么多秒输出一次统计，0 表示不按时间输出
 */
extern double STATS_LOG_SECONDS;

/**
 * @brief 匹配模块缺失错误的正则表达式
 */
extern std::string IMPORT_ERROR_PATTERN;

/**
 * @brief 当前服务所在的 pod 名，会原样返回给调用方便于排查问题，为空时不返回
 */
extern std::string POD_NAME;

/**
 * @brief 并发处理请求的 worker 数
 */
extern unsigned WORKER_COUNT;

}  // namespace sandbox
