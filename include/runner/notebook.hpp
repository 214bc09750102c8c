#pragma once

#include <optional>
#include <string>
#include <vector>
#include "runner/recipe.hpp"
#include "runner/types.hpp"

namespace sandbox {

/**
 * @brief 驱动进程通过该环境变量得到本次会话的标记
 */
extern const char *CELL_MARKER_ENV;

struct notebook_config {
    /**
     * @brief 驱动进程的命令模板，可以使用 {workdir} 和 {script_dir}
     */
    std::string command;

    recipe_environment env;
};

/**
 * @brief 解析驱动进程某个输出流中属于当前单元格的部分
 *
 * 驱动进程和沙盒之间按行通信，marker 是每次会话随机生成的标记：
 * 沙盒写入单元格代码，然后写入一行 "<marker> end"；
 * 驱动进程执行完成后在 stdout 输出 "<marker> done <返回值>"，在 stderr 输出 "<marker> done"；
 * 单元格的富文本输出在 stdout 中以 "<marker> display <内容>" 的形式给出。
 * 标记不要求位于行首，用户输出没有以换行结束时标记紧跟在输出之后。
 */
struct cell_stream_parser {
    explicit cell_stream_parser(std::string marker);

    /**
     * @brief 从上次的位置继续解析
     * @param data 输出流目前为止收到的全部数据
     * @return true 若读到了当前单元格的结束标记
     */
    bool feed(const std::string &data);

    /**
     * @brief 开始解析下一个单元格，清空已经收集的输出
     */
    void next_cell();

    std::string &output();

    std::vector<std::string> &display();

    /**
     * @brief 结束标记中的返回值，标记中没有返回值时为空
     */
    const std::optional<int> &return_code() const;

private:
    std::string marker;
    size_t pos = 0;
    std::string text;
    std::vector<std::string> displays;
    std::optional<int> rc;
};

/**
 * @brief 在同一个驱动进程中依次执行多个单元格
 *
 * 1. 创建工作目录并写入请求附带的文件，启动驱动进程；
 * 2. 依次发送单元格，上一个单元格完成之后才发送下一个，
 *    每个单元格的截止时间为 min(开始时间 + cell_timeout, 整体截止时间)；
 * 3. 全部完成后关闭驱动进程的 stdin，驱动进程需要在整体截止时间之前退出；
 * 4. 杀死进程树，读回 fetch_files 中的文件，删除工作目录。
 *
 * 驱动进程中途退出时，结果只包含已经完成的单元格，driver.status 为 ERROR；
 * 超时为 TIME_LIMIT_EXCEEDED；正常退出为 FINISHED。
 * driver 的 stdout 和 stderr 为驱动进程的原始输出。
 *
 * @throw unsafe_path_error 请求中的文件路径不安全
 * @throw invalid_payload_error 请求中的文件内容无法解码
 */
run_jupyter_result run_jupyter(const run_jupyter_args &args, const notebook_config &config);

}  // namespace sandbox
