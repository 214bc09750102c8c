#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "runner/types.hpp"

namespace sandbox {

/**
 * @brief 一次请求独占的临时工作目录
 * 构造时在 root 下创建以随机 uuid 命名的目录，析构时无论请求是否成功都删除整个目录。
 *
 * root
 * ├── 0a1b2c3d-... // 某个请求的工作目录
 * │   ├── main.py // 用户代码（示例）
 * │   ├── data/input.csv // 请求附带的文件
 * │   └── out.png // 执行后被读回的文件
 * └── ...
 */
struct workspace {
    /**
     * @throw std::filesystem::filesystem_error 无法创建目录
     */
    explicit workspace(const std::filesystem::path &root);
    workspace(const workspace &) = delete;
    ~workspace();

    workspace &operator=(const workspace &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 在工作目录中写入请求附带的文件，必要时创建上级目录
     * @param files 相对路径到 base64 内容的映射，内容为空时创建空文件
     * @throw unsafe_path_error 路径是绝对路径或者包含 ".."
     * @throw invalid_payload_error 内容不是合法的 base64
     */
    void materialize(const file_map &files) const;

    /**
     * @brief 写入一个文本文件，比如用户代码
     */
    void write(const std::string &subpath, const std::string &content) const;

    /**
     * @brief 读回执行后产生的文件
     * 不存在的文件、不是普通文件的路径以及通过符号链接指向工作目录以外的路径都会被跳过。
     * @return 相对路径到 base64 内容的映射
     * @throw unsafe_path_error 路径是绝对路径或者包含 ".."
     */
    fetched_files fetch(const std::vector<std::string> &paths) const;

private:
    std::filesystem::path dir;
};

}  // namespace sandbox
