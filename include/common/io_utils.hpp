#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 读取文件的全部内容（按字节读取，不做编码转换）
 * @param path 文件路径
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 覆盖写入文件，必要时创建上级目录
 * @throw std::system_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 是一个不会离开工作目录的相对路径
 * 请求中的文件名由调用方提供，如果包含 ".." 或者是绝对路径，
 * 写入或读回时就可能覆盖/泄露工作目录以外的文件。
 * @param subpath 被检查的文件名
 * @return 规范化之后的相对路径
 * @throw unsafe_path_error 路径不安全
 */
std::filesystem::path assert_safe_path(const std::string &subpath);

/**
 * @brief 检查 path 在解析符号链接之后是否仍位于 root 之内
 */
bool is_within(const std::filesystem::path &root, const std::filesystem::path &path);

std::string base64_encode(const std::string &data);

/**
 * @brief 解码 base64 字符串，忽略其中的空白字符
 * @throw invalid_payload_error 字符串不是合法的 base64
 */
std::string base64_decode(const std::string &encoded);

}  // namespace sandbox
