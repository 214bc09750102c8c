#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace sandbox {

/**
 * @brief 沙盒内部异常的基类，构造时记录调用栈以便在请求边界打印
 */
struct sandbox_exception : std::exception {
    sandbox_exception();
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    template <typename T>
    sandbox_exception operator<<(const T &t) const {
        return sandbox_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 请求中的文件路径会逃逸出工作目录
 * 比如绝对路径或者包含 ".." 的相对路径
 */
struct unsafe_path_error : public sandbox_exception {
    explicit unsafe_path_error(const std::string &path);
};

/**
 * @brief 请求中的 base64 文件内容无法解码
 */
struct invalid_payload_error : public sandbox_exception {
    explicit invalid_payload_error(const std::string &message);
};

}  // namespace sandbox
