#pragma once

#include <sys/types.h>
#include <string>
#include <utility>

namespace sandbox::process {

/**
 * @brief 文件描述符的 RAII 封装，析构时自动关闭
 */
struct file_descriptor {
    file_descriptor() = default;
    explicit file_descriptor(int fd);
    file_descriptor(file_descriptor &&other) noexcept;
    file_descriptor(const file_descriptor &) = delete;
    ~file_descriptor();

    file_descriptor &operator=(file_descriptor &&other) noexcept;
    file_descriptor &operator=(const file_descriptor &) = delete;

    int get() const { return fd; }
    bool valid() const { return fd >= 0; }

    /**
     * @brief 放弃所有权，返回原始文件描述符
     */
    int release();

    void close();

private:
    int fd = -1;
};

/**
 * @brief 创建一对带 O_CLOEXEC 标记的管道
 * 并发请求各自 fork 子进程，如果管道没有 O_CLOEXEC，其他请求的子进程会继承
 * 这里的写端，导致读端永远等不到 EOF。
 * @return {读端, 写端}
 * @throw std::system_error 创建失败
 */
std::pair<file_descriptor, file_descriptor> make_pipe();

void set_nonblocking(int fd);

/**
 * @brief 子进程的输入流
 */
struct writable_stream {
    virtual ~writable_stream();

    /**
     * @brief 输入流是否已经（或正在）关闭，即对端不会再读取数据
     * 子进程可能在读取输入之前就退出了（比如语法错误），此时不能再写入。
     */
    virtual bool is_closing() = 0;

    /**
     * @brief 写入部分数据
     * @return 写入的字节数，-1 表示出错，errno 被设置
     */
    virtual ssize_t write_some(const char *data, size_t size) = 0;

    /**
     * @brief 关闭输入流，对端将读到 EOF
     */
    virtual void close() = 0;

    virtual bool closed() const = 0;
};

/**
 * @brief 管道写端实现的输入流，写端为非阻塞模式
 */
struct pipe_writer : public writable_stream {
    explicit pipe_writer(file_descriptor fd);

    int fd() const;

    bool is_closing() override;

    ssize_t write_some(const char *data, size_t size) override;

    void close() override;

    bool closed() const override;

private:
    file_descriptor descriptor;
};

/**
 * @brief 负责将 stdin 数据分块写入子进程
 * 写入与读取 stdout/stderr 在同一个 poll 循环中交替进行，避免子进程
 * 写满输出管道时我们却阻塞在写 stdin 上导致死锁。
 */
struct stdin_feeder {
    /**
     * @param stream 子进程的输入流，为空表示没有 stdin 管道
     * @param payload 要写入的全部数据
     * @param close_when_done 写完之后是否关闭输入流，notebook 的多个单元格共用同一个输入流时为 false
     */
    stdin_feeder(writable_stream *stream, std::string payload, bool close_when_done = true);

    /**
     * @brief 开始写入
     * 如果输入流已经在关闭，跳过写入直接关闭输入流；
     * 如果没有数据要写，立刻结束（需要时关闭输入流使子进程读到 EOF）。
     */
    void start();

    /**
     * @brief 输入流可写时调用，写入下一块数据
     */
    void on_writable();

    /**
     * @brief 对端已经关闭，放弃剩余数据
     */
    void abandon();

    /**
     * @brief 是否已经不再需要写入（写完、跳过或放弃）
     */
    bool finished() const;

    /**
     * @brief 写入是否因为输入流已关闭而被跳过
     */
    bool skipped() const;

    size_t written() const;

private:
    void finish(bool close_stream);

    writable_stream *stream;
    std::string payload;
    bool close_when_done;
    size_t offset = 0;
    bool done = false;
    bool was_skipped = false;
};

}  // namespace sandbox::process
