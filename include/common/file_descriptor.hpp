#pragma once

namespace bayview {

/**
 * @brief 文件描述符的所有权
 * 析构时自动关闭文件描述符，只能移动不能复制
 */
struct file_descriptor {
    file_descriptor();
    explicit file_descriptor(int fd);
    file_descriptor(file_descriptor &&other) noexcept;
    file_descriptor(const file_descriptor &) = delete;
    ~file_descriptor();

    file_descriptor &operator=(file_descriptor &&other) noexcept;
    file_descriptor &operator=(const file_descriptor &) = delete;

    bool is_open() const noexcept;

    int get() const noexcept;

    /**
     * @brief 放弃所有权，返回文件描述符，调用方负责关闭
     */
    int release() noexcept;

    /**
     * @brief 关闭文件描述符，对已经关闭的对象调用不做任何事
     * @return close 的返回值
     */
    int close() noexcept;

private:
    int fd;
};

/**
 * @brief 通过 pipe2 创建 O_CLOEXEC 管道
 * 所有管道必须是 close-on-exec 的：评测可能在多个线程中同时进行，
 * 否则另一个线程 fork 出的子进程会继承本管道的写端，导致我们永远读不到 EOF
 * @param read_end 管道读端
 * @param write_end 管道写端
 * @throw internal_error 创建管道失败
 */
void make_pipe(file_descriptor &read_end, file_descriptor &write_end);

/**
 * @brief 将文件描述符设置为非阻塞模式
 * @throw internal_error fcntl 失败
 */
void set_nonblocking(const file_descriptor &fd);

}  // namespace bayview
