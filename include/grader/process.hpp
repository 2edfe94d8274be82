#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "common/file_descriptor.hpp"

namespace bayview {

/**
 * @brief 子进程的启动参数
 */
struct process_options {
    /**
     * @brief 程序路径 (command[0]) 和参数
     * 如果 command[0] 不包含 '/'，将在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径，为空时继承当前进程的工作路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 是否将 stderr 合并到 stdout
     * 编译器的诊断信息需要合并 stdout 和 stderr 并保持输出顺序
     */
    bool merge_stderr = false;

    /**
     * @brief stderr 最多保存多少字节
     */
    std::size_t stderr_limit = 1 << 16;

    /**
     * @brief stdout 最多允许输出多少字节，为 0 时不限制
     * 超出限制时立刻杀死整个进程组
     */
    std::size_t output_limit = 0;
};

/**
 * @brief 子进程的运行结果分类
 */
enum class execution_outcome {
    /**
     * @brief 子进程在时间限制内退出，不论退出码是多少
     */
    COMPLETED,

    /**
     * @brief 子进程运行超过时间限制，整个进程组已被杀死
     */
    TIMED_OUT,

    /**
     * @brief 子进程的 stdout 超过输出限制，整个进程组已被杀死
     */
    OUTPUT_LIMIT_EXCEEDED,

    /**
     * @brief 子进程无法启动，比如程序不存在、没有执行权限
     */
    FAILED_TO_START
};

/**
 * @brief 子进程的运行结果
 */
struct execution_result {
    execution_outcome outcome = execution_outcome::FAILED_TO_START;

    /**
     * @brief 子进程的 stdout 输出
     * 如果子进程超时或超出输出限制，输出会被丢弃
     */
    std::string output;

    /**
     * @brief 子进程的 stderr 输出，只用于记录日志
     */
    std::string error_output;

    /**
     * @brief 子进程退出码。因信号终止时为 128 + 信号编号
     */
    int exit_code = -1;

    /**
     * @brief 终止子进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 子进程从启动到退出（或被杀死）的时钟时间
     */
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief 子进程无法启动的原因
     */
    std::string error;
};

/**
 * @brief 子进程句柄
 * 子进程会被放在一个独立的进程组中，以便我们通过 SIGKILL 杀死进程组内所有进程。
 * 析构时如果子进程还没有被回收，将杀死整个进程组并回收子进程，
 * 因此无论评测以何种方式结束都不会残留进程。
 *
 * 子进程的 stdin/stdout/stderr 都连接到管道，父进程端的管道为非阻塞模式。
 */
struct child_process {
    /**
     * @brief 启动子进程
     * @param opt 启动参数
     * @throw launch_error 程序无法启动（exec 失败、工作路径不存在）
     * @throw internal_error 创建管道、fork 失败
     */
    explicit child_process(const process_options &opt);
    child_process(const child_process &) = delete;
    ~child_process();

    child_process &operator=(const child_process &) = delete;

    pid_t pid() const noexcept;

    /**
     * @brief 连接子进程 stdin 的管道写端，已关闭时为 -1
     */
    int stdin_fd() const noexcept;

    /**
     * @brief 连接子进程 stdout 的管道读端，已关闭时为 -1
     */
    int stdout_fd() const noexcept;

    /**
     * @brief 连接子进程 stderr 的管道读端，已关闭或合并到 stdout 时为 -1
     */
    int stderr_fd() const noexcept;

    /**
     * @brief 子进程退出时可读的 pidfd，内核不支持 pidfd_open 时为 -1
     */
    int exit_fd() const noexcept;

    void close_stdin() noexcept;
    void close_stdout() noexcept;
    void close_stderr() noexcept;

    /**
     * @brief 不回收子进程，检查子进程是否已经退出
     * 子进程退出后仍然保持僵尸状态，因此进程组 id 不会被复用
     */
    bool has_exited() const;

    /**
     * @brief 通过 SIGKILL 杀死子进程所在的进程组
     * 已经退出的进程不会被视为错误
     */
    void terminate() noexcept;

    /**
     * @brief 阻塞等待并回收子进程
     * @return waitpid 得到的 status
     */
    int wait();

private:
    pid_t child_pid = -1;
    bool reaped = false;
    file_descriptor in, out, err, pidfd;
};

/**
 * @brief 运行子进程，写入全部输入并收集全部输出
 * stdin 的写入与 stdout/stderr 的读取在同一个 poll 循环中进行，
 * 任何一方都不会阻塞另一方，因此输入输出远大于管道缓冲区时也不会死锁。
 * 输入写完后关闭 stdin，使读到 EOF 才结束的程序可以正常退出。
 *
 * 子进程退出后，会立刻杀死其进程组内残留的进程，再读取管道中剩余的输出。
 * @param opt 启动参数
 * @param input 写入子进程 stdin 的全部内容
 * @param time_limit 时钟时间限制，为空时不限制
 * @return 运行结果，启动失败时 outcome 为 FAILED_TO_START
 * @throw internal_error 监控子进程时发生系统调用错误
 */
execution_result run_process(const process_options &opt, const std::string &input,
                             std::optional<std::chrono::milliseconds> time_limit);

}  // namespace bayview
