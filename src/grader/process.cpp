#include "grader/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"

namespace bayview {
using namespace std;
using namespace std::chrono;

const size_t BUF_SIZE = 1 << 16;

// 一次 poll 唤醒后最多读取多少次，避免输出过快的程序让我们错过时间限制
const int MAX_READS_PER_WAKEUP = 16;

// 内核不支持 pidfd 时，检查子进程是否退出的间隔
const milliseconds EXIT_POLL_INTERVAL(10);

// 子进程 exec 失败时通过管道传回的信息
struct launch_failure {
    int stage;  // 0: chdir, 1: exec
    int err;
};

static void ignore_sigpipe() {
    // 向已经退出的子进程写入 stdin 时会收到 SIGPIPE，默认行为是终止整个评测服务。
    // 忽略后 write 会返回 EPIPE。子进程在 exec 前会恢复默认的信号处理。
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

[[noreturn]] static void error(int err, const string &message) {
    throw internal_error(message + ": " + strerror(err));
}

// 在 fork 出的子进程中调用，只能使用 async-signal-safe 的函数
static void redirect(int fd, int target) {
    if (fd == target)
        fcntl(fd, F_SETFD, 0);  // 清除 FD_CLOEXEC
    else
        dup2(fd, target);
}

child_process::child_process(const process_options &opt) {
    if (opt.command.empty())
        throw launch_error("empty command");

    file_descriptor child_in, child_out, child_err, status_read, status_write;
    make_pipe(child_in, in);
    make_pipe(out, child_out);
    if (!opt.merge_stderr) make_pipe(err, child_err);
    make_pipe(status_read, status_write);

    // fork 之后子进程只能调用 async-signal-safe 的函数，因此参数必须提前准备好
    vector<string> args = opt.command;
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);
    string work_dir = opt.work_dir.string();

    switch (child_pid = fork()) {
        case -1:
            error(errno, "unable to fork");
        case 0: {  // 子进程
            setpgid(0, 0);

            // 恢复默认的信号处理和信号掩码，被忽略的信号会在 exec 后继续被忽略
            for (int sig = 1; sig < NSIG; ++sig) signal(sig, SIG_DFL);
            sigset_t emptymask;
            sigemptyset(&emptymask);
            sigprocmask(SIG_SETMASK, &emptymask, nullptr);

            // dup2 得到的文件描述符没有 O_CLOEXEC，其余管道在 exec 时自动关闭
            redirect(child_in.get(), STDIN_FILENO);
            redirect(child_out.get(), STDOUT_FILENO);
            redirect(opt.merge_stderr ? child_out.get() : child_err.get(), STDERR_FILENO);

            launch_failure failure{0, 0};
            if (!work_dir.empty() && chdir(work_dir.c_str()) != 0) {
                failure = {0, errno};
            } else {
                execvp(argv[0], argv.data());
                failure = {1, errno};
            }
            ssize_t ignored = write(status_write.get(), &failure, sizeof(failure));
            (void)ignored;
            _exit(127);
        }
        default:  // 父进程
            break;
    }

    // 子进程和父进程都设置进程组，确保 terminate 时进程组已经存在
    setpgid(child_pid, child_pid);

    child_in.close();
    child_out.close();
    child_err.close();
    status_write.close();

    // 如果 exec 成功，status 管道因为 O_CLOEXEC 被关闭，read 返回 0
    launch_failure failure;
    ssize_t nread;
    do {
        nread = read(status_read.get(), &failure, sizeof(failure));
    } while (nread < 0 && errno == EINTR);

    if (nread > 0) {
        wait();
        if (nread != sizeof(failure))
            throw launch_error(fmt::format("unable to start {}", opt.command[0]));
        if (failure.stage == 0)
            throw launch_error(fmt::format("unable to change directory to {}: {}", work_dir, strerror(failure.err)));
        throw launch_error(fmt::format("unable to start {}: {}", opt.command[0], strerror(failure.err)));
    }

#ifdef SYS_pidfd_open
    int fd = static_cast<int>(syscall(SYS_pidfd_open, child_pid, 0));
    if (fd >= 0) pidfd = file_descriptor(fd);
#endif

    // 构造函数抛出异常时不会调用析构函数，必须在这里回收子进程
    scoped_guard reaper([this] {
        terminate();
        wait();
    });
    set_nonblocking(in);
    set_nonblocking(out);
    if (err.is_open()) set_nonblocking(err);
    reaper.dismiss();
}

child_process::~child_process() {
    if (reaped) return;
    terminate();
    try {
        wait();
    } catch (internal_error &ex) {
        LOG(ERROR) << "unable to reap child process " << child_pid << ": " << ex.what();
    }
}

pid_t child_process::pid() const noexcept {
    return child_pid;
}

int child_process::stdin_fd() const noexcept {
    return in.get();
}

int child_process::stdout_fd() const noexcept {
    return out.get();
}

int child_process::stderr_fd() const noexcept {
    return err.get();
}

int child_process::exit_fd() const noexcept {
    return pidfd.get();
}

void child_process::close_stdin() noexcept {
    in.close();
}

void child_process::close_stdout() noexcept {
    out.close();
}

void child_process::close_stderr() noexcept {
    err.close();
}

bool child_process::has_exited() const {
    if (reaped) return true;
    siginfo_t info;
    info.si_pid = 0;
    if (waitid(P_PID, child_pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        error(errno, fmt::format("waiting on child {}", child_pid));
    return info.si_pid != 0;
}

void child_process::terminate() noexcept {
    if (reaped || child_pid <= 0) return;
    if (kill(-child_pid, SIGKILL) != 0) {
        if (errno != ESRCH)
            LOG(WARNING) << "unable to send SIGKILL to process group " << child_pid << ": " << strerror(errno);
        // setpgid 失败时子进程不是进程组组长，只能杀死子进程本身
        kill(child_pid, SIGKILL);
    }
}

int child_process::wait() {
    int status = 0;
    while (waitpid(child_pid, &status, 0) < 0) {
        if (errno != EINTR) error(errno, fmt::format("waiting on child {}", child_pid));
    }
    reaped = true;
    return status;
}

/**
 * @brief 尽可能多地写入 stdin，写完或者子进程不再读取 stdin 时关闭管道
 */
static void feed_stdin(child_process &child, const string &input, size_t &written) {
    while (written < input.size()) {
        ssize_t nwritten = write(child.stdin_fd(), input.data() + written, min(input.size() - written, BUF_SIZE));
        if (nwritten < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            if (errno == EPIPE) {
                // 子进程关闭了 stdin 或者已经退出，剩余的输入直接丢弃
                VLOG(1) << "child " << child.pid() << " stopped reading stdin after " << written << " bytes";
                break;
            }
            error(errno, fmt::format("writing stdin of child {}", child.pid()));
        }
        written += nwritten;
    }
    child.close_stdin();
}

/**
 * @brief 读取管道中的数据，超出 limit 的部分会被丢弃
 * @return false 若读到了 EOF
 */
static bool drain(int fd, string &buffer, size_t limit) {
    char buf[BUF_SIZE];
    for (int i = 0; i < MAX_READS_PER_WAKEUP; ++i) {
        ssize_t nread = read(fd, buf, sizeof(buf));
        if (nread < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            error(errno, "reading output of child");
        }
        if (nread == 0) return false;
        size_t room = limit > buffer.size() ? limit - buffer.size() : 0;
        buffer.append(buf, min((size_t)nread, room));
    }
    return true;
}

static int poll_timeout(steady_clock::time_point now, optional<steady_clock::time_point> until) {
    if (!until) return -1;
    if (*until <= now) return 0;
    return (int)std::chrono::ceil<milliseconds>(*until - now).count();
}

static void supervise(child_process &child, const process_options &opt, const string &input,
                      optional<milliseconds> time_limit, execution_result &result) {
    auto start = steady_clock::now();
    optional<steady_clock::time_point> deadline;
    if (time_limit) deadline = start + *time_limit;
    optional<steady_clock::time_point> drain_deadline;

    // 多保留一个字节，才能区分输出恰好等于限制和超出限制
    size_t output_cap = opt.output_limit ? opt.output_limit + 1 : string::npos;
    size_t written = 0;
    bool exited = false;
    if (input.empty()) child.close_stdin();

    while (true) {
        if (exited && child.stdout_fd() < 0 && child.stderr_fd() < 0) break;

        auto now = steady_clock::now();
        if (!exited && deadline && now >= *deadline) {
            LOG(WARNING) << fmt::format("child {} exceeded time limit of {}ms: killing process group", child.pid(), time_limit->count());
            child.terminate();
            child.wait();
            result.outcome = execution_outcome::TIMED_OUT;
            result.elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
            result.output.clear();
            return;
        }
        if (exited && now >= *drain_deadline) {
            // 进程组外的后代进程仍然持有输出管道
            LOG(WARNING) << "child " << child.pid() << " exited but its output pipe is still open, output may be truncated";
            break;
        }

        pollfd fds[4];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1, exit_idx = -1;
        if (child.stdin_fd() >= 0) {
            fds[nfds] = {child.stdin_fd(), POLLOUT, 0};
            in_idx = nfds++;
        }
        if (child.stdout_fd() >= 0) {
            fds[nfds] = {child.stdout_fd(), POLLIN, 0};
            out_idx = nfds++;
        }
        if (child.stderr_fd() >= 0) {
            fds[nfds] = {child.stderr_fd(), POLLIN, 0};
            err_idx = nfds++;
        }
        if (!exited && child.exit_fd() >= 0) {
            fds[nfds] = {child.exit_fd(), POLLIN, 0};
            exit_idx = nfds++;
        }

        int timeout = poll_timeout(now, exited ? drain_deadline : deadline);
        if (!exited && child.exit_fd() < 0) {
            int interval = (int)EXIT_POLL_INTERVAL.count();
            timeout = timeout < 0 ? interval : min(timeout, interval);
        }

        if (poll(fds, nfds, timeout) < 0) {
            if (errno == EINTR) continue;
            error(errno, fmt::format("polling child {}", child.pid()));
        }

        if (in_idx >= 0 && fds[in_idx].revents)
            feed_stdin(child, input, written);
        if (out_idx >= 0 && fds[out_idx].revents && !drain(child.stdout_fd(), result.output, output_cap))
            child.close_stdout();
        if (opt.output_limit && result.output.size() > opt.output_limit) {
            LOG(WARNING) << fmt::format("child {} exceeded output limit of {} bytes: killing process group", child.pid(), opt.output_limit);
            child.terminate();
            child.wait();
            result.outcome = execution_outcome::OUTPUT_LIMIT_EXCEEDED;
            if (!exited) result.elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
            result.output.clear();
            return;
        }
        if (err_idx >= 0 && fds[err_idx].revents && !drain(child.stderr_fd(), result.error_output, opt.stderr_limit))
            child.close_stderr();

        if (!exited) {
            bool done = exit_idx >= 0 ? fds[exit_idx].revents != 0 : child.has_exited();
            if (done) {
                exited = true;
                result.elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
                // 子进程已经退出，杀死进程组内残留的后代进程，使输出管道能够读到 EOF
                child.terminate();
                child.close_stdin();
                drain_deadline = steady_clock::now() + milliseconds(KILL_GRACE_MS);
            }
        }
    }

    int status = child.wait();
    result.outcome = execution_outcome::COMPLETED;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }
}

execution_result run_process(const process_options &opt, const string &input, optional<milliseconds> time_limit) {
    ignore_sigpipe();

    execution_result result;
    try {
        child_process child(opt);
        supervise(child, opt, input, time_limit, result);
    } catch (launch_error &ex) {
        result.outcome = execution_outcome::FAILED_TO_START;
        result.error = ex.what();
    }
    return result;
}

}  // namespace bayview
