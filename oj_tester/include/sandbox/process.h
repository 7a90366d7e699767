/**
 * @file process.h
 * @brief 子进程执行器
 *
 * fork + execve 启动程序，stdin/stdout/stderr 全部接管道：
 * - 输入写完后关闭 stdin，读写都是非阻塞的，用 poll 同时处理，不会因管道缓冲区满而死锁
 * - 墙上时间超限时 SIGKILL 整个进程组，再用一小段时间收集剩余输出
 * - 无论是否被杀，子进程都会被 waitpid 回收
 *
 * 只限制时间，不做内存、系统调用等隔离。
 */

#ifndef OJT_SANDBOX_PROCESS_H
#define OJT_SANDBOX_PROCESS_H

#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <algorithm>
#include <cstring>
#include <cerrno>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>

#include "core/error.h"
#include "core/logger.h"

extern char **environ;

namespace ojt {
namespace sandbox {

//==============================================================================
// 执行配置与结果
//==============================================================================

enum class ExitKind {
    EXITED,      ///< 正常退出，见 exit_code
    SIGNALED,    ///< 被信号终止（不是执行器杀的）
    TIMED_OUT    ///< 超时被执行器杀掉，没有退出码
};

inline const char* exit_kind_to_string(ExitKind kind) {
    switch (kind) {
        case ExitKind::EXITED: return "EXITED";
        case ExitKind::SIGNALED: return "SIGNALED";
        case ExitKind::TIMED_OUT: return "TIMED_OUT";
    }
    return "UNKNOWN";
}

struct ProcessConfig {
    std::string program;
    std::vector<std::string> args;
    std::string work_dir;                                        ///< 空表示继承当前目录
    std::vector<std::pair<std::string, std::string>> env;       ///< 追加/覆盖的环境变量
    double time_limit_ms = 3000;
    int drain_ms = 200;                                          ///< 超时后收集剩余输出的时间
};

struct ProcessResult {
    ExitKind kind = ExitKind::EXITED;
    int exit_code = -1;
    int signal = 0;
    double elapsed_ms = 0;
    std::string stdout_data;
    std::string stderr_data;
};

//==============================================================================
// 文件描述符
//==============================================================================

/**
 * @brief 自动关闭的文件描述符
 */
class FileDescriptor {
private:
    int fd_ = -1;

public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor &&o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor &&o) noexcept {
        if (this != &o) {
            close();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;

    static Result<Pipe> create() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) < 0) {
            return Err<Pipe>(ErrorCode::PIPE_FAILED,
                std::string("Pipe creation failed: ") + strerror(errno));
        }
        Pipe p;
        p.read_end = FileDescriptor(fds[0]);
        p.write_end = FileDescriptor(fds[1]);
        return p;
    }
};

inline bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

/**
 * @brief 在作用域内忽略 SIGPIPE，子进程提前关闭 stdin 时 write 只返回 EPIPE
 */
class ScopedIgnoreSigpipe {
private:
    struct sigaction old_;
    bool installed_ = false;

public:
    ScopedIgnoreSigpipe() {
        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        installed_ = sigaction(SIGPIPE, &sa, &old_) == 0;
    }
    ~ScopedIgnoreSigpipe() {
        if (installed_) {
            sigaction(SIGPIPE, &old_, nullptr);
        }
    }
    ScopedIgnoreSigpipe(const ScopedIgnoreSigpipe&) = delete;
    ScopedIgnoreSigpipe& operator=(const ScopedIgnoreSigpipe&) = delete;
};

//==============================================================================
// 执行器
//==============================================================================

class Process {
private:
    using Clock = std::chrono::steady_clock;

    /// 输出管道关闭后等待进程变成僵尸的轮询间隔
    static constexpr std::chrono::microseconds REAP_INTERVAL{50};

    ProcessConfig config_;

    /**
     * @brief 组装 envp：当前环境 + 配置中的覆盖项
     */
    std::vector<std::string> build_environment() const {
        std::vector<std::string> envs;
        for (char **e = environ; e != nullptr && *e != nullptr; e++) {
            std::string entry(*e);
            std::string key = entry.substr(0, entry.find('='));
            bool overridden = false;
            for (const auto &kv : config_.env) {
                if (kv.first == key) {
                    overridden = true;
                    break;
                }
            }
            if (!overridden) {
                envs.push_back(std::move(entry));
            }
        }
        for (const auto &kv : config_.env) {
            envs.push_back(kv.first + "=" + kv.second);
        }
        return envs;
    }

    /**
     * @brief 子进程：重定向后 execve，失败时把 errno 写入 error_fd
     */
    [[noreturn]] static void child_exec(int stdin_fd, int stdout_fd, int stderr_fd, int error_fd,
                                        const char *work_dir, const char *program,
                                        char *const *argv, char *const *envp) {
        setpgid(0, 0);

        if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
            dup2(stdout_fd, STDOUT_FILENO) < 0 ||
            dup2(stderr_fd, STDERR_FILENO) < 0) {
            int err = errno;
            (void)!write(error_fd, &err, sizeof(err));
            _exit(127);
        }

        if (work_dir != nullptr && chdir(work_dir) < 0) {
            int err = errno;
            (void)!write(error_fd, &err, sizeof(err));
            _exit(127);
        }

        // 恢复默认信号处理，避免继承父进程忽略的 SIGPIPE
        signal(SIGPIPE, SIG_DFL);

        execve(program, argv, envp);
        int err = errno;
        (void)!write(error_fd, &err, sizeof(err));
        _exit(127);
    }

    /**
     * @brief 从 fd 读到 EAGAIN 或 EOF
     * @return false 表示已到 EOF
     */
    static bool drain_fd(int fd, std::string &out) {
        char buf[65536];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                out.append(buf, n);
                continue;
            }
            if (n == 0) {
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    }

    static double ms_since(Clock::time_point start) {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    }

public:
    explicit Process(ProcessConfig config) : config_(std::move(config)) {}

    const ProcessConfig& config() const { return config_; }

    /**
     * @brief 运行程序，把 input 写入其标准输入
     *
     * 启动失败（找不到程序、fork 失败等）返回错误；程序本身的退出状态、
     * 信号和超时都放在 ProcessResult 里。
     */
    Result<ProcessResult> run(const std::string &input) {
        ScopedIgnoreSigpipe sigpipe_guard;

        OJT_TRY_UNWRAP(in_pipe, Pipe::create());
        OJT_TRY_UNWRAP(out_pipe, Pipe::create());
        OJT_TRY_UNWRAP(err_pipe, Pipe::create());
        OJT_TRY_UNWRAP(exec_pipe, Pipe::create());

        // fork 之前准备好 argv/envp，子进程里只做 async-signal-safe 的调用
        std::vector<std::string> env_strings = build_environment();
        std::vector<char*> envp;
        for (auto &e : env_strings) envp.push_back(&e[0]);
        envp.push_back(nullptr);

        std::string program = config_.program;
        std::vector<std::string> arg_strings;
        arg_strings.push_back(program);
        arg_strings.insert(arg_strings.end(), config_.args.begin(), config_.args.end());
        std::vector<char*> argv;
        for (auto &a : arg_strings) argv.push_back(&a[0]);
        argv.push_back(nullptr);

        const char *work_dir = config_.work_dir.empty() ? nullptr : config_.work_dir.c_str();

        auto start = Clock::now();
        auto deadline = start + std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double, std::milli>(config_.time_limit_ms));

        pid_t pid = fork();
        if (pid < 0) {
            return Err<ProcessResult>(ErrorCode::FORK_FAILED,
                std::string("Fork failed: ") + strerror(errno));
        }
        if (pid == 0) {
            child_exec(in_pipe.read_end.get(), out_pipe.write_end.get(),
                       err_pipe.write_end.get(), exec_pipe.write_end.get(),
                       work_dir, program.c_str(), argv.data(), envp.data());
        }

        setpgid(pid, pid);
        OJT_LOG_DEBUG << "Spawned " << program << " (pid " << pid << ")";

        in_pipe.read_end.close();
        out_pipe.write_end.close();
        err_pipe.write_end.close();
        exec_pipe.write_end.close();

        // execve 成功时 O_CLOEXEC 关闭写端，这里读到 EOF；失败时读到 errno
        int exec_errno = 0;
        ssize_t got;
        do {
            got = read(exec_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
        } while (got < 0 && errno == EINTR);
        if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
            int status;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return Err<ProcessResult>(ErrorCode::SPAWN_FAILED,
                "Cannot execute " + program + ": " + strerror(exec_errno));
        }

        ProcessResult result;
        FileDescriptor &stdin_fd = in_pipe.write_end;
        FileDescriptor &stdout_fd = out_pipe.read_end;
        FileDescriptor &stderr_fd = err_pipe.read_end;
        set_nonblocking(stdin_fd.get());
        set_nonblocking(stdout_fd.get());
        set_nonblocking(stderr_fd.get());

        size_t written = 0;
        if (input.empty()) {
            stdin_fd.close();
        }

        bool reaped = false;
        bool timed_out = false;
        int status = 0;

        while (true) {
            if (!reaped) {
                pid_t ret = waitpid(pid, &status, WNOHANG);
                if (ret == pid) {
                    reaped = true;
                } else if (ret < 0 && errno != EINTR) {
                    int wait_errno = errno;
                    kill(-pid, SIGKILL);
                    kill(pid, SIGKILL);
                    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
                    return Err<ProcessResult>(ErrorCode::WAIT_FAILED,
                        std::string("Waitpid failed: ") + strerror(wait_errno));
                }
            }
            if (reaped && !stdout_fd.is_open() && !stderr_fd.is_open()) {
                break;
            }

            auto now = Clock::now();
            if (now >= deadline) {
                timed_out = true;
                break;
            }

            struct pollfd fds[3];
            FileDescriptor *owners[3];
            nfds_t nfds = 0;
            if (stdout_fd.is_open()) {
                fds[nfds] = {stdout_fd.get(), POLLIN, 0};
                owners[nfds++] = &stdout_fd;
            }
            if (stderr_fd.is_open()) {
                fds[nfds] = {stderr_fd.get(), POLLIN, 0};
                owners[nfds++] = &stderr_fd;
            }
            if (stdin_fd.is_open()) {
                fds[nfds] = {stdin_fd.get(), POLLOUT, 0};
                owners[nfds++] = &stdin_fd;
            }

            // 管道都已关闭，进程正在退出：短间隔重试 waitpid，不能在 poll 上空等
            if (nfds == 0) {
                std::this_thread::sleep_for(REAP_INTERVAL);
                continue;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            // 进程还没回收时定期醒来检查 waitpid
            int timeout = static_cast<int>(std::min<long long>(remaining + 1, reaped ? remaining + 1 : 10));

            int ready = poll(fds, nfds, timeout);
            if (ready < 0) {
                if (errno == EINTR) continue;
                OJT_LOG_WARN << "poll failed: " << strerror(errno);
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }

            for (nfds_t i = 0; i < nfds; i++) {
                if (fds[i].revents == 0) continue;
                FileDescriptor *owner = owners[i];
                if (owner == &stdin_fd) {
                    if (fds[i].revents & (POLLERR | POLLHUP)) {
                        stdin_fd.close();
                        continue;
                    }
                    ssize_t n = write(stdin_fd.get(), input.data() + written, input.size() - written);
                    if (n > 0) {
                        written += n;
                        if (written == input.size()) {
                            stdin_fd.close();
                        }
                    } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                        // EPIPE：子进程不再读取输入
                        stdin_fd.close();
                    }
                } else {
                    std::string &sink = (owner == &stdout_fd) ? result.stdout_data : result.stderr_data;
                    if (!drain_fd(owner->get(), sink)) {
                        owner->close();
                    }
                }
            }
        }

        if (timed_out) {
            OJT_LOG_DEBUG << "Time limit exceeded, killing pid " << pid;
            stdin_fd.close();
            // 整个进程组一起杀，子进程派生的进程也不会继续占着管道
            kill(-pid, SIGKILL);
            if (!reaped) {
                kill(pid, SIGKILL);
            }

            // 被杀之后尽力收集剩余输出，最多 drain_ms
            auto drain_deadline = Clock::now() + std::chrono::milliseconds(config_.drain_ms);
            while ((stdout_fd.is_open() || stderr_fd.is_open()) && Clock::now() < drain_deadline) {
                struct pollfd fds[2];
                FileDescriptor *owners[2];
                nfds_t nfds = 0;
                if (stdout_fd.is_open()) {
                    fds[nfds] = {stdout_fd.get(), POLLIN, 0};
                    owners[nfds++] = &stdout_fd;
                }
                if (stderr_fd.is_open()) {
                    fds[nfds] = {stderr_fd.get(), POLLIN, 0};
                    owners[nfds++] = &stderr_fd;
                }
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    drain_deadline - Clock::now()).count();
                int ready = poll(fds, nfds, static_cast<int>(std::max<long long>(left, 0)));
                if (ready <= 0) {
                    if (ready < 0 && errno == EINTR) continue;
                    break;
                }
                for (nfds_t i = 0; i < nfds; i++) {
                    if (fds[i].revents == 0) continue;
                    std::string &sink = (owners[i] == &stdout_fd) ? result.stdout_data : result.stderr_data;
                    if (!drain_fd(owners[i]->get(), sink)) {
                        owners[i]->close();
                    }
                }
            }

            if (!reaped) {
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            }
            OJT_LOG_DEBUG << "Reaped pid " << pid << " after timeout";

            result.kind = ExitKind::TIMED_OUT;
            result.elapsed_ms = ms_since(start);
            return result;
        }

        result.elapsed_ms = ms_since(start);
        if (WIFEXITED(status)) {
            result.kind = ExitKind::EXITED;
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.kind = ExitKind::SIGNALED;
            result.signal = WTERMSIG(status);
        }
        return result;
    }
};

} // namespace sandbox
} // namespace ojt

#endif // OJT_SANDBOX_PROCESS_H
