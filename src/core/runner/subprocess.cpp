#include "subprocess.h"

#include <cerrno>
#include <cstring>
#include <csignal>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runbox
{
    namespace {

        // 关闭 [first, last] 范围内的 fd, 内核不支持 close_range 时回退到循环
        void CloseFdRange(int first, int last)
        {
            if (first > last) return;
            #ifdef __NR_close_range
                if (syscall(__NR_close_range, (unsigned)first, (unsigned)last, 0) == 0) {
                    return;
                }
            #endif
            int max_fd = (int)sysconf(_SC_OPEN_MAX);
            if (max_fd < 0) max_fd = 4096;
            if (max_fd > 65536) max_fd = 65536;
            if (last > max_fd) last = max_fd;
            for (int fd = first; fd <= last; ++fd) {
                close(fd);
            }
        }

        [[noreturn]] void ChildFail(int status_fd, int err)
        {
            ssize_t wrote = write(status_fd, &err, sizeof(err));
            (void)wrote;
            _exit(127);
        }

    } // anonymous namespace

    void AutoCloseFd::reset(int fd)
    {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

    // ========================================================================
    // ProcessGuard
    // ========================================================================

    pid_t ProcessGuard::wait_nonblock(int& status)
    {
        if (pid_ <= 0) return -1;
        for (;;) {
            pid_t w = waitpid(pid_, &status, WNOHANG);
            if (w == -1 && errno == EINTR) continue;
            return w;
        }
    }

    pid_t ProcessGuard::wait(int& status)
    {
        if (pid_ <= 0) return -1;
        for (;;) {
            pid_t w = waitpid(pid_, &status, 0);
            if (w == -1 && errno == EINTR) continue;
            return w;
        }
    }

    bool ProcessGuard::kill()
    {
        if (pid_ <= 0) return false;
        return ::kill(pid_, SIGKILL) == 0;
    }

    void ProcessGuard::cleanup()
    {
        if (pid_ <= 0) return;

        int status;
        pid_t w = waitpid(pid_, &status, WNOHANG);
        if (w == 0) {
            // 仍在运行 -> 强杀 -> 阻塞收尸
            ::kill(pid_, SIGKILL);
            for (;;) {
                pid_t r = waitpid(pid_, &status, 0);
                if (r == -1 && errno == EINTR) continue;
                break;
            }
        }
        pid_ = -1;
    }

    // ========================================================================
    // StreamDrain
    // ========================================================================

    StreamDrain::StreamDrain(int fd, std::size_t limit)
        : fd_(fd), limit_(limit)
    {
        thread_ = std::thread([this] { Loop(); });
    }

    StreamDrain::~StreamDrain()
    {
        Finish(std::chrono::milliseconds(0));
    }

    void StreamDrain::Loop()
    {
        char buf[64 * 1024];
        while (!stop_.load())
        {
            pollfd pfd{};
            pfd.fd = fd_.get();
            pfd.events = POLLIN;
            int pr = poll(&pfd, 1, 100);
            if (pr == -1) {
                if (errno == EINTR) continue;
                break;
            }
            if (pr == 0) continue;

            ssize_t n = read(fd_.get(), buf, sizeof(buf));
            if (n == -1) {
                if (errno == EINTR || errno == EAGAIN) continue;
                break;
            }
            if (n == 0) {
                eof_ = true;
                break;
            }
            std::size_t room = data_.size() < limit_ ? limit_ - data_.size() : 0;
            std::size_t keep = static_cast<std::size_t>(n) < room ? static_cast<std::size_t>(n) : room;
            data_.append(buf, keep);
            if (keep < static_cast<std::size_t>(n)) truncated_ = true;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
        done_cv_.notify_all();
    }

    void StreamDrain::Finish(std::chrono::milliseconds grace)
    {
        if (!thread_.joinable()) return;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            done_cv_.wait_for(lock, grace, [this] { return done_; });
        }
        stop_.store(true);
        thread_.join();
        fd_.reset();
    }

    // ========================================================================
    // SpawnProcess / RunCommand
    // ========================================================================

    SpawnResult SpawnProcess(const std::vector<std::string>& argv)
    {
        SpawnResult result;
        if (argv.empty()) {
            result.error_message = "empty command line";
            return result;
        }

        // fork 之后子进程只能调用 async-signal-safe 函数, 参数必须提前准备好
        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
        cargv.push_back(nullptr);

        int out_pipe[2], err_pipe[2], status_pipe[2];
        if (pipe2(out_pipe, O_CLOEXEC) == -1) {
            result.error_message = FormatSystemError("pipe(stdout)");
            return result;
        }
        AutoCloseFd out_r(out_pipe[0]), out_w(out_pipe[1]);
        if (pipe2(err_pipe, O_CLOEXEC) == -1) {
            result.error_message = FormatSystemError("pipe(stderr)");
            return result;
        }
        AutoCloseFd err_r(err_pipe[0]), err_w(err_pipe[1]);
        if (pipe2(status_pipe, O_CLOEXEC) == -1) {
            result.error_message = FormatSystemError("pipe(status)");
            return result;
        }
        AutoCloseFd status_r(status_pipe[0]), status_w(status_pipe[1]);

        pid_t pid = fork();
        if (pid == -1) {
            result.error_message = FormatSystemError("fork");
            return result;
        }

        if (pid == 0)
        {
            // ================= 子进程 =================
            int sfd = status_w.get();
            signal(SIGPIPE, SIG_DFL);
            if (setpgid(0, 0) == -1) ChildFail(sfd, errno);

            int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd == -1) ChildFail(sfd, errno);
            if (dup2(null_fd, STDIN_FILENO) == -1) ChildFail(sfd, errno);
            if (dup2(out_w.get(), STDOUT_FILENO) == -1) ChildFail(sfd, errno);
            if (dup2(err_w.get(), STDERR_FILENO) == -1) ChildFail(sfd, errno);

            // 只保留 0,1,2 与状态管道
            CloseFdRange(3, sfd - 1);
            CloseFdRange(sfd + 1, 0x7FFFFFFF);

            execvp(cargv[0], cargv.data());
            ChildFail(sfd, errno);
        }

        // ================= 父进程 =================
        ProcessGuard guard(pid);
        // 避免父子进程竞争: 子进程 setpgid 之前父进程也设置一次
        setpgid(pid, pid);

        out_w.reset();
        err_w.reset();
        status_w.reset();

        int child_errno = 0;
        ssize_t n;
        do {
            n = read(status_r.get(), &child_errno, sizeof(child_errno));
        } while (n == -1 && errno == EINTR);

        if (n > 0) {
            // exec 失败, 子进程已经 _exit
            int status;
            guard.wait(status);
            guard.release();
            result.error_message = "exec " + argv[0] + ": " + std::strerror(child_errno);
            return result;
        }

        guard.release();
        result.ok = true;
        result.process.pid = pid;
        result.process.stdout_fd = out_r.release();
        result.process.stderr_fd = err_r.release();
        return result;
    }

    CommandResult RunCommand(const std::vector<std::string>& argv, int timeout_ms, std::size_t output_limit)
    {
        CommandResult result;
        SpawnResult spawned = SpawnProcess(argv);
        if (!spawned.ok) {
            result.error_message = spawned.error_message;
            return result;
        }
        result.started = true;

        ProcessGuard proc(spawned.process.pid);
        StreamDrain out(spawned.process.stdout_fd, output_limit);
        StreamDrain err(spawned.process.stderr_fd, output_limit);

        int status = 0;
        bool reaped = true;
        auto start = std::chrono::steady_clock::now();
        while (true)
        {
            pid_t w = proc.wait_nonblock(status);
            if (w == -1) {
                result.error_message = FormatSystemError("waitpid");
                reaped = false;
                break;
            }
            if (w != 0) {
                proc.release();
                break;
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (timeout_ms > 0 && elapsed > timeout_ms) {
                result.timed_out = true;
                KillProcessGroup(spawned.process.pid);
                proc.wait(status);
                proc.release();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        // 清理可能残留的后代进程, 让管道写端全部关闭
        KillProcessGroup(spawned.process.pid);
        out.Finish(std::chrono::milliseconds(500));
        err.Finish(std::chrono::milliseconds(500));
        result.out = out.Take();
        result.err = err.Take();

        if (!reaped) {
            result.exit_code = -1;
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
        return result;
    }

    bool KillProcessGroup(pid_t pgid)
    {
        if (pgid <= 1) return false;
        return ::kill(-pgid, SIGKILL) == 0;
    }

    std::string FormatSystemError(const std::string& prefix)
    {
        return prefix + ": " + std::strerror(errno);
    }

    std::string Trim(const std::string& s)
    {
        const char* ws = " \t\r\n";
        std::size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos) return "";
        std::size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }
}
