#ifndef RUNBOX_SUBPROCESS_H
#define RUNBOX_SUBPROCESS_H

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace runbox
{
    class AutoCloseFd {
    public:
        explicit AutoCloseFd(int fd = -1) : fd_(fd) {}
        ~AutoCloseFd() { reset(); }
        AutoCloseFd(const AutoCloseFd&) = delete;
        AutoCloseFd& operator=(const AutoCloseFd&) = delete;
        AutoCloseFd(AutoCloseFd&& other) noexcept : fd_(other.release()) {}
        AutoCloseFd& operator=(AutoCloseFd&& other) noexcept
        {
            if (this != &other) reset(other.release());
            return *this;
        }

        int get() const { return fd_; }
        int release() { int fd = fd_; fd_ = -1; return fd; }
        void reset(int fd = -1);
    private:
        int fd_;
    };

    /**
     * @brief 子进程 RAII 守卫
     * 析构时若进程仍在运行则 SIGKILL 并阻塞收尸, 保证不留僵尸进程
     */
    class ProcessGuard
    {
    public:
        explicit ProcessGuard(pid_t pid = -1) : pid_(pid) {}
        ProcessGuard(const ProcessGuard&) = delete;
        ProcessGuard& operator=(const ProcessGuard&) = delete;
        ProcessGuard(ProcessGuard&& other) noexcept : pid_(other.pid_) { other.pid_ = -1; }
        ProcessGuard& operator=(ProcessGuard&& other) noexcept
        {
            if (this != &other) {
                cleanup();
                pid_ = other.pid_;
                other.pid_ = -1;
            }
            return *this;
        }
        ~ProcessGuard() { cleanup(); }

        pid_t pid() const { return pid_; }
        pid_t wait_nonblock(int& status);
        pid_t wait(int& status);
        bool kill();
        void release() { pid_ = -1; }

        // 仍在运行则 SIGKILL, 然后阻塞收尸
        void cleanup();

    private:

        pid_t pid_;
    };

    /**
     * @brief 持续读取一个管道直到 EOF 的后台线程
     * 超过 limit 的部分继续读取但丢弃, 避免写端因管道满而阻塞
     */
    class StreamDrain
    {
    public:
        StreamDrain(int fd, std::size_t limit);
        ~StreamDrain();

        StreamDrain(const StreamDrain&) = delete;
        StreamDrain& operator=(const StreamDrain&) = delete;

        // 等待 EOF 最多 grace, 之后停止读取并关闭 fd; 可重复调用
        void Finish(std::chrono::milliseconds grace);

        // 仅在 Finish 之后调用
        std::string Take() { return std::move(data_); }
        bool truncated() const { return truncated_; }
        bool reached_eof() const { return eof_; }

    private:
        void Loop();

        AutoCloseFd fd_;
        std::size_t limit_;
        std::string data_;
        bool truncated_ = false;
        bool eof_ = false;

        std::atomic<bool> stop_{false};
        std::mutex mutex_;
        std::condition_variable done_cv_;
        bool done_ = false;
        std::thread thread_;
    };

    struct SpawnedProcess {
        pid_t pid = -1;         // 同时是新进程组的 pgid
        int stdout_fd = -1;     // 调用方负责关闭
        int stderr_fd = -1;
    };

    struct SpawnResult {
        bool ok = false;
        SpawnedProcess process;
        std::string error_message;
    };

    /**
     * @brief fork + execvp, 子进程位于独立进程组
     * stdin 指向 /dev/null, stdout/stderr 为管道; exec 失败通过 CLOEXEC 管道同步回报
     */
    SpawnResult SpawnProcess(const std::vector<std::string>& argv);

    struct CommandResult {
        bool started = false;
        bool timed_out = false;
        int exit_code = -1;         // 被信号终止时为 128 + signo
        std::string out;
        std::string err;
        std::string error_message;  // started == false 时的原因
    };

    /**
     * @brief 运行辅助命令直到结束 (docker create / docker rm / unzip ...)
     * 超时则杀死整个进程组
     */
    CommandResult RunCommand(const std::vector<std::string>& argv,
                             int timeout_ms,
                             std::size_t output_limit = 1024 * 1024);

    // 向进程组发送 SIGKILL, 进程组已不存在时返回 false
    bool KillProcessGroup(pid_t pgid);

    std::string FormatSystemError(const std::string& prefix);

    // 去掉首尾空白
    std::string Trim(const std::string& s);
}

#endif // RUNBOX_SUBPROCESS_H
