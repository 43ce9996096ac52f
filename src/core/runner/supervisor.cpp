#include "supervisor.h"
#include "subprocess.h"

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <sys/wait.h>

namespace runbox
{
    namespace {

        // 看门狗轮询间隔
        const auto kPollInterval = std::chrono::milliseconds(10);

        // 领头进程退出后等待输出管道 EOF 的时间
        const auto kDrainGrace = std::chrono::milliseconds(1000);

    } // anonymous namespace

    const char* SupervisorStateName(SupervisorState state)
    {
        switch (state)
        {
            case SupervisorState::LAUNCHED:        return "Launched";
            case SupervisorState::RUNNING:         return "Running";
            case SupervisorState::COMPLETED:       return "Completed";
            case SupervisorState::TIMED_OUT:       return "TimedOut";
            case SupervisorState::RESOURCE_KILLED: return "ResourceKilled";
            case SupervisorState::LAUNCH_FAILED:   return "LaunchFailed";
            case SupervisorState::FINALIZED:       return "Finalized";
        }
        return "Unknown";
    }

    ExecutionSupervisor::ExecutionSupervisor(SandboxLauncher& launcher,
                                             std::string submission_id,
                                             LaunchedProcess process,
                                             const TaskLimits& limits,
                                             std::size_t max_output_bytes,
                                             StagingDir staging,
                                             SlotLease lease)
        : launcher_(launcher)
        , submission_id_(std::move(submission_id))
        , process_(std::move(process))
        , limits_(limits)
        , max_output_bytes_(max_output_bytes)
        , staging_(std::move(staging))
        , lease_(std::move(lease))
    {
    }

    ExecutionSupervisor::~ExecutionSupervisor()
    {
        Finalize();
    }

    RunResult ExecutionSupervisor::LaunchFailed(const std::string& submission_id, const std::string& cause)
    {
        RunResult result;
        result.submission_id = submission_id;
        result.termination = Termination::LAUNCH_FAILED;
        result.exit_code = EXIT_CODE_LAUNCH_FAILED;
        result.error = "Failed to start sandbox: " + cause;
        return result;
    }

    RunResult ExecutionSupervisor::Supervise()
    {
        RunResult result;
        result.submission_id = submission_id_;

        if (state_ != SupervisorState::LAUNCHED) {
            result.termination = Termination::LAUNCH_FAILED;
            result.exit_code = EXIT_CODE_LAUNCH_FAILED;
            result.error = std::string("supervisor already in state ") + SupervisorStateName(state_);
            return result;
        }

        // 1. Running: 两个线程在整个生命周期内持续读取输出, 防止管道写满阻塞子进程
        state_ = SupervisorState::RUNNING;
        // 先从句柄中取走 fd: StreamDrain 构造失败时 fd 已归它关闭, Release 不能再关一次
        int stdout_fd = process_.stdout_fd;
        int stderr_fd = process_.stderr_fd;
        process_.stdout_fd = -1;
        process_.stderr_fd = -1;
        AutoCloseFd pending_err(stderr_fd);
        StreamDrain out(stdout_fd, max_output_bytes_);
        StreamDrain err(pending_err.release(), max_output_bytes_);

        // 2. 看门狗
        ProcessGuard proc(process_.pid);
        int status = 0;
        bool timed_out = false;
        std::string wait_error;
        auto start_time = std::chrono::steady_clock::now();

        while (true)
        {
            pid_t w = proc.wait_nonblock(status);
            if (w == -1) {
                wait_error = FormatSystemError("waitpid");
                break;
            }
            if (w != 0) {
                proc.release();
                reaped_ = true;
                break;
            }

            auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count();
            if (elapsed_ms > limits_.timeout_ms) {
                timed_out = true;
                launcher_.Terminate(process_);
                proc.wait(status);
                proc.release();
                reaped_ = true;
                break;
            }

            std::this_thread::sleep_for(kPollInterval);
        }
        if (!reaped_) {
            // waitpid 失败: 强杀并收尸, 不留僵尸进程
            proc.cleanup();
            reaped_ = true;
        }
        result.time_used_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count());

        // 3. 领头进程已退出: 杀死残留后代, 让所有管道写端关闭
        launcher_.KillRemaining(process_);
        out.Finish(kDrainGrace);
        err.Finish(kDrainGrace);
        result.output = out.Take();
        std::string stderr_text = err.Take();
        result.output_truncated = out.truncated() || err.truncated();

        int exit_code = 0;
        if (WIFEXITED(status)) {
            exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code = 128 + WTERMSIG(status);
            // RLIMIT_CPU 兜底先于看门狗触发, 同样是超时
            if (WTERMSIG(status) == SIGXCPU && wait_error.empty()) timed_out = true;
        }

        // 容器没有真正启动 (OCI runtime 失败), 用户代码一行都没有执行
        std::string start_error;
        if (wait_error.empty() && !timed_out && exit_code != 0) {
            start_error = launcher_.StartError(process_);
        }

        // 4. 分类
        if (!wait_error.empty()) {
            state_ = SupervisorState::COMPLETED;
            result.termination = Termination::COMPLETED;
            result.exit_code = EXIT_CODE_LAUNCH_FAILED;
            result.error = "Internal error while supervising sandbox: " + wait_error;
        } else if (!start_error.empty()) {
            state_ = SupervisorState::LAUNCH_FAILED;
            result = LaunchFailed(submission_id_, start_error);
            result.time_used_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count());
        } else if (timed_out) {
            state_ = SupervisorState::TIMED_OUT;
            result.termination = Termination::TIMED_OUT;
            result.exit_code = EXIT_CODE_TIMED_OUT;
            result.error = TimeoutMessage(limits_.timeout_ms);
        } else if (launcher_.WasOomKilled(process_) || exit_code == EXIT_CODE_OOM_KILLED) {
            // 看门狗没有触发的 SIGKILL 只可能来自隔离层的内存限制
            state_ = SupervisorState::RESOURCE_KILLED;
            result.termination = Termination::RESOURCE_KILLED;
            result.exit_code = EXIT_CODE_OOM_KILLED;
            result.error = OutOfMemoryMessage(limits_.memory_limit_bytes);
        } else {
            state_ = SupervisorState::COMPLETED;
            result.termination = Termination::COMPLETED;
            result.exit_code = exit_code;
            result.error = std::move(stderr_text);
        }

        std::cerr << "[Supervisor] " << submission_id_ << ": " << ClassificationName(result)
                  << " exit=" << result.exit_code << " time=" << result.time_used_ms << "ms" << std::endl;

        Finalize();
        return result;
    }

    void ExecutionSupervisor::Finalize()
    {
        if (state_ == SupervisorState::FINALIZED) return;

        // Supervise 之前就走到这里 (异常路径): 进程可能仍在运行
        if (!reaped_ && process_.pid > 0) {
            launcher_.Terminate(process_);
            ProcessGuard proc(process_.pid);
            proc.cleanup();
            reaped_ = true;
            launcher_.KillRemaining(process_);
        }
        launcher_.Release(process_);
        staging_.Release();
        lease_.Release();
        state_ = SupervisorState::FINALIZED;
    }
}
