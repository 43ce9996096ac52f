#ifndef RUNBOX_SUPERVISOR_H
#define RUNBOX_SUPERVISOR_H

#include "archive.h"
#include "launcher.h"
#include "sandbox.h"
#include "scheduler.h"
#include "task.h"

#include <cstddef>
#include <string>

namespace runbox
{
    enum class SupervisorState {
        LAUNCHED = 0,
        RUNNING,
        COMPLETED,
        TIMED_OUT,
        RESOURCE_KILLED,
        LAUNCH_FAILED,
        FINALIZED
    };

    const char* SupervisorStateName(SupervisorState state);

    /**
     * @brief 执行监督器
     * 持有一个已启动进程的全部生命周期资源: 进程, 容器 / cgroup, staging 目录, 槽位。
     * Launched -> Running -> {Completed, TimedOut, ResourceKilled} -> Finalized
     * 无论哪条路径 (包括异常), 析构时都会执行 Finalize。
     */
    class ExecutionSupervisor
    {
    public:
        ExecutionSupervisor(SandboxLauncher& launcher,
                            std::string submission_id,
                            LaunchedProcess process,
                            const TaskLimits& limits,
                            std::size_t max_output_bytes,
                            StagingDir staging,
                            SlotLease lease);
        ~ExecutionSupervisor();

        ExecutionSupervisor(const ExecutionSupervisor&) = delete;
        ExecutionSupervisor& operator=(const ExecutionSupervisor&) = delete;

        /**
         * @brief 监督进程直到结束或超时, 分类终止原因, 然后 Finalize
         * 只能调用一次
         */
        RunResult Supervise();

        /**
         * @brief 杀死残留进程, 删除容器 / cgroup / staging, 归还槽位; 可重复调用
         */
        void Finalize();

        SupervisorState state() const { return state_; }

        // 启动失败时直接生成的结果 (exit_code = -3)
        static RunResult LaunchFailed(const std::string& submission_id, const std::string& cause);

    private:
        SandboxLauncher& launcher_;
        std::string submission_id_;
        LaunchedProcess process_;
        TaskLimits limits_;
        std::size_t max_output_bytes_;
        StagingDir staging_;
        SlotLease lease_;

        SupervisorState state_ = SupervisorState::LAUNCHED;
        bool reaped_ = false;
    };
}

#endif // RUNBOX_SUPERVISOR_H
