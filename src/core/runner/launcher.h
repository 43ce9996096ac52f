#ifndef RUNBOX_LAUNCHER_H
#define RUNBOX_LAUNCHER_H

#include "cgroup_manager.h"
#include "sandbox_internal.h"
#include "task.h"

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace runbox
{
    struct MountSpec {
        std::string host_path;
        std::string sandbox_path;
        bool read_only = true;
    };

    /**
     * @brief 单个任务的隔离运行时描述 (只属于一个任务, 不共享)
     */
    struct ExecutionSpec {
        std::string submission_id;
        Language language = Language::PYTHON;
        std::string image;                  // docker 镜像
        std::string host_interpreter;       // namespace 后端使用的宿主解释器
        std::string working_dir = "/app";
        std::vector<MountSpec> mounts;      // 至多一个只读源码挂载
        std::vector<std::string> command;   // 沙箱内的命令行: 解释器 + 入口文件
        long long memory_limit_bytes = 0;
        int pids_limit = 0;
        int timeout_ms = 0;
        bool network_enabled = false;
        bool read_only_root = true;
    };

    /**
     * @brief namespace 后端无 cgroup 时的 uid 分配器
     * RLIMIT_NPROC 按 uid 计数, 每个并发沙箱必须使用不同的 uid 才不会互相占用进程数
     */
    class SandboxUidPool
    {
    public:
        SandboxUidPool(uid_t base, int count);

        SandboxUidPool(const SandboxUidPool&) = delete;
        SandboxUidPool& operator=(const SandboxUidPool&) = delete;

        // 返回最小的空闲 uid, 全部占用时返回 false
        bool Acquire(uid_t& uid);
        // 不属于本池或未占用的 uid 被忽略
        void Release(uid_t uid);

        int in_use() const;
        int size() const { return static_cast<int>(busy_.size()); }

    private:
        mutable std::mutex mutex_;
        uid_t base_;
        std::vector<bool> busy_;
    };

    /**
     * @brief 已启动的隔离进程句柄
     * 只能移动; 由 Supervisor 持有并在 Finalize 时交还给 SandboxLauncher::Release
     */
    struct LaunchedProcess {
        pid_t pid = -1;                 // 被监督的进程 (docker start -a / clone 子进程)
        bool own_process_group = false; // pid 是否为独立进程组的组长
        int stdout_fd = -1;             // 由 Supervisor 接管
        int stderr_fd = -1;
        RuntimeBackend backend = RuntimeBackend::DOCKER;
        std::string container_name;             // docker 后端
        std::unique_ptr<CgroupManager> cgroup;  // namespace 后端, 可能为空 (回退到 RLIMIT_AS)
        std::string rootfs_dir;                 // namespace 后端的新根目录 (宿主侧)
        bool holds_sandbox_uid = false;         // 无 cgroup 时从 SandboxUidPool 借用的 uid
        uid_t sandbox_uid = 0;
    };

    struct LaunchResult {
        bool ok = false;
        LaunchedProcess process;
        std::string error_message;      // LaunchError 的底层原因
    };

    /**
     * @brief 沙箱启动器
     * 把一个 TaskDescriptor 及其 staging 目录映射成一个隔离进程并启动, 不等待其结束。
     * 启动失败不重试, 以 LaunchError 返回。
     */
    class SandboxLauncher
    {
    public:
        SandboxLauncher();
        SandboxLauncher(const SandboxLauncher&) = delete;
        SandboxLauncher& operator=(const SandboxLauncher&) = delete;

        /**
         * @brief 根据语言表与任务限制生成 ExecutionSpec
         * @param project_dir 已准备好的 staging 项目目录 (宿主侧)
         * @return false 如果该语言没有配置运行时 (error 已填写)
         */
        bool BuildSpec(const TaskDescriptor& task,
                       const std::string& project_dir,
                       ExecutionSpec& spec,
                       std::string& error) const;

        // docker create 的完整参数列表 (不含执行)
        static std::vector<std::string> DockerCreateArgs(const ExecutionSpec& spec,
                                                         const std::string& container_name);

        /**
         * @brief 按 runtime.backend 启动隔离进程
         */
        LaunchResult Launch(const ExecutionSpec& spec);

        /**
         * @brief 看门狗超时: 杀死整个进程组 / 容器 / PID 命名空间
         */
        void Terminate(LaunchedProcess& process);

        /**
         * @brief 领头进程退出之后, 杀死可能残留的后代进程
         */
        void KillRemaining(LaunchedProcess& process);

        /**
         * @brief 隔离层是否报告了 OOM (docker State.OOMKilled / cgroup oom_kill)
         */
        bool WasOomKilled(const LaunchedProcess& process);

        /**
         * @brief 被监督进程退出后, 检查用户代码是否真正开始运行过
         * docker start -a 在 OCI runtime 启动失败时同样以非零码退出,
         * 此时 State.Error 非空; 返回空串表示容器确实启动过
         */
        std::string StartError(const LaunchedProcess& process);

        /**
         * @brief 删除容器 / cgroup / rootfs; 可重复调用
         */
        void Release(LaunchedProcess& process);

        // 调用 Launch 的次数 (包括失败的尝试)
        std::uint64_t LaunchCount() const { return launch_count_.load(); }

    private:
        LaunchResult LaunchDocker(const ExecutionSpec& spec, const std::string& name);
        LaunchResult LaunchNamespace(const ExecutionSpec& spec, const std::string& name);

        std::atomic<std::uint64_t> launch_count_{0};
        SandboxUidPool uid_pool_;
    };
}

#endif // RUNBOX_LAUNCHER_H
