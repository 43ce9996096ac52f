#include "launcher.h"
#include "sandbox_isolation.h"
#include "subprocess.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runbox
{
    namespace fs = std::filesystem;

    namespace {

        const char* const kCgroupRoot = "/sys/fs/cgroup/runbox";
        const int kReleaseTimeoutMs = 15000;

        LaunchResult LaunchFailure(std::string message)
        {
            LaunchResult result;
            result.ok = false;
            result.error_message = std::move(message);
            return result;
        }

        std::string FirstLine(const std::string& text)
        {
            std::string t = Trim(text);
            std::size_t nl = t.find('\n');
            return nl == std::string::npos ? t : t.substr(0, nl);
        }

        // CPU 时间按所有线程累计, 在墙钟超时之内不可能超过 timeout * CPU 数
        long CpuBackstopSeconds(int timeout_ms)
        {
            long cpus = sysconf(_SC_NPROCESSORS_ONLN);
            if (cpus < 1) cpus = 1;
            return static_cast<long>((timeout_ms + 999) / 1000) * cpus + 1;
        }

        void RemoveContainer(const std::string& name)
        {
            CommandResult removed = RunCommand({g_runner_config.docker_bin, "rm", "-f", name}, kReleaseTimeoutMs);
            if (!removed.started || removed.exit_code != 0) {
                std::cerr << "[Launcher] Cleanup Warning: docker rm -f " << name << " failed: "
                          << (removed.started ? FirstLine(removed.err) : removed.error_message) << std::endl;
            }
        }

    } // anonymous namespace

    // ========================================================================
    // SandboxUidPool
    // ========================================================================

    SandboxUidPool::SandboxUidPool(uid_t base, int count)
        : base_(base)
        , busy_(static_cast<std::size_t>(count > 0 ? count : 1), false)
    {
    }

    bool SandboxUidPool::Acquire(uid_t& uid)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::size_t i = 0; i < busy_.size(); ++i) {
            if (!busy_[i]) {
                busy_[i] = true;
                uid = base_ + static_cast<uid_t>(i);
                return true;
            }
        }
        return false;
    }

    void SandboxUidPool::Release(uid_t uid)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (uid < base_) return;
        std::size_t index = uid - base_;
        if (index < busy_.size()) busy_[index] = false;
    }

    int SandboxUidPool::in_use() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int count = 0;
        for (bool b : busy_) {
            if (b) ++count;
        }
        return count;
    }

    // ========================================================================
    // SandboxLauncher
    // ========================================================================

    SandboxLauncher::SandboxLauncher()
        : uid_pool_(g_runner_config.fallback_uid_base, g_runner_config.pool_size)
    {
    }

    bool SandboxLauncher::BuildSpec(const TaskDescriptor& task,
                                    const std::string& project_dir,
                                    ExecutionSpec& spec,
                                    std::string& error) const
    {
        int index = static_cast<int>(task.language);
        if (index < 0 || index >= LANGUAGE_COUNT) {
            error = "Unsupported language";
            return false;
        }
        const LanguageProfile& profile = g_runner_config.languages[index];
        if (profile.interpreter[0] == '\0' || profile.source_file[0] == '\0') {
            error = std::string("No runtime configured for language '") + LanguageName(task.language) + "'";
            return false;
        }

        spec = ExecutionSpec();
        spec.submission_id = task.submission_id;
        spec.language = task.language;
        spec.image = profile.image;
        spec.host_interpreter = profile.host_interpreter;
        spec.working_dir = "/app";
        spec.mounts.push_back(MountSpec{project_dir, "/app", true});

        std::string entry = task.IsInline() ? std::string(profile.source_file) : task.project().entry_point;
        spec.command = {profile.interpreter, entry};

        spec.memory_limit_bytes = task.limits.memory_limit_bytes;
        spec.pids_limit = g_runner_config.pids_limit;
        spec.timeout_ms = task.limits.timeout_ms;
        spec.network_enabled = false;
        spec.read_only_root = true;
        return true;
    }

    std::vector<std::string> SandboxLauncher::DockerCreateArgs(const ExecutionSpec& spec,
                                                               const std::string& container_name)
    {
        const std::string memory = std::to_string(spec.memory_limit_bytes);
        std::vector<std::string> args = {
            g_runner_config.docker_bin, "create",
            "--pull", "never",
            "--name", container_name,
            "--memory", memory,
            "--memory-swap", memory,        // 与 memory 相同即禁用 swap
            "--network", "none",
            "--ipc", "none",                // 不挂载可写的 /dev/shm
            "--pids-limit", std::to_string(spec.pids_limit),
            "--cap-drop", "ALL",
            "--security-opt", "no-new-privileges",
        };
        if (spec.read_only_root) {
            args.push_back("--read-only");
        }
        for (const auto& m : spec.mounts) {
            args.push_back("-v");
            args.push_back(m.host_path + ":" + m.sandbox_path + (m.read_only ? ":ro" : ""));
        }
        args.push_back("-w");
        args.push_back(spec.working_dir);
        args.push_back(spec.image);
        args.insert(args.end(), spec.command.begin(), spec.command.end());
        return args;
    }

    LaunchResult SandboxLauncher::Launch(const ExecutionSpec& spec)
    {
        std::uint64_t seq = launch_count_.fetch_add(1);
        const std::string name = "runbox-" + spec.submission_id + "-" + std::to_string(seq);

        if (spec.command.empty() || spec.mounts.size() > 1) {
            return LaunchFailure("invalid execution spec for " + spec.submission_id);
        }

        LaunchResult result = g_runner_config.backend == RuntimeBackend::NAMESPACE
                                  ? LaunchNamespace(spec, name)
                                  : LaunchDocker(spec, name);
        if (!result.ok) {
            std::cerr << "[Launcher] " << spec.submission_id << ": 启动失败: " << result.error_message << std::endl;
        }
        return result;
    }

    // ========================================================================
    // docker 后端
    // ========================================================================

    LaunchResult SandboxLauncher::LaunchDocker(const ExecutionSpec& spec, const std::string& name)
    {
        if (spec.image.empty()) {
            return LaunchFailure("no image configured for language " + std::string(LanguageName(spec.language)));
        }

        // 1. docker create 必须完整成功, 镜像缺失等错误在这里暴露
        CommandResult created = RunCommand(DockerCreateArgs(spec, name), g_runner_config.create_timeout_ms);
        if (!created.started) {
            return LaunchFailure("container runtime unavailable: " + created.error_message);
        }
        if (created.timed_out || created.exit_code != 0) {
            // create 可能已经部分完成
            RemoveContainer(name);
            if (created.timed_out) {
                return LaunchFailure("docker create timed out after " +
                                     std::to_string(g_runner_config.create_timeout_ms) + " ms");
            }
            std::string detail = FirstLine(created.err);
            return LaunchFailure("docker create failed (exit " + std::to_string(created.exit_code) + ")" +
                                 (detail.empty() ? "" : ": " + detail));
        }

        // 2. docker start -a 作为被监督的进程, 位于独立进程组
        SpawnResult started = SpawnProcess({g_runner_config.docker_bin, "start", "-a", name});
        if (!started.ok) {
            RemoveContainer(name);
            return LaunchFailure("docker start failed: " + started.error_message);
        }

        LaunchResult result;
        result.ok = true;
        result.process.pid = started.process.pid;
        result.process.own_process_group = true;
        result.process.stdout_fd = started.process.stdout_fd;
        result.process.stderr_fd = started.process.stderr_fd;
        result.process.backend = RuntimeBackend::DOCKER;
        result.process.container_name = name;
        std::cerr << "[Launcher] " << spec.submission_id << ": container " << name
                  << " started (pid " << started.process.pid << ")" << std::endl;
        return result;
    }

    // ========================================================================
    // namespace 后端
    // ========================================================================

    LaunchResult SandboxLauncher::LaunchNamespace(const ExecutionSpec& spec, const std::string& name)
    {
        if (spec.host_interpreter.empty()) {
            return LaunchFailure("no host interpreter configured for language " +
                                 std::string(LanguageName(spec.language)));
        }

        LaunchedProcess process;
        process.backend = RuntimeBackend::NAMESPACE;

        // 1. [Cgroups v2] 硬内存上限; 不支持时降级到 RLIMIT_AS
        bool cgroup_enabled = false;
        if (CgroupManager::Available()) {
            auto cgroup = std::make_unique<CgroupManager>(kCgroupRoot, name);
            if (cgroup->Setup(spec.memory_limit_bytes, spec.pids_limit > 0 ? spec.pids_limit : 32)) {
                process.cgroup = std::move(cgroup);
                cgroup_enabled = true;
            } else {
                std::cerr << "[沙箱] Cgroups v2 初始化失败, 降级到 setrlimit 模式" << std::endl;
            }
        }

        // 没有 pids.max 时用 RLIMIT_NPROC 限制进程数, 它按 uid 计数,
        // 所以每个沙箱借用一个独占的 uid
        uid_t run_uid = g_runner_config.run_uid;
        if (!cgroup_enabled) {
            if (!uid_pool_.Acquire(run_uid)) {
                Release(process);
                return LaunchFailure("no free sandbox uid (all " + std::to_string(uid_pool_.size()) +
                                     " in use)");
            }
            process.holds_sandbox_uid = true;
            process.sandbox_uid = run_uid;
        }

        // 2. 新根目录
        std::string tmpl = (fs::path(g_runner_config.workspace_root) / (name + "-rootfs-XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            LaunchResult failed = LaunchFailure(FormatSystemError("mkdtemp rootfs"));
            Release(process);
            return failed;
        }
        process.rootfs_dir = buf.data();
        if (chmod(process.rootfs_dir.c_str(), 0755) == -1) {
            std::cerr << "[Launcher] Warning: " << FormatSystemError("chmod " + process.rootfs_dir) << std::endl;
        }

        // 3. 管道: 输出 / 放行 / 状态
        int out_pipe[2], err_pipe[2], sync_pipe[2], status_pipe[2];
        if (pipe2(out_pipe, O_CLOEXEC) == -1) {
            LaunchResult failed = LaunchFailure(FormatSystemError("pipe(stdout)"));
            Release(process);
            return failed;
        }
        AutoCloseFd out_r(out_pipe[0]), out_w(out_pipe[1]);
        if (pipe2(err_pipe, O_CLOEXEC) == -1) {
            LaunchResult failed = LaunchFailure(FormatSystemError("pipe(stderr)"));
            Release(process);
            return failed;
        }
        AutoCloseFd err_r(err_pipe[0]), err_w(err_pipe[1]);
        if (pipe2(sync_pipe, O_CLOEXEC) == -1) {
            LaunchResult failed = LaunchFailure(FormatSystemError("pipe(sync)"));
            Release(process);
            return failed;
        }
        AutoCloseFd sync_r(sync_pipe[0]), sync_w(sync_pipe[1]);
        if (pipe2(status_pipe, O_CLOEXEC) == -1) {
            LaunchResult failed = LaunchFailure(FormatSystemError("pipe(status)"));
            Release(process);
            return failed;
        }
        AutoCloseFd status_r(status_pipe[0]), status_w(status_pipe[1]);
        AutoCloseFd null_fd(open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (null_fd.get() < 0) {
            LaunchResult failed = LaunchFailure(FormatSystemError("open /dev/null"));
            Release(process);
            return failed;
        }

        // 4. 子进程参数 (定长 C 结构体)
        NamespaceChildArgs args;
        std::memset(&args, 0, sizeof(args));
        CopyString(args.root_dir, sizeof(args.root_dir), process.rootfs_dir);
        CopyString(args.source_dir, sizeof(args.source_dir), spec.mounts.empty() ? "" : spec.mounts[0].host_path);
        CopyString(args.interpreter, sizeof(args.interpreter), spec.host_interpreter);
        CopyString(args.entry, sizeof(args.entry), spec.command.back());
        args.timeout_ms = spec.timeout_ms;
        args.memory_limit_bytes = spec.memory_limit_bytes;
        args.cgroup_enabled = cgroup_enabled;
        args.run_uid = run_uid;
        args.run_gid = g_runner_config.run_gid;
        args.nproc_limit = cgroup_enabled ? 0 : (spec.pids_limit > 0 ? spec.pids_limit : 32);
        args.cpu_limit_sec = CpuBackstopSeconds(spec.timeout_ms);
        args.input_fd = null_fd.get();
        args.output_fd = out_w.get();
        args.error_fd = err_w.get();
        args.sync_fd = sync_r.get();
        args.status_fd = status_w.get();

        auto stack_mem = std::make_unique<char[]>(STACK_SIZE);
        char* stack_top = stack_mem.get() + STACK_SIZE;

        // 5. Clone 子进程 (隔离层)
        pid_t pid = clone(NamespaceChildFn, stack_top,
                          CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS | SIGCHLD,
                          &args);
        if (pid == -1) {
            LaunchResult failed = LaunchFailure(FormatSystemError("clone"));
            Release(process);
            return failed;
        }

        // ================= 父进程 =================
        ProcessGuard guard(pid);
        process.pid = pid;
        out_w.reset();
        err_w.reset();
        sync_r.reset();
        status_w.reset();
        null_fd.reset();

        // 6. 放行之前先加入 cgroup, 用户代码从第一条指令起就受限
        if (process.cgroup && !process.cgroup->Attach(pid)) {
            guard.cleanup();
            process.pid = -1;
            Release(process);
            return LaunchFailure("failed to attach sandbox to cgroup");
        }

        char go = 1;
        ssize_t wrote;
        do {
            wrote = write(sync_w.get(), &go, 1);
        } while (wrote == -1 && errno == EINTR);
        sync_w.reset();

        // 7. exec 成功时状态管道被关闭 (EOF), 否则读到 ChildFailure
        ChildFailure failure;
        std::memset(&failure, 0, sizeof(failure));
        ssize_t n;
        do {
            n = read(status_r.get(), &failure, sizeof(failure));
        } while (n == -1 && errno == EINTR);

        if (n != 0 || wrote != 1) {
            guard.cleanup();
            process.pid = -1;
            Release(process);
            std::string message;
            if (n == static_cast<ssize_t>(sizeof(failure))) {
                failure.step[sizeof(failure.step) - 1] = '\0';
                message = std::string("namespace setup failed at ") + failure.step + ": " +
                          DescribeExitCode(failure.code) + " (" + std::strerror(failure.err) + ")";
            } else {
                message = "sandbox process exited before exec";
            }
            return LaunchFailure(message);
        }

        guard.release();

        LaunchResult result;
        result.ok = true;
        process.own_process_group = false;
        process.stdout_fd = out_r.release();
        process.stderr_fd = err_r.release();
        result.process = std::move(process);
        std::cerr << "[Launcher] " << spec.submission_id << ": namespace sandbox started (pid " << pid
                  << (cgroup_enabled ? ", cgroup" : ", rlimit only") << ")" << std::endl;
        return result;
    }

    // ========================================================================
    // 终止与清理
    // ========================================================================

    void SandboxLauncher::Terminate(LaunchedProcess& process)
    {
        if (process.backend == RuntimeBackend::DOCKER) {
            // 只杀 docker CLI 不会停止容器
            if (!process.container_name.empty()) {
                CommandResult killed = RunCommand({g_runner_config.docker_bin, "kill", process.container_name},
                                                  kReleaseTimeoutMs);
                if (!killed.started || killed.exit_code != 0) {
                    std::cerr << "[Launcher] docker kill " << process.container_name << " failed: "
                              << (killed.started ? FirstLine(killed.err) : killed.error_message) << std::endl;
                }
            }
        } else if (process.cgroup) {
            process.cgroup->KillAll();
        }

        if (process.pid > 0) {
            if (process.own_process_group) {
                KillProcessGroup(process.pid);
            } else {
                // PID 命名空间的 init 退出时内核会杀死命名空间内所有进程
                kill(process.pid, SIGKILL);
            }
        }
    }

    void SandboxLauncher::KillRemaining(LaunchedProcess& process)
    {
        if (process.own_process_group && process.pid > 0) {
            KillProcessGroup(process.pid);
        }
        if (process.cgroup) {
            process.cgroup->KillAll();
        }
    }

    bool SandboxLauncher::WasOomKilled(const LaunchedProcess& process)
    {
        if (process.backend == RuntimeBackend::DOCKER) {
            if (process.container_name.empty()) return false;
            CommandResult inspected = RunCommand(
                {g_runner_config.docker_bin, "inspect", "-f", "{{.State.OOMKilled}}", process.container_name},
                kReleaseTimeoutMs);
            return inspected.started && inspected.exit_code == 0 && Trim(inspected.out) == "true";
        }
        return process.cgroup && process.cgroup->OomKillCount() > 0;
    }

    std::string SandboxLauncher::StartError(const LaunchedProcess& process)
    {
        // namespace 后端的启动失败已经在 Launch 中通过状态管道报告
        if (process.backend != RuntimeBackend::DOCKER || process.container_name.empty()) return "";

        CommandResult inspected = RunCommand(
            {g_runner_config.docker_bin, "inspect", "-f", "{{.State.Error}}", process.container_name},
            kReleaseTimeoutMs);
        if (!inspected.started || inspected.timed_out || inspected.exit_code != 0) {
            std::cerr << "[Launcher] Warning: docker inspect " << process.container_name << " failed: "
                      << (inspected.started ? FirstLine(inspected.err) : inspected.error_message) << std::endl;
            return "";
        }
        std::string state_error = Trim(inspected.out);
        if (state_error == "<no value>") return "";
        return state_error;
    }

    void SandboxLauncher::Release(LaunchedProcess& process)
    {
        if (!process.container_name.empty()) {
            RemoveContainer(process.container_name);
            process.container_name.clear();
        }

        if (process.cgroup) {
            process.cgroup->Remove();
            process.cgroup.reset();
        }

        if (!process.rootfs_dir.empty()) {
            std::error_code ec;
            fs::remove_all(process.rootfs_dir, ec);
            if (ec) {
                std::cerr << "[Launcher] Cleanup Warning: Failed to remove " << process.rootfs_dir
                          << ": " << ec.message() << std::endl;
            }
            process.rootfs_dir.clear();
        }

        if (process.holds_sandbox_uid) {
            // PID 命名空间的 init 被回收时, 命名空间内的进程都已退出
            uid_pool_.Release(process.sandbox_uid);
            process.holds_sandbox_uid = false;
        }

        if (process.stdout_fd >= 0) {
            close(process.stdout_fd);
            process.stdout_fd = -1;
        }
        if (process.stderr_fd >= 0) {
            close(process.stderr_fd);
            process.stderr_fd = -1;
        }
    }
}
