#include "sandbox_isolation.h"
#include "sandbox_internal.h"
#include "seccomp_rules.h"

#include <unistd.h>
#include <fcntl.h>
#include <grp.h>
#include <sys/stat.h>
#include <sys/mount.h>
#include <sys/syscall.h>
#include <sys/resource.h>
#include <sys/prctl.h>
#include <cstring>
#include <cstdio>
#include <cerrno>

// 严重警告: 必须严格遵守 Async-Signal-Safe C 风格
// 禁止使用: malloc/new, exceptions, STL, iostream
// 只能使用: glibc 系统调用, stack memory, snprintf 等。

namespace runbox {

    namespace {

        // 状态管道的写端, 在 NamespaceChildFn 开头设置
        int g_status_fd = -1;

        // 把失败原因写回父进程, 然后退出
        [[noreturn]] void ExitSetupError(int code, const char* step)
        {
            ChildFailure failure;
            std::memset(&failure, 0, sizeof(failure));
            failure.code = code;
            failure.err = errno;
            strncpy(failure.step, step ? step : "-", sizeof(failure.step) - 1);
            if (g_status_fd >= 0) {
                ssize_t wrote = write(g_status_fd, &failure, sizeof(failure));
                (void)wrote;
            }
            _exit(code);
        }

        // 关闭 [first, last] 范围内的 fd
        void CloseRange(unsigned first, unsigned last)
        {
            if (first > last) return;
            #ifdef __NR_close_range
                if (syscall(__NR_close_range, first, last, 0) == 0) {
                    return;
                }
            #endif
            // 回退: 传统循环关闭, 限制上限防止耗时过久
            long max_fd = sysconf(_SC_OPEN_MAX);
            if (max_fd < 0) max_fd = 4096;
            if (max_fd > 65536) max_fd = 65536;
            if (last > (unsigned)max_fd) last = (unsigned)max_fd;
            for (unsigned fd = first; fd <= last; ++fd) {
                close((int)fd);
            }
        }

        // 关闭除 0,1,2 与 keep_a / keep_b 以外的所有 fd
        void CloseInheritedFds(int keep_a, int keep_b)
        {
            int lo = keep_a < keep_b ? keep_a : keep_b;
            int hi = keep_a < keep_b ? keep_b : keep_a;
            CloseRange(3, (unsigned)lo - 1);
            CloseRange((unsigned)lo + 1, (unsigned)hi - 1);
            CloseRange((unsigned)hi + 1, ~0U);
        }

        // 确保 path 的各级父目录在 base 之下存在
        void EnsureParentDir(const char* path, const char* base)
        {
            char tmp[512];
            strncpy(tmp, path, sizeof(tmp) - 1);
            tmp[sizeof(tmp)-1] = '\0';
            char* p = strrchr(tmp, '/');
            if (!p) return;
            *p = '\0';

            size_t base_len = strlen(base);
            if (base_len == 0) return;
            if (strncmp(tmp, base, base_len) != 0) return;

            size_t len = strlen(tmp);
            for (size_t i = base_len + 1; i <= len; ++i) {
                if (tmp[i] == '\0' || tmp[i] == '/') {
                    char dirbuf[512];
                    memcpy(dirbuf, tmp, i);
                    dirbuf[i] = '\0';
                    if (mkdir(dirbuf, 0755) == -1 && errno != EEXIST) {
                        ExitSetupError(ERR_MKDIR_FAILED, "mkdir_parent");
                    }
                }
            }
        }

        // 只读 bind mount: 先 bind, 再 remount 为只读
        void BindReadOnly(const char* src, const char* target, bool recursive, const char* step)
        {
            unsigned long flags = MS_BIND | (recursive ? MS_REC : 0);
            if (mount(src, target, nullptr, flags, nullptr) == -1) {
                ExitSetupError(ERR_MOUNT_BIND_LIB, step);
            }
            if (mount(src, target, nullptr, flags | MS_RDONLY | MS_REMOUNT | MS_NOSUID | MS_NODEV, nullptr) == -1) {
                ExitSetupError(ERR_REMOUNT_RO, step);
            }
        }

        // 构建只读 rootfs 并 pivot_root 进去
        void SetupRootfs(const NamespaceChildArgs* args)
        {
            const char* root = args->root_dir;

            // 1. 挂载传播设为 Private, 防止污染宿主机
            if (mount(nullptr, "/", nullptr, MS_PRIVATE | MS_REC, nullptr) == -1) {
                ExitSetupError(ERR_MOUNT_PRIVATE, "mount_private_root");
            }

            // 2. 新根目录必须是挂载点 (pivot_root 的要求)
            if (mount(root, root, nullptr, MS_BIND | MS_REC, nullptr) == -1) {
                ExitSetupError(ERR_MOUNT_BIND_SELF, "mount_bind_self");
            }

            // 3. 宿主目录 (解释器与动态库)
            char target[512];
            for (int i = 0; i < g_runner_config.mount_count; ++i)
            {
                const char* src = g_runner_config.mount_dirs[i];
                if (access(src, F_OK) != 0) {
                    ExitSetupError(ERR_MOUNT_BIND_LIB, "mount_dir_not_found");
                }
                int n = snprintf(target, sizeof(target), "%s%s", root, src);
                if (n >= (int)sizeof(target)) {
                    errno = ENAMETOOLONG;
                    ExitSetupError(ERR_MKDIR_FAILED, "mount_dir_target_too_long");
                }
                EnsureParentDir(target, root);
                if (mkdir(target, 0755) == -1 && errno != EEXIST) {
                    ExitSetupError(ERR_MKDIR_FAILED, "mkdir_mount_dir");
                }
                BindReadOnly(src, target, true, "mount_bind_dir");
            }

            // 4. 单个文件 (/dev/null 等)
            for (int i = 0; i < g_runner_config.mount_file_count; ++i)
            {
                const char* src = g_runner_config.mount_files[i];
                if (access(src, F_OK) != 0) {
                    ExitSetupError(ERR_MOUNT_BIND_LIB, "mount_file_not_found");
                }
                int n = snprintf(target, sizeof(target), "%s%s", root, src);
                if (n >= (int)sizeof(target)) {
                    errno = ENAMETOOLONG;
                    ExitSetupError(ERR_MKDIR_FAILED, "mount_file_target_too_long");
                }
                EnsureParentDir(target, root);

                int fd = open(target, O_CREAT | O_RDWR | O_CLOEXEC, 0666);
                if (fd != -1) close(fd);
                else if (errno != EEXIST) ExitSetupError(ERR_MKDIR_FAILED, "touch_mount_file_target");

                // 设备文件不能带 MS_NODEV
                if (mount(src, target, nullptr, MS_BIND, nullptr) == -1) {
                    ExitSetupError(ERR_MOUNT_BIND_LIB, "mount_bind_file");
                }
                if (mount(src, target, nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID, nullptr) == -1) {
                    ExitSetupError(ERR_REMOUNT_RO, "mount_remount_file_ro");
                }
            }

            // 5. 源码目录只读挂载到 /app
            snprintf(target, sizeof(target), "%s/app", root);
            if (mkdir(target, 0755) == -1 && errno != EEXIST) {
                ExitSetupError(ERR_MKDIR_FAILED, "mkdir_app");
            }
            if (mount(args->source_dir, target, nullptr, MS_BIND | MS_REC, nullptr) == -1) {
                ExitSetupError(ERR_MOUNT_SOURCE, "mount_bind_app");
            }
            if (mount(args->source_dir, target, nullptr,
                      MS_BIND | MS_REC | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) == -1) {
                ExitSetupError(ERR_MOUNT_SOURCE, "mount_remount_app_ro");
            }

            // /proc 的挂载点必须在根目录变为只读之前创建
            snprintf(target, sizeof(target), "%s/proc", root);
            if (mkdir(target, 0755) == -1 && errno != EEXIST) {
                ExitSetupError(ERR_MKDIR_FAILED, "mkdir_proc");
            }

            // 6. Pivot Root
            char old_root[512];
            snprintf(old_root, sizeof(old_root), "%s/old_root", root);
            if (mkdir(old_root, 0755) == -1 && errno != EEXIST) {
                ExitSetupError(ERR_MKDIR_FAILED, "mkdir_old_root");
            }
            if (syscall(SYS_pivot_root, root, old_root) == -1) {
                ExitSetupError(ERR_PIVOT_ROOT, "pivot_root");
            }
            if (chdir("/") == -1) ExitSetupError(ERR_CHDIR_NEW_ROOT, "chdir_new_root");
            if (umount2("/old_root", MNT_DETACH) == -1) ExitSetupError(ERR_UMOUNT_OLD, "umount_old_root");
            rmdir("/old_root");

            // 7. 根目录改为只读, 之后沙箱内不存在任何可写路径
            if (chmod("/", 0555) == -1) ExitSetupError(ERR_CHDIR_FAILED, "chmod_root");
            if (mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID, nullptr) == -1) {
                ExitSetupError(ERR_REMOUNT_RO, "remount_root_ro");
            }

            // 8. /proc (只读, 新 PID 命名空间的视图)
            if (mount("proc", "/proc", "proc", MS_RDONLY | MS_NOSUID | MS_NOEXEC | MS_NODEV, nullptr) == -1) {
                ExitSetupError(ERR_MOUNT_PROC, "mount_proc");
            }
        }

        void SetLimit(int resource, rlim_t soft, rlim_t hard, int code, const char* step)
        {
            rlimit lim;
            lim.rlim_cur = soft;
            lim.rlim_max = hard;
            if (setrlimit(resource, &lim) == -1) ExitSetupError(code, step);
        }

    } // anonymous namespace

    const char* DescribeExitCode(int code)
    {
        switch (code)
        {
            case ERR_DUP2:              return "dup2 调用失败 (IO Redirect)";
            case ERR_SYNC_FAILED:       return "等待父进程放行失败";
            case ERR_EXEC_FAILED:       return "execve 调用失败 (解释器启动失败)";
            case ERR_CHDIR_FAILED:      return "chdir 切换工作目录失败";
            case ERR_SETGID_FAILED:     return "setgid 失败 (降权失败)";
            case ERR_SETUID_FAILED:     return "setuid 失败 (降权失败)";
            case ERR_RLIMIT_CPU:        return "setrlimit(CPU) 失败";
            case ERR_RLIMIT_MEMORY:     return "setrlimit(AS) 失败";
            case ERR_RLIMIT_NPROC:      return "setrlimit(NPROC) 失败";
            case ERR_RLIMIT_FSIZE:      return "setrlimit(FSIZE) 失败";
            case ERR_MOUNT_PRIVATE:     return "mount --make-rprivate 失败";
            case ERR_MOUNT_BIND_SELF:   return "bind mount 根目录失败";
            case ERR_MOUNT_BIND_LIB:    return "bind mount 系统目录失败";
            case ERR_REMOUNT_RO:        return "remount (RO) 失败";
            case ERR_PIVOT_ROOT:        return "pivot_root 系统调用失败";
            case ERR_CHDIR_NEW_ROOT:    return "切换到新根目录失败";
            case ERR_UMOUNT_OLD:        return "umount /old_root 失败";
            case ERR_MOUNT_PROC:        return "mount /proc 失败";
            case ERR_MKDIR_FAILED:      return "mkdir (构建 Rootfs) 失败";
            case ERR_SANDBOX_EXCEPTION: return "沙箱内部异常 (seccomp / prctl)";
            case ERR_MOUNT_SOURCE:      return "挂载源码目录 /app 失败";
            default:                    return "与系统相关的未知错误";
        }
    }

    int NamespaceChildFn(void* arg)
    {
        auto* args = (NamespaceChildArgs*)(arg);
        g_status_fd = args->status_fd;

        // -----------------------------------------------------
        // 1. 等待父进程把我们加入 cgroup 之后再继续
        // -----------------------------------------------------
        char go = 0;
        ssize_t n;
        do {
            n = read(args->sync_fd, &go, 1);
        } while (n == -1 && errno == EINTR);
        if (n != 1) ExitSetupError(ERR_SYNC_FAILED, "wait_parent");
        close(args->sync_fd);

        // -----------------------------------------------------
        // 2. IO 重定向 + 关闭继承的 fd
        // -----------------------------------------------------
        if (dup2(args->input_fd, STDIN_FILENO) == -1) ExitSetupError(ERR_DUP2, "dup2_stdin");
        if (dup2(args->output_fd, STDOUT_FILENO) == -1) ExitSetupError(ERR_DUP2, "dup2_stdout");
        if (dup2(args->error_fd, STDERR_FILENO) == -1) ExitSetupError(ERR_DUP2, "dup2_stderr");
        CloseInheritedFds(args->status_fd, args->status_fd);

        // -----------------------------------------------------
        // 3. 构建隔离环境 (Rootfs)
        // -----------------------------------------------------
        SetupRootfs(args);

        // -----------------------------------------------------
        // 4. 资源限制
        // -----------------------------------------------------
        // 墙钟超时由父进程负责, CPU 限制只是兜底 (按所有线程累计, 已乘以 CPU 数)
        // 硬限制不设: 忽略 SIGXCPU 的程序交给看门狗处理
        if (args->cpu_limit_sec > 0) {
            SetLimit(RLIMIT_CPU, (rlim_t)args->cpu_limit_sec, RLIM_INFINITY, ERR_RLIMIT_CPU, "rlimit_cpu");
        }

        // 没有 cgroup 时退化为地址空间限制
        if (!args->cgroup_enabled && args->memory_limit_bytes > 0) {
            SetLimit(RLIMIT_AS, (rlim_t)args->memory_limit_bytes, (rlim_t)args->memory_limit_bytes,
                     ERR_RLIMIT_MEMORY, "rlimit_as");
        }

        // RLIMIT_NPROC 按 uid 计数; 父进程保证这个 uid 只属于本沙箱
        if (args->nproc_limit > 0) {
            SetLimit(RLIMIT_NPROC, (rlim_t)args->nproc_limit, (rlim_t)args->nproc_limit,
                     ERR_RLIMIT_NPROC, "rlimit_nproc");
        }

        // 沙箱内没有可写文件, 管道写入不受 FSIZE 影响
        SetLimit(RLIMIT_FSIZE, 0, 0, ERR_RLIMIT_FSIZE, "rlimit_fsize");

        // -----------------------------------------------------
        // 5. 清理附加组 + 降权
        // -----------------------------------------------------
        if (setgroups(0, nullptr) != 0) ExitSetupError(ERR_SETGID_FAILED, "setgroups");
        if (setgid(args->run_gid) != 0) ExitSetupError(ERR_SETGID_FAILED, "setgid");
        if (setuid(args->run_uid) != 0) ExitSetupError(ERR_SETUID_FAILED, "setuid");
        if (chdir("/app") != 0) ExitSetupError(ERR_CHDIR_FAILED, "chdir_app");

        // -----------------------------------------------------
        // 6. 禁止提升特权 + Seccomp (exec 前最后一步)
        // -----------------------------------------------------
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) ExitSetupError(ERR_SANDBOX_EXCEPTION, "no_new_privs");
        if (!LoadSeccompRules()) ExitSetupError(ERR_SANDBOX_EXCEPTION, "seccomp_load");

        // -----------------------------------------------------
        // 7. 执行解释器
        // -----------------------------------------------------
        char* const argv[] = { args->interpreter, args->entry, nullptr };
        char* const envp[] = {
            (char*)"PATH=/usr/local/bin:/usr/bin:/bin",
            (char*)"HOME=/app",
            (char*)"LANG=C.UTF-8",
            (char*)"PYTHONDONTWRITEBYTECODE=1",
            (char*)"PYTHONUNBUFFERED=1",
            nullptr
        };
        execve(args->interpreter, argv, envp);

        ExitSetupError(ERR_EXEC_FAILED, "execve");
        return 0;
    }

} // namespace runbox
