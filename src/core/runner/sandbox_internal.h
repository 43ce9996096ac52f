#ifndef RUNBOX_SANDBOX_INTERNAL_H
#define RUNBOX_SANDBOX_INTERNAL_H

#include <sys/types.h>
#include <sys/resource.h>
#include <unistd.h>

#include <cstddef>
#include <string>

namespace runbox {

    // 定义 clone 子进程栈大小: 8MB (防止 glibc 爆栈)
    const int STACK_SIZE = 8 * 1024 * 1024;

    // 支持的语言数量 (与 Language 枚举保持一致)
    const int LANGUAGE_COUNT = 2;

    // 命名空间子进程在 exec 之前失败时的退出码
    // 同时通过状态管道回传给父进程，父进程将其映射为 LaunchError
    enum SandboxExitCode {
        EXIT_OK = 0, // 正常退出

        // 第一阶段: 基础设置与执行 (120-139)
        ERR_DUP2             = 121, // 重定向标准输出/错误失败
        ERR_SYNC_FAILED      = 122, // 等待父进程放行失败 (cgroup 尚未就绪)
        ERR_EXEC_FAILED      = 127, // execve 执行失败 (解释器缺失)
        ERR_CHDIR_FAILED     = 128, // 切换工作目录失败
        ERR_SETGID_FAILED    = 129, // 设置组 ID 失败
        ERR_SETUID_FAILED    = 130, // 设置用户 ID 失败

        // 第二阶段: 资源限制 (140-159)
        ERR_RLIMIT_CPU       = 141, // 设置 CPU 时间限制失败
        ERR_RLIMIT_MEMORY    = 142, // 设置内存限制失败
        ERR_RLIMIT_NPROC     = 144, // 设置进程数限制失败
        ERR_RLIMIT_FSIZE     = 145, // 设置文件大小限制失败

        // 第三阶段: 隔离与文件系统 (190-200)
        ERR_MOUNT_PRIVATE    = 190, // mount --make-private 失败
        ERR_MOUNT_BIND_SELF  = 191, // bind mount 根目录失败
        ERR_MOUNT_BIND_LIB   = 192, // 挂载系统目录 (/usr, /lib...) 失败
        ERR_REMOUNT_RO       = 193, // 重新挂载为只读失败
        ERR_PIVOT_ROOT       = 194, // pivot_root 系统调用失败
        ERR_CHDIR_NEW_ROOT   = 195, // 切换到新根目录失败
        ERR_UMOUNT_OLD       = 196, // 卸载旧根目录 (/old_root) 失败
        ERR_MOUNT_PROC       = 197, // 挂载 /proc 失败
        ERR_MKDIR_FAILED     = 198, // 创建目录失败
        ERR_SANDBOX_EXCEPTION = 199, // 沙箱内部异常 (seccomp / prctl)
        ERR_MOUNT_SOURCE     = 200  // 挂载源码目录 (/app) 失败
    };

    enum class RuntimeBackend {
        DOCKER = 0,     // 外部容器运行时 (docker CLI)
        NAMESPACE       // 内置 clone + namespaces + cgroups v2
    };

    /**
     * @brief 单个语言的运行时描述
     * image 只对 docker 后端有效, host_interpreter 只对 namespace 后端有效
     */
    struct LanguageProfile {
        char name[32];
        char image[128];
        char interpreter[64];
        char source_file[64];
        char host_interpreter[256];
    };

    struct GlobalConfig {
        // 工作区与运行时
        char workspace_root[256];
        char docker_bin[256];
        char unzip_bin[256];
        RuntimeBackend backend;

        // namespace 后端: 只读挂载进沙箱的宿主目录
        char mount_dirs[16][256];
        int mount_count;

        // namespace 后端: 只读挂载的单个文件 (/dev/null 等)
        char mount_files[16][256];
        int mount_file_count;

        LanguageProfile languages[LANGUAGE_COUNT];

        // 任务限制
        int max_code_chars;
        int timeout_ms;
        long long memory_limit_mb;
        long long max_output_bytes;     // stdout / stderr 各自的捕获上限
        long long max_archive_bytes;

        // 并发
        int pool_size;                  // 全局沙箱槽位数
        int max_batch_size;             // 批量请求硬上限 (超出直接拒绝)
        int create_timeout_ms;          // docker create / unzip 等辅助命令超时

        // 历史记录
        int history_size;
        int history_code_chars;

        // 安全限制
        uid_t run_uid;
        gid_t run_gid;
        int pids_limit;
        // 没有 cgroup 时 RLIMIT_NPROC 按 uid 计数, 每个槽位使用
        // [fallback_uid_base, fallback_uid_base + pool_size) 中独占的 uid
        uid_t fallback_uid_base;

        int server_port;
    };
    extern GlobalConfig g_runner_config;

    /**
     * @brief 从 YAML 文件加载配置 (未出现的字段保持默认值)
     * @return false 如果文件不存在或解析失败 (原因已写入 stderr)
     */
    bool LoadConfig(const std::string& path);

    /**
     * @brief 将 g_runner_config 恢复为内置默认值
     */
    void ResetConfigDefaults();

    // 以 '\0' 结尾的安全拷贝 (截断超长输入)
    void CopyString(char* dst, std::size_t dst_size, const std::string& src);

    /**
     * @brief namespace 后端子进程所需的参数 (C 风格结构体)
     * clone 之后的子进程只能读取这里的定长字段
     */
    struct NamespaceChildArgs {
        char root_dir[256];         // 新根目录 (宿主侧路径)
        char source_dir[256];       // staging 目录, 只读挂载到 /app
        char interpreter[256];      // 宿主解释器路径 (/usr/bin/python3)
        char entry[256];            // /app 下的入口文件 (相对路径)

        int timeout_ms;
        long long memory_limit_bytes;
        bool cgroup_enabled;        // false 时回退到 RLIMIT_AS
        uid_t run_uid;
        gid_t run_gid;
        int nproc_limit;            // 0: 不设置 RLIMIT_NPROC (由 cgroup pids.max 限制)
        long cpu_limit_sec;         // RLIMIT_CPU 软限制, 0 表示不设置

        int input_fd;    // 对应 stdin (/dev/null)
        int output_fd;   // 对应 stdout (管道写端)
        int error_fd;    // 对应 stderr (管道写端)
        int sync_fd;     // 父进程放行信号 (管道读端)
        int status_fd;   // 失败码回传 (管道写端, O_CLOEXEC)
    };

    /**
     * @brief 子进程在 exec 之前失败时写入状态管道的记录
     * exec 成功时管道因 O_CLOEXEC 被关闭, 父进程读到 EOF
     */
    struct ChildFailure {
        int code;           // SandboxExitCode
        int err;            // 失败时的 errno
        char step[48];      // 失败步骤, 例如 "pivot_root"
    };

    // SandboxExitCode 的可读描述
    const char* DescribeExitCode(int code);

} // namespace runbox

#endif // RUNBOX_SANDBOX_INTERNAL_H
