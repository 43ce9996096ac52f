#ifndef RUNBOX_SANDBOX_H
#define RUNBOX_SANDBOX_H

#include <string>

namespace runbox
{
    /**
     * @brief 任务的终止分类
     * COMPLETED 包含用户代码自身的非零退出 (RuntimeError), 由 exit_code 区分
     */
    enum class Termination {
        COMPLETED = 0,      // 进程在超时前自行退出
        TIMED_OUT,          // 看门狗先触发, 整个进程组被强杀
        RESOURCE_KILLED,    // 隔离层的内存限制杀死了进程 (OOM)
        LAUNCH_FAILED       // 隔离进程未能启动
    };

    // 非进程退出码的固定取值
    const int EXIT_CODE_TIMED_OUT = -1;
    const int EXIT_CODE_LAUNCH_FAILED = -3;
    const int EXIT_CODE_OOM_KILLED = 137;   // 128 + SIGKILL

    struct RunResult
    {
        std::string submission_id;
        Termination termination = Termination::COMPLETED;
        int exit_code = 0;
        std::string output;             // 捕获的 stdout
        std::string error;              // 捕获的 stderr 或诊断信息
        bool output_truncated = false;  // 任一输出流超出 max_output_bytes
        int time_used_ms = 0;           // 墙钟时间
    };

    /**
     * @brief 对外的结果分类名
     * Completed / RuntimeError / TimedOut / ResourceKilled / LaunchFailed
     */
    const char* ClassificationName(const RunResult& result);

    const char* TerminationName(Termination termination);

    // "Execution timed out after 10 seconds."
    std::string TimeoutMessage(int timeout_ms);

    // "Process killed (likely out of memory > 128m)."
    std::string OutOfMemoryMessage(long long memory_limit_bytes);
}

#endif // RUNBOX_SANDBOX_H
