#ifndef RUNBOX_RUNNER_H
#define RUNBOX_RUNNER_H

#include "archive.h"
#include "history.h"
#include "launcher.h"
#include "sandbox.h"
#include "scheduler.h"
#include "task.h"

#include <string>
#include <vector>

namespace runbox
{
    /**
     * @brief 单个请求的处理结果
     * ok == false 表示请求在启动任何沙箱之前被拒绝 (ValidationError / PrepError);
     * 启动失败 (LaunchError) 作为 Termination::LAUNCH_FAILED 放在 result 中
     */
    struct RunOutcome {
        bool ok = false;
        RunResult result;
        ErrorKind error = ErrorKind::NONE;
        std::string error_message;
    };

    struct BatchOutcome {
        bool ok = false;
        std::vector<RunResult> results;     // 与输入等长且顺序一致
        ErrorKind error = ErrorKind::NONE;
        std::string error_message;
    };

    /**
     * @brief 执行引擎入口
     * 单任务 / archive / 批量三条流水线共享同一个槽位池与启动器。
     * 读取 g_runner_config, 构造前应先 LoadConfig。
     */
    class Runner
    {
    public:
        /**
         * @param history 可选的历史记录, 每个完成的任务写入一条
         * @throw std::runtime_error 如果无法创建 workspace_root
         */
        explicit Runner(HistoryStore* history = nullptr);

        Runner(const Runner&) = delete;
        Runner& operator=(const Runner&) = delete;

        RunOutcome Run(const RunRequest& request);
        RunOutcome RunArchive(const ArchiveRunRequest& request);

        /**
         * @brief 批量执行; 超过 max_batch_size 或任一任务校验失败时整批拒绝
         */
        BatchOutcome RunBatch(const std::vector<RunRequest>& requests);

        /**
         * @brief 已校验的内联任务的完整流水线:
         * 获取槽位 -> 写入 staging -> 启动 -> 监督 -> Finalize
         */
        RunResult Execute(const TaskDescriptor& task);

        SandboxLauncher& launcher() { return launcher_; }
        SlotPool& slots() { return slots_; }
        ArchivePreparer& preparer() { return preparer_; }

    private:
        RunResult LaunchAndSupervise(const TaskDescriptor& task, PrepareResult prepared, SlotLease lease);

        HistoryStore* history_;
        SlotPool slots_;
        ArchivePreparer preparer_;
        SandboxLauncher launcher_;
        BatchScheduler scheduler_;
    };
}

#endif // RUNBOX_RUNNER_H
