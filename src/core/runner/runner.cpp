#include "runner.h"
#include "sandbox_internal.h"
#include "supervisor.h"

#include <iostream>

namespace runbox
{
    Runner::Runner(HistoryStore* history)
        : history_(history)
        , slots_(g_runner_config.pool_size)
        , preparer_(g_runner_config.workspace_root)
        , scheduler_(g_runner_config.pool_size)
    {
    }

    RunOutcome Runner::Run(const RunRequest& request)
    {
        RunOutcome outcome;
        ValidationResult v = Validate(request);
        if (!v.ok) {
            outcome.error = v.error;
            outcome.error_message = v.error_message;
            return outcome;
        }

        outcome.result = Execute(v.task);
        outcome.ok = true;
        if (history_) history_->Record(v.task.language, request.code, outcome.result);
        return outcome;
    }

    RunOutcome Runner::RunArchive(const ArchiveRunRequest& request)
    {
        RunOutcome outcome;
        ValidationResult v = Validate(request);
        if (!v.ok) {
            outcome.error = v.error;
            outcome.error_message = v.error_message;
            return outcome;
        }

        PrepareResult prepared = preparer_.Prepare(v.task.submission_id, request.archive_bytes,
                                                   v.task.project().entry_point);
        if (!prepared.ok) {
            outcome.error = prepared.error;
            outcome.error_message = prepared.error_message;
            return outcome;
        }

        TaskDescriptor task = WithProjectDir(v.task, prepared.project_dir);
        SlotLease lease = slots_.Acquire();
        outcome.result = LaunchAndSupervise(task, std::move(prepared), std::move(lease));
        outcome.ok = true;
        if (history_) history_->RecordArchive(task.language, task.project().entry_point, outcome.result);
        return outcome;
    }

    BatchOutcome Runner::RunBatch(const std::vector<RunRequest>& requests)
    {
        BatchOutcome outcome;
        BatchValidationResult batch = ValidateBatch(requests);
        if (!batch.ok) {
            outcome.error = batch.error;
            outcome.error_message = batch.error_message;
            return outcome;
        }

        std::cerr << "[Runner] batch of " << batch.tasks.size() << " tasks" << std::endl;
        outcome.results = scheduler_.Run(batch.tasks.size(), [this, &batch, &requests](std::size_t i) {
            RunResult result = Execute(batch.tasks[i]);
            if (history_) history_->Record(batch.tasks[i].language, requests[i].code, result);
            return result;
        });
        for (std::size_t i = 0; i < outcome.results.size(); ++i) {
            if (outcome.results[i].submission_id.empty()) {
                outcome.results[i].submission_id = batch.tasks[i].submission_id;
            }
        }
        outcome.ok = true;
        return outcome;
    }

    RunResult Runner::Execute(const TaskDescriptor& task)
    {
        if (!task.IsInline()) {
            return ExecutionSupervisor::LaunchFailed(task.submission_id, "project task has no prepared staging directory");
        }
        SlotLease lease = slots_.Acquire();

        const LanguageProfile& profile = g_runner_config.languages[static_cast<int>(task.language)];
        PrepareResult prepared = preparer_.MaterializeInline(task.submission_id, task.code(), profile.source_file);
        if (!prepared.ok) {
            return ExecutionSupervisor::LaunchFailed(task.submission_id, prepared.error_message);
        }
        return LaunchAndSupervise(task, std::move(prepared), std::move(lease));
    }

    RunResult Runner::LaunchAndSupervise(const TaskDescriptor& task, PrepareResult prepared, SlotLease lease)
    {
        ExecutionSpec spec;
        std::string error;
        if (!launcher_.BuildSpec(task, prepared.project_dir, spec, error)) {
            return ExecutionSupervisor::LaunchFailed(task.submission_id, error);
        }

        LaunchResult launched = launcher_.Launch(spec);
        if (!launched.ok) {
            return ExecutionSupervisor::LaunchFailed(task.submission_id, launched.error_message);
        }

        ExecutionSupervisor supervisor(launcher_,
                                       task.submission_id,
                                       std::move(launched.process),
                                       task.limits,
                                       static_cast<std::size_t>(g_runner_config.max_output_bytes),
                                       std::move(prepared.staging),
                                       std::move(lease));
        return supervisor.Supervise();
    }
}
