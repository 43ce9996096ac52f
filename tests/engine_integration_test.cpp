/**
 * @file engine_integration_test.cpp
 * @brief Runner 端到端测试
 *
 * docker 由 tests/fixtures/fake_docker.sh 代替: 容器命令直接在宿主机上运行,
 * 因此两种语言的解释器都配置为 sh, 用户代码是 shell 脚本。
 */
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "runner.h"
#include "sandbox_internal.h"
#include "subprocess.h"
#include "test_util.h"

using namespace runbox;
namespace fs = std::filesystem;

namespace {

fs::path g_root;
fs::path g_workspace;
fs::path g_docker_state;
fs::path g_fake_docker;

LanguageProfile& Profile(Language language) {
    return g_runner_config.languages[static_cast<int>(language)];
}

// 每个用例都从相同的配置开始
void ConfigureEngine() {
    ResetConfigDefaults();
    CopyString(g_runner_config.workspace_root, sizeof(g_runner_config.workspace_root), g_workspace.string());
    CopyString(g_runner_config.docker_bin, sizeof(g_runner_config.docker_bin), g_fake_docker.string());
    g_runner_config.backend = RuntimeBackend::DOCKER;
    g_runner_config.pool_size = 3;
    g_runner_config.timeout_ms = 5000;
    CopyString(Profile(Language::PYTHON).interpreter, sizeof(Profile(Language::PYTHON).interpreter), "sh");
    CopyString(Profile(Language::NODE).interpreter, sizeof(Profile(Language::NODE).interpreter), "sh");
}

RunRequest Inline(const std::string& code, const std::string& language = "python") {
    RunRequest req;
    req.language = language;
    req.code = code;
    return req;
}

// 结果返回之后 staging 目录与容器都必须已被清理
void ExpectNoLeftovers() {
    if (!runbox_test::DirIsEmpty(g_workspace)) {
        std::string left;
        for (const auto& e : fs::directory_iterator(g_workspace)) left += " " + e.path().filename().string();
        runbox_test::ReportFailure(__FILE__, __LINE__, "workspace not empty:" + left);
    }
    if (!runbox_test::DirIsEmpty(g_docker_state)) {
        std::string left;
        for (const auto& e : fs::directory_iterator(g_docker_state)) left += " " + e.path().filename().string();
        runbox_test::ReportFailure(__FILE__, __LINE__, "containers not removed:" + left);
    }
}

void TestCompleted() {
    ConfigureEngine();
    Runner runner;
    RunOutcome o = runner.Run(Inline("echo hello\necho oops >&2\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::COMPLETED);
    CHECK_EQ(o.result.exit_code, 0);
    CHECK_EQ(o.result.output, std::string("hello\n"));
    CHECK_EQ(o.result.error, std::string("oops\n"));
    CHECK(!o.result.output_truncated);
    CHECK_EQ(std::string(ClassificationName(o.result)), std::string("Completed"));
    CHECK(!o.result.submission_id.empty());
    ExpectNoLeftovers();
}

void TestRuntimeError() {
    ConfigureEngine();
    Runner runner;
    RunRequest req = Inline("echo partial\necho 'Traceback: boom' >&2\nexit 3\n");
    req.submission_id = "rt-error";
    RunOutcome o = runner.Run(req);
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::COMPLETED);
    CHECK_EQ(o.result.exit_code, 3);
    CHECK_EQ(o.result.submission_id, std::string("rt-error"));
    CHECK_EQ(o.result.output, std::string("partial\n"));
    CHECK_EQ(o.result.error, std::string("Traceback: boom\n"));
    CHECK_EQ(std::string(ClassificationName(o.result)), std::string("RuntimeError"));
    ExpectNoLeftovers();
}

void TestTimeout() {
    ConfigureEngine();
    g_runner_config.timeout_ms = 500;
    Runner runner;
    RunOutcome o = runner.Run(Inline("echo started\nsleep 30\necho never\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::TIMED_OUT);
    CHECK_EQ(o.result.exit_code, EXIT_CODE_TIMED_OUT);
    CHECK_EQ(o.result.error, std::string("Execution timed out after 0.5 seconds."));
    // 超时前已经写出的部分输出被保留
    CHECK_EQ(o.result.output, std::string("started\n"));
    CHECK(o.result.time_used_ms >= 500);
    CHECK(o.result.time_used_ms < 5000);
    ExpectNoLeftovers();
}

void TestBackgroundChildKilledOnTimeout() {
    ConfigureEngine();
    g_runner_config.timeout_ms = 500;
    fs::path pid_file = g_root / "bg-timeout.pid";
    Runner runner;
    RunOutcome o = runner.Run(Inline("sleep 60 &\necho $! > " + pid_file.string() + "\nsleep 60\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::TIMED_OUT);

    std::string pid_text = runbox_test::ReadFile(pid_file);
    CHECK(!pid_text.empty());
    if (!pid_text.empty()) {
        pid_t pid = static_cast<pid_t>(std::atol(pid_text.c_str()));
        CHECK(runbox_test::WaitProcessGone(pid, std::chrono::milliseconds(2000)));
    }
    ExpectNoLeftovers();
}

void TestBackgroundChildKilledOnExit() {
    ConfigureEngine();
    fs::path pid_file = g_root / "bg-exit.pid";
    Runner runner;
    // 后台进程继承了 stdout, 领头进程退出后必须被清理, 否则读端永远等不到 EOF
    RunOutcome o = runner.Run(Inline("sleep 60 &\necho $! > " + pid_file.string() + "\necho done\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::COMPLETED);
    CHECK_EQ(o.result.output, std::string("done\n"));
    CHECK(o.result.time_used_ms < 5000);

    std::string pid_text = runbox_test::ReadFile(pid_file);
    if (!pid_text.empty()) {
        pid_t pid = static_cast<pid_t>(std::atol(pid_text.c_str()));
        CHECK(runbox_test::WaitProcessGone(pid, std::chrono::milliseconds(2000)));
    } else {
        runbox_test::ReportFailure(__FILE__, __LINE__, "background pid file missing");
    }
    ExpectNoLeftovers();
}

void TestResourceKilled() {
    ConfigureEngine();
    Runner runner;
    RunOutcome o = runner.Run(Inline("echo allocating\nkill -9 $$\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::RESOURCE_KILLED);
    CHECK_EQ(o.result.exit_code, EXIT_CODE_OOM_KILLED);
    CHECK_EQ(o.result.error, std::string("Process killed (likely out of memory > 128m)."));
    CHECK_EQ(o.result.output, std::string("allocating\n"));
    CHECK_EQ(std::string(ClassificationName(o.result)), std::string("ResourceKilled"));

    // 容器内进程以 137 退出同样视为被资源限制杀死
    o = runner.Run(Inline("exit 137\n"));
    CHECK(o.result.termination == Termination::RESOURCE_KILLED);
    ExpectNoLeftovers();
}

// 容器内的程序正常退出, 但 docker 报告 State.OOMKilled
void TestResourceKilledByContainerState() {
    ConfigureEngine();
    CopyString(Profile(Language::PYTHON).image, sizeof(Profile(Language::PYTHON).image), "oom-image:latest");
    Runner runner;
    RunOutcome o = runner.Run(Inline("echo partial\nexit 1\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::RESOURCE_KILLED);
    CHECK_EQ(o.result.exit_code, EXIT_CODE_OOM_KILLED);
    CHECK_EQ(o.result.output, std::string("partial\n"));
    CHECK_EQ(o.result.error, std::string("Process killed (likely out of memory > 128m)."));
    ExpectNoLeftovers();
}

// docker start -a 失败 (OCI runtime 无法 exec 解释器): 用户代码从未运行
void TestContainerStartFailure() {
    ConfigureEngine();
    CopyString(Profile(Language::NODE).image, sizeof(Profile(Language::NODE).image), "noexec-image:latest");
    Runner runner;
    RunOutcome o = runner.Run(Inline("echo never\n", "node"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::LAUNCH_FAILED);
    CHECK_EQ(o.result.exit_code, EXIT_CODE_LAUNCH_FAILED);
    CHECK_EQ(std::string(ClassificationName(o.result)), std::string("LaunchFailed"));
    CHECK(o.result.error.rfind("Failed to start sandbox: OCI runtime create failed", 0) == 0);
    CHECK(o.result.error.find("executable file not found") != std::string::npos);
    CHECK(o.result.output.empty());
    CHECK_EQ(runner.slots().in_use(), 0);

    // 同一镜像之外的任务不受影响, 普通的非零退出仍是 RuntimeError
    o = runner.Run(Inline("exit 1\n"));
    CHECK(o.result.termination == Termination::COMPLETED);
    CHECK_EQ(o.result.exit_code, 1);
    ExpectNoLeftovers();
}

// RLIMIT_CPU 的 SIGXCPU 与看门狗同属超时
void TestCpuLimitSignalIsTimeout() {
    ConfigureEngine();
    Runner runner;
    RunOutcome o = runner.Run(Inline("echo spinning\nkill -s XCPU $$\nsleep 5\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::TIMED_OUT);
    CHECK_EQ(o.result.exit_code, EXIT_CODE_TIMED_OUT);
    CHECK_EQ(o.result.error, TimeoutMessage(g_runner_config.timeout_ms));
    CHECK_EQ(o.result.output, std::string("spinning\n"));
    CHECK_EQ(std::string(ClassificationName(o.result)), std::string("TimedOut"));
    ExpectNoLeftovers();
}

void TestLargeOutputBothStreams() {
    ConfigureEngine();
    Runner runner;
    // 两个流都远大于管道缓冲区 (64 KiB)
    RunOutcome o = runner.Run(Inline(
        "head -c 300000 /dev/zero | tr '\\000' a\n"
        "head -c 300000 /dev/zero | tr '\\000' b >&2\n"
        "head -c 300000 /dev/zero | tr '\\000' c\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::COMPLETED);
    CHECK_EQ(o.result.output.size(), std::size_t(600000));
    CHECK_EQ(o.result.error.size(), std::size_t(300000));
    CHECK(!o.result.output_truncated);
    ExpectNoLeftovers();
}

void TestOutputTruncated() {
    ConfigureEngine();
    g_runner_config.max_output_bytes = 1000;
    Runner runner;
    RunOutcome o = runner.Run(Inline("head -c 200000 /dev/zero | tr '\\000' x\necho tail >&2\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::COMPLETED);
    CHECK_EQ(o.result.exit_code, 0);
    CHECK(o.result.output_truncated);
    CHECK(o.result.output.size() <= 1000);
    CHECK_EQ(o.result.error, std::string("tail\n"));
    ExpectNoLeftovers();
}

void TestBatchOrder() {
    ConfigureEngine();
    Runner runner;
    std::vector<RunRequest> batch;
    for (int i = 0; i < 6; ++i) {
        // 前面的任务更慢
        batch.push_back(Inline("sleep 0." + std::to_string(6 - i) + "\necho task" + std::to_string(i) + "\n"));
    }
    batch.push_back(Inline("exit 2\n"));

    BatchOutcome b = runner.RunBatch(batch);
    CHECK(b.ok);
    CHECK_EQ(b.results.size(), batch.size());
    std::set<std::string> ids;
    for (int i = 0; i < 6 && i < static_cast<int>(b.results.size()); ++i) {
        CHECK(b.results[i].termination == Termination::COMPLETED);
        CHECK_EQ(b.results[i].output, "task" + std::to_string(i) + "\n");
        ids.insert(b.results[i].submission_id);
    }
    if (b.results.size() == batch.size()) {
        CHECK_EQ(b.results[6].exit_code, 2);
        ids.insert(b.results[6].submission_id);
    }
    CHECK_EQ(ids.size(), batch.size());
    // 同时运行的沙箱数不超过槽位数
    CHECK(runner.slots().high_water_mark() <= 3);
    CHECK_EQ(runner.slots().in_use(), 0);
    ExpectNoLeftovers();
}

void TestBatchLaunchErrorIsolated() {
    ConfigureEngine();
    CopyString(Profile(Language::NODE).image, sizeof(Profile(Language::NODE).image), "missing-image:latest");
    Runner runner;
    BatchOutcome b = runner.RunBatch({
        Inline("echo first\n"),
        Inline("echo second\n", "node"),
        Inline("echo third\n"),
    });
    CHECK(b.ok);
    CHECK_EQ(b.results.size(), std::size_t(3));
    if (b.results.size() == 3) {
        CHECK_EQ(b.results[0].output, std::string("first\n"));
        CHECK(b.results[1].termination == Termination::LAUNCH_FAILED);
        CHECK_EQ(b.results[1].exit_code, EXIT_CODE_LAUNCH_FAILED);
        CHECK(b.results[1].error.rfind("Failed to start sandbox: docker create failed (exit 125)", 0) == 0);
        CHECK_EQ(std::string(ClassificationName(b.results[1])), std::string("LaunchFailed"));
        CHECK_EQ(b.results[2].output, std::string("third\n"));
    }
    ExpectNoLeftovers();
}

void TestRuntimeUnavailable() {
    ConfigureEngine();
    CopyString(g_runner_config.docker_bin, sizeof(g_runner_config.docker_bin), (g_root / "no-such-docker").string());
    Runner runner;
    RunOutcome o = runner.Run(Inline("echo hi\n"));
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::LAUNCH_FAILED);
    CHECK_EQ(o.result.exit_code, EXIT_CODE_LAUNCH_FAILED);
    CHECK(o.result.error.find("container runtime unavailable") != std::string::npos);
    CHECK_EQ(runner.slots().in_use(), 0);
    ExpectNoLeftovers();
}

void TestRejectedBeforeLaunch() {
    ConfigureEngine();
    Runner runner;

    RunOutcome o = runner.Run(Inline(std::string(5001, 'x')));
    CHECK(!o.ok);
    CHECK(o.error == ErrorKind::CODE_TOO_LONG);

    o = runner.Run(Inline("echo hi", "ruby"));
    CHECK(o.error == ErrorKind::UNSUPPORTED_LANGUAGE);

    std::vector<RunRequest> too_many(21, Inline("echo hi\n"));
    BatchOutcome b = runner.RunBatch(too_many);
    CHECK(!b.ok);
    CHECK(b.error == ErrorKind::BATCH_TOO_LARGE);
    CHECK(b.results.empty());

    b = runner.RunBatch({Inline("echo ok\n"), Inline(std::string(5001, 'x'))});
    CHECK(!b.ok);
    CHECK(b.error == ErrorKind::CODE_TOO_LONG);

    b = runner.RunBatch({});
    CHECK(!b.ok);
    CHECK(b.error == ErrorKind::EMPTY_BATCH);
    CHECK(b.results.empty());

    // 被拒绝的请求不会启动任何沙箱
    CHECK_EQ(runner.launcher().LaunchCount(), std::uint64_t(0));
    CHECK_EQ(runner.slots().high_water_mark(), 0);
    ExpectNoLeftovers();
}

void TestArchiveRun() {
    ConfigureEngine();
    Runner runner;

    runbox_test::ZipWriter zip;
    zip.AddFile("main.py", "cat lib/data.txt\nls lib\n");
    zip.AddFile("lib/data.txt", "from archive\n");
    std::string bytes = zip.Finish();

    ArchiveRunRequest req;
    req.language = "python";
    req.archive_bytes = bytes;
    req.entry_point = "main.py";
    RunOutcome o = runner.RunArchive(req);
    CHECK(o.ok);
    CHECK(o.result.termination == Termination::COMPLETED);
    CHECK_EQ(o.result.output, std::string("from archive\ndata.txt\n"));
    ExpectNoLeftovers();

    std::uint64_t launches = runner.launcher().LaunchCount();
    req.entry_point = "missing.py";
    o = runner.RunArchive(req);
    CHECK(!o.ok);
    CHECK(o.error == ErrorKind::ENTRY_POINT_NOT_FOUND);
    CHECK(CategoryOf(o.error) == ErrorCategory::PREP_ERROR);
    CHECK_EQ(runner.launcher().LaunchCount(), launches);
    ExpectNoLeftovers();

    req.entry_point = "../main.py";
    o = runner.RunArchive(req);
    CHECK(o.error == ErrorKind::INVALID_ENTRY_POINT);
    CHECK_EQ(runner.launcher().LaunchCount(), launches);
    ExpectNoLeftovers();
}

void TestHistoryRecording() {
    ConfigureEngine();
    HistoryStore history(10, 2000);
    Runner runner(&history);

    RunRequest req = Inline("echo recorded\n");
    req.submission_id = "hist-1";
    RunOutcome o = runner.Run(req);
    CHECK(o.ok);

    // 被拒绝的请求不记录
    runner.Run(Inline(std::string(5001, 'x')));

    BatchOutcome b = runner.RunBatch({Inline("echo a\n"), Inline("echo b\n")});
    CHECK(b.ok);

    CHECK_EQ(history.size(), std::size_t(3));
    std::vector<HistoryEntry> recent = history.Recent();
    bool found = false;
    for (const auto& e : recent) {
        if (e.result.submission_id == "hist-1") {
            found = true;
            CHECK_EQ(e.code, std::string("echo recorded\n"));
            CHECK_EQ(e.result.output, std::string("recorded\n"));
            CHECK(e.language == Language::PYTHON);
        }
    }
    CHECK(found);
    ExpectNoLeftovers();
}

}  // namespace

int main() {
    std::cout << "=== Engine Integration Test ===" << std::endl;
    // 向已退出的子进程写管道时不能让测试进程被 SIGPIPE 杀死
    std::signal(SIGPIPE, SIG_IGN);

    g_root = runbox_test::MakeTempDir("engine");
    g_workspace = g_root / "workspace";
    g_docker_state = g_root / "docker-state";
    g_fake_docker = g_root / "docker";
    fs::create_directories(g_docker_state);

    std::error_code ec;
    fs::copy_file(fs::path(RUNBOX_TEST_FIXTURES_DIR) / "fake_docker.sh", g_fake_docker,
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::cerr << RED << "Cannot copy fake docker: " << ec.message() << RESET << std::endl;
        return 1;
    }
    fs::permissions(g_fake_docker, fs::perms::owner_all, fs::perm_options::add, ec);
    setenv("FAKE_DOCKER_STATE", g_docker_state.c_str(), 1);

    runbox_test::RunCase("completed", TestCompleted);
    runbox_test::RunCase("runtime_error", TestRuntimeError);
    runbox_test::RunCase("timeout", TestTimeout);
    runbox_test::RunCase("background_child_killed_on_timeout", TestBackgroundChildKilledOnTimeout);
    runbox_test::RunCase("background_child_killed_on_exit", TestBackgroundChildKilledOnExit);
    runbox_test::RunCase("resource_killed", TestResourceKilled);
    runbox_test::RunCase("resource_killed_by_container_state", TestResourceKilledByContainerState);
    runbox_test::RunCase("container_start_failure", TestContainerStartFailure);
    runbox_test::RunCase("cpu_limit_signal_is_timeout", TestCpuLimitSignalIsTimeout);
    runbox_test::RunCase("large_output_both_streams", TestLargeOutputBothStreams);
    runbox_test::RunCase("output_truncated", TestOutputTruncated);
    runbox_test::RunCase("batch_order", TestBatchOrder);
    runbox_test::RunCase("batch_launch_error_isolated", TestBatchLaunchErrorIsolated);
    runbox_test::RunCase("runtime_unavailable", TestRuntimeUnavailable);
    runbox_test::RunCase("rejected_before_launch", TestRejectedBeforeLaunch);
    runbox_test::RunCase("history_recording", TestHistoryRecording);

    CommandResult unzip = RunCommand({"unzip", "-v"}, 5000);
    if (unzip.started && unzip.exit_code == 0) {
        runbox_test::RunCase("archive_run", TestArchiveRun);
    } else {
        std::cout << YELLOW << "[SKIP] archive_run: unzip is not available" << RESET << std::endl;
    }

    fs::remove_all(g_root, ec);
    return runbox_test::Summary("Engine Integration Test");
}
