#include <set>
#include <string>
#include <vector>

#include "task.h"
#include "history.h"
#include "sandbox_internal.h"
#include "test_util.h"

using namespace runbox;

namespace {

RunRequest Inline(const std::string& code, const std::string& language = "python") {
    RunRequest req;
    req.language = language;
    req.code = code;
    return req;
}

ArchiveRunRequest Archive(const std::string& bytes, const std::string& entry) {
    ArchiveRunRequest req;
    req.language = "python";
    req.archive_bytes = bytes;
    req.entry_point = entry;
    return req;
}

std::string Repeat(const std::string& unit, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) out += unit;
    return out;
}

void TestLanguages() {
    ValidationResult v = Validate(Inline("print(1)", ""));
    CHECK(v.ok);
    CHECK(v.task.language == Language::PYTHON);

    v = Validate(Inline("console.log(1)", "Node"));
    CHECK(v.ok);
    CHECK(v.task.language == Language::NODE);

    v = Validate(Inline("puts 1", "ruby"));
    CHECK(!v.ok);
    CHECK(v.error == ErrorKind::UNSUPPORTED_LANGUAGE);
    CHECK(CategoryOf(v.error) == ErrorCategory::VALIDATION_ERROR);
    CHECK(v.error_message.find("ruby") != std::string::npos);
}

void TestCodeLength() {
    ValidationResult v = Validate(Inline(Repeat("a", 5000)));
    CHECK(v.ok);

    v = Validate(Inline(Repeat("a", 5001)));
    CHECK(!v.ok);
    CHECK(v.error == ErrorKind::CODE_TOO_LONG);
    CHECK_EQ(v.error_message, std::string("Code is too long (max 5000 characters)."));

    // 按字符而不是字节计数: 5000 个汉字 (15000 字节) 仍然合法
    v = Validate(Inline(Repeat("\xe4\xb8\xad", 5000)));
    CHECK(v.ok);
    v = Validate(Inline(Repeat("\xe4\xb8\xad", 5001)));
    CHECK(v.error == ErrorKind::CODE_TOO_LONG);

    CHECK_EQ(CountCodePoints("a\xc3\xa9\xe4\xb8\xad\xf0\x9f\x98\x80"), std::size_t(4));
    // 截断的多字节序列按单字节计数
    CHECK_EQ(CountCodePoints("\xe4\xb8"), std::size_t(2));
}

void TestEmptySource() {
    ValidationResult v = Validate(Inline(""));
    CHECK(!v.ok);
    CHECK(v.error == ErrorKind::EMPTY_SOURCE);

    v = Validate(Inline("  \n\t "));
    CHECK(v.error == ErrorKind::EMPTY_SOURCE);
}

void TestSubmissionIds() {
    RunRequest req = Inline("print(1)");
    req.submission_id = "job_42-a";
    ValidationResult v = Validate(req);
    CHECK(v.ok);
    CHECK_EQ(v.task.submission_id, std::string("job_42-a"));

    req.submission_id = "../etc";
    v = Validate(req);
    CHECK(v.error == ErrorKind::INVALID_SUBMISSION_ID);

    req.submission_id = std::string(65, 'x');
    v = Validate(req);
    CHECK(v.error == ErrorKind::INVALID_SUBMISSION_ID);

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        std::string id = GenerateSubmissionId();
        CHECK(IsValidSubmissionId(id));
        seen.insert(id);
    }
    CHECK_EQ(seen.size(), std::size_t(200));
}

void TestLimitsFromConfig() {
    g_runner_config.timeout_ms = 2500;
    g_runner_config.memory_limit_mb = 64;
    ValidationResult v = Validate(Inline("print(1)"));
    CHECK(v.ok);
    CHECK_EQ(v.task.limits.timeout_ms, 2500);
    CHECK_EQ(v.task.limits.memory_limit_bytes, 64LL * 1024 * 1024);
    CHECK(!v.task.limits.network_enabled);
    CHECK(v.task.IsInline());
    ResetConfigDefaults();
}

void TestArchiveRequests() {
    ValidationResult v = Validate(Archive("", "main.py"));
    CHECK(v.error == ErrorKind::EMPTY_SOURCE);

    g_runner_config.max_archive_bytes = 8;
    v = Validate(Archive("123456789", "main.py"));
    CHECK(v.error == ErrorKind::ARCHIVE_TOO_LARGE);
    ResetConfigDefaults();

    const char* bad_entries[] = {"", "/main.py", "../main.py", "a/../../main.py", "a\\main.py", ".", "a/.."};
    for (const char* entry : bad_entries) {
        v = Validate(Archive("PK", entry));
        if (v.error != ErrorKind::INVALID_ENTRY_POINT) {
            runbox_test::ReportFailure(__FILE__, __LINE__, std::string("entry accepted: '") + entry + "'");
        }
    }

    v = Validate(Archive("PK", "pkg/main.py"));
    CHECK(v.ok);
    CHECK(!v.task.IsInline());
    CHECK_EQ(v.task.project().entry_point, std::string("pkg/main.py"));
    CHECK(v.task.project().project_dir.empty());

    TaskDescriptor with_dir = WithProjectDir(v.task, "/tmp/x/app");
    CHECK_EQ(with_dir.project().project_dir, std::string("/tmp/x/app"));
    CHECK_EQ(with_dir.project().entry_point, std::string("pkg/main.py"));
    CHECK_EQ(with_dir.submission_id, v.task.submission_id);

    CHECK(IsSafeRelativePath("a/./b/../main.py"));
}

void TestBatches() {
    BatchValidationResult b = ValidateBatch({});
    CHECK(!b.ok);
    CHECK(b.error == ErrorKind::EMPTY_BATCH);
    CHECK(CategoryOf(b.error) == ErrorCategory::VALIDATION_ERROR);
    CHECK_EQ(std::string(ErrorKindName(b.error)), std::string("EmptyBatch"));
    CHECK(b.tasks.empty());

    std::vector<RunRequest> too_many(21, Inline("print(1)"));
    b = ValidateBatch(too_many);
    CHECK(!b.ok);
    CHECK(b.error == ErrorKind::BATCH_TOO_LARGE);

    std::vector<RunRequest> twenty(20, Inline("print(1)"));
    b = ValidateBatch(twenty);
    CHECK(b.ok);
    CHECK_EQ(b.tasks.size(), std::size_t(20));

    // 任一任务不合法则整批拒绝
    std::vector<RunRequest> mixed = {Inline("print(1)"), Inline("print(2)"), Inline("x", "cobol")};
    b = ValidateBatch(mixed);
    CHECK(!b.ok);
    CHECK(b.tasks.empty());
    CHECK(b.error == ErrorKind::UNSUPPORTED_LANGUAGE);
    CHECK(b.error_message.rfind("Task 2: ", 0) == 0);
}

void TestHistoryStore() {
    HistoryStore history(3, 12);
    RunResult r;
    r.submission_id = "a";
    history.Record(Language::PYTHON, "print('hello world')", r);
    r.submission_id = "b";
    history.RecordArchive(Language::NODE, "src/index.js", r);
    r.submission_id = "c";
    history.Record(Language::PYTHON, Repeat("\xe4\xb8\xad", 13), r);
    r.submission_id = "d";
    history.Record(Language::PYTHON, "1", r);

    CHECK_EQ(history.size(), std::size_t(3));
    std::vector<HistoryEntry> recent = history.Recent();
    CHECK_EQ(recent.size(), std::size_t(3));
    CHECK_EQ(recent[0].result.submission_id, std::string("d"));
    CHECK_EQ(recent[1].result.submission_id, std::string("c"));
    CHECK_EQ(recent[2].result.submission_id, std::string("b"));
    // 按字符截断, 不切断多字节字符
    CHECK_EQ(CountCodePoints(recent[1].code), std::size_t(12));
    CHECK_EQ(recent[1].code.size(), std::size_t(36));
    CHECK(recent[2].code.rfind("[zip run] ", 0) == 0);
    CHECK(recent[2].language == Language::NODE);

    CHECK_EQ(history.Recent(1).size(), std::size_t(1));
    CHECK_EQ(TruncateCodePoints("hello world", 5), std::string("hello"));
}

}  // namespace

int main() {
    std::cout << "=== Task Validation Test ===" << std::endl;
    ResetConfigDefaults();

    runbox_test::RunCase("languages", TestLanguages);
    runbox_test::RunCase("code_length", TestCodeLength);
    runbox_test::RunCase("empty_source", TestEmptySource);
    runbox_test::RunCase("submission_ids", TestSubmissionIds);
    runbox_test::RunCase("limits_from_config", TestLimitsFromConfig);
    runbox_test::RunCase("archive_requests", TestArchiveRequests);
    runbox_test::RunCase("batches", TestBatches);
    runbox_test::RunCase("history_store", TestHistoryStore);

    return runbox_test::Summary("Task Validation Test");
}
