#include <filesystem>
#include <string>

#include <sys/stat.h>

#include "archive.h"
#include "sandbox_internal.h"
#include "subprocess.h"
#include "test_util.h"

using namespace runbox;
namespace fs = std::filesystem;

namespace {

fs::path g_workspace;

// 每个用例结束后 workspace 里不应残留任何 staging 目录
void ExpectWorkspaceEmpty() {
    if (!runbox_test::DirIsEmpty(g_workspace)) {
        std::string left;
        for (const auto& e : fs::directory_iterator(g_workspace)) left += " " + e.path().filename().string();
        runbox_test::ReportFailure(__FILE__, __LINE__, "staging left behind:" + left);
    }
}

std::string ProjectZip() {
    runbox_test::ZipWriter zip;
    zip.AddFile("main.py", "from pkg import util\nprint(util.VALUE)\n");
    zip.AddFile("pkg/__init__.py", "");
    zip.AddFile("pkg/util.py", "VALUE = 42\n");
    return zip.Finish();
}

void TestPrepareProject() {
    ArchivePreparer preparer(g_workspace.string());
    {
        PrepareResult r = preparer.Prepare("proj", ProjectZip(), "main.py");
        CHECK(r.ok);
        CHECK(r.error == ErrorKind::NONE);
        CHECK(r.staging.valid());
        fs::path app(r.project_dir);
        CHECK_EQ(app.filename().string(), std::string("app"));
        CHECK(fs::is_regular_file(app / "main.py"));
        CHECK_EQ(runbox_test::ReadFile(app / "pkg" / "util.py"), std::string("VALUE = 42\n"));
        // 上传的 zip 解压后即被删除
        CHECK(!fs::exists(r.staging.path() / "upload.zip"));
        // staging 目录位于 workspace 之下, 名字以提交 ID 开头
        CHECK_EQ(fs::canonical(r.staging.path().parent_path()), fs::canonical(g_workspace));
        CHECK(r.staging.path().filename().string().rfind("proj-", 0) == 0);

        // 非特权用户可读
        struct stat st;
        CHECK(stat((app / "pkg" / "util.py").c_str(), &st) == 0);
        CHECK((st.st_mode & S_IROTH) != 0);
        CHECK(stat((app / "pkg").c_str(), &st) == 0);
        CHECK((st.st_mode & S_IXOTH) != 0);

        fs::path staging_path = r.staging.path();
        r.staging.Release();
        CHECK(!fs::exists(staging_path));
        r.staging.Release();    // 第二次为空操作
    }
    ExpectWorkspaceEmpty();
}

void TestNestedEntryPoint() {
    ArchivePreparer preparer(g_workspace.string());
    {
        PrepareResult r = preparer.Prepare("nested", ProjectZip(), "pkg/util.py");
        CHECK(r.ok);
        CHECK(fs::is_regular_file(fs::path(r.project_dir) / "pkg/util.py"));
    }
    ExpectWorkspaceEmpty();
}

void TestConcurrentSameId() {
    ArchivePreparer preparer(g_workspace.string());
    {
        PrepareResult a = preparer.Prepare("same", ProjectZip(), "main.py");
        PrepareResult b = preparer.Prepare("same", ProjectZip(), "main.py");
        CHECK(a.ok && b.ok);
        CHECK(a.staging.path() != b.staging.path());
    }
    ExpectWorkspaceEmpty();
}

void TestMissingEntryPoint() {
    ArchivePreparer preparer(g_workspace.string());
    PrepareResult r = preparer.Prepare("missing", ProjectZip(), "nope.py");
    CHECK(!r.ok);
    CHECK(r.error == ErrorKind::ENTRY_POINT_NOT_FOUND);
    CHECK(CategoryOf(r.error) == ErrorCategory::PREP_ERROR);
    CHECK_EQ(r.error_message, std::string("Entry point 'nope.py' not found in archive."));
    CHECK(!r.staging.valid());
    ExpectWorkspaceEmpty();

    // 目录不能作为入口
    r = preparer.Prepare("dir-entry", ProjectZip(), "pkg");
    CHECK(r.error == ErrorKind::ENTRY_POINT_NOT_FOUND);
    ExpectWorkspaceEmpty();
}

void TestPathTraversal() {
    ArchivePreparer preparer(g_workspace.string());
    runbox_test::ZipWriter zip;
    zip.AddFile("main.py", "print(1)\n");
    zip.AddFile("../../escaped_by_zip.py", "print('pwned')\n");

    PrepareResult r = preparer.Prepare("traversal", zip.Finish(), "main.py");
    CHECK(!r.ok);
    CHECK(r.error == ErrorKind::UNSAFE_ARCHIVE);
    CHECK(!fs::exists(g_workspace / "escaped_by_zip.py"));
    CHECK(!fs::exists(g_workspace.parent_path() / "escaped_by_zip.py"));
    ExpectWorkspaceEmpty();

    runbox_test::ZipWriter abs;
    abs.AddFile("/tmp/escaped_abs.py", "print('pwned')\n");
    r = preparer.Prepare("absolute", abs.Finish(), "main.py");
    CHECK(r.error == ErrorKind::UNSAFE_ARCHIVE);
    ExpectWorkspaceEmpty();
}

void TestSymlinkEscape() {
    ArchivePreparer preparer(g_workspace.string());
    runbox_test::ZipWriter zip;
    zip.AddFile("main.py", "print(open('secret').read())\n");
    zip.AddSymlink("secret", "/etc/passwd");

    PrepareResult r = preparer.Prepare("symlink", zip.Finish(), "main.py");
    CHECK(!r.ok);
    CHECK(r.error == ErrorKind::UNSAFE_ARCHIVE);
    ExpectWorkspaceEmpty();

    // 指向根目录之内的链接是允许的
    runbox_test::ZipWriter inner;
    inner.AddFile("real.py", "print(1)\n");
    inner.AddSymlink("main.py", "real.py");
    PrepareResult ok = preparer.Prepare("symlink-inner", inner.Finish(), "main.py");
    CHECK(ok.ok);
}

void TestCorruptArchive() {
    ArchivePreparer preparer(g_workspace.string());
    PrepareResult r = preparer.Prepare("corrupt", "this is not a zip file at all", "main.py");
    CHECK(!r.ok);
    CHECK(r.error == ErrorKind::BAD_ARCHIVE);
    ExpectWorkspaceEmpty();
}

void TestEntryNames() {
    CHECK(ArchivePreparer::IsSafeEntryName("main.py"));
    CHECK(ArchivePreparer::IsSafeEntryName("pkg/"));
    CHECK(ArchivePreparer::IsSafeEntryName("a/../b.py"));
    CHECK(!ArchivePreparer::IsSafeEntryName(""));
    CHECK(!ArchivePreparer::IsSafeEntryName("/etc/passwd"));
    CHECK(!ArchivePreparer::IsSafeEntryName("../x.py"));
    CHECK(!ArchivePreparer::IsSafeEntryName("a/../../x.py"));
    CHECK(!ArchivePreparer::IsSafeEntryName("a\\x.py"));
    CHECK(!ArchivePreparer::IsSafeEntryName("C:x.py"));
}

void TestMaterializeInline() {
    ArchivePreparer preparer(g_workspace.string());
    {
        PrepareResult r = preparer.MaterializeInline("inline", "print('hi')\n", "user_code.py");
        CHECK(r.ok);
        fs::path file = fs::path(r.project_dir) / "user_code.py";
        CHECK_EQ(runbox_test::ReadFile(file), std::string("print('hi')\n"));
        struct stat st;
        CHECK(stat(file.c_str(), &st) == 0);
        CHECK((st.st_mode & S_IROTH) != 0);
    }
    ExpectWorkspaceEmpty();
}

}  // namespace

int main() {
    std::cout << "=== Archive Preparer Test ===" << std::endl;
    ResetConfigDefaults();

    CommandResult check = RunCommand({g_runner_config.unzip_bin, "-v"}, 5000);
    if (!check.started || check.exit_code != 0) {
        std::cout << YELLOW << "[SKIP] unzip is not available: " << check.error_message << RESET << std::endl;
        return 77;
    }

    fs::path root = runbox_test::MakeTempDir("archive");
    g_workspace = root / "workspace";

    runbox_test::RunCase("prepare_project", TestPrepareProject);
    runbox_test::RunCase("nested_entry_point", TestNestedEntryPoint);
    runbox_test::RunCase("concurrent_same_id", TestConcurrentSameId);
    runbox_test::RunCase("missing_entry_point", TestMissingEntryPoint);
    runbox_test::RunCase("path_traversal", TestPathTraversal);
    runbox_test::RunCase("symlink_escape", TestSymlinkEscape);
    runbox_test::RunCase("corrupt_archive", TestCorruptArchive);
    runbox_test::RunCase("entry_names", TestEntryNames);
    runbox_test::RunCase("materialize_inline", TestMaterializeInline);

    std::error_code ec;
    fs::remove_all(root, ec);
    return runbox_test::Summary("Archive Preparer Test");
}
