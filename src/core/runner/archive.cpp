#include "archive.h"
#include "sandbox_internal.h"
#include "subprocess.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace runbox
{
    namespace fs = std::filesystem;

    namespace {

        const char* const kArchiveName = "upload.zip";
        const char* const kProjectDirName = "app";

        PrepareResult Fail(ErrorKind kind, std::string message)
        {
            PrepareResult result;
            result.ok = false;
            result.error = kind;
            result.error_message = std::move(message);
            return result;
        }

        // p 规范化之后是否仍位于 root 之内 (root 需已规范化)
        bool IsWithin(const fs::path& root, const fs::path& p)
        {
            std::error_code ec;
            fs::path resolved = fs::weakly_canonical(p, ec);
            if (ec) return false;
            auto r = root.begin();
            auto q = resolved.begin();
            for (; r != root.end(); ++r, ++q) {
                if (q == resolved.end() || *r != *q) return false;
            }
            return true;
        }

        // 沙箱内的非特权用户需要读取 /app 下的所有文件
        void GrantReadAccess(const fs::path& dir)
        {
            std::error_code ec;
            const fs::perms dir_perms = fs::perms::owner_all |
                                        fs::perms::group_read | fs::perms::group_exec |
                                        fs::perms::others_read | fs::perms::others_exec;
            fs::permissions(dir, dir_perms, fs::perm_options::add, ec);
            for (auto it = fs::recursive_directory_iterator(dir, ec);
                 !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            {
                std::error_code sec;
                fs::file_status st = it->symlink_status(sec);
                if (sec || fs::is_symlink(st)) continue;
                if (fs::is_directory(st)) {
                    fs::permissions(it->path(), dir_perms, fs::perm_options::add, sec);
                } else {
                    fs::permissions(it->path(),
                                    fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read,
                                    fs::perm_options::add, sec);
                }
            }
        }

        bool WriteFile(const fs::path& path, const std::string& content, std::string& error)
        {
            std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
            if (!ofs) {
                error = "无法打开文件进行写入: " + path.string();
                return false;
            }
            ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
            if (!ofs.good()) {
                error = "写入文件时发生 I/O 错误: " + path.string();
                return false;
            }
            return true;
        }

        std::string FirstLine(const std::string& text)
        {
            std::string t = Trim(text);
            std::size_t nl = t.find('\n');
            return nl == std::string::npos ? t : t.substr(0, nl);
        }

    } // anonymous namespace

    // ========================================================================
    // StagingDir
    // ========================================================================

    void StagingDir::Release()
    {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            std::cerr << "[Archive] Cleanup Warning: Failed to remove " << path_ << ": " << ec.message() << std::endl;
        }
        path_.clear();
    }

    // ========================================================================
    // ArchivePreparer
    // ========================================================================

    ArchivePreparer::ArchivePreparer(const std::string& workspace_root)
        : workspace_root_(workspace_root)
    {
        std::error_code ec;
        fs::create_directories(workspace_root_, ec);
        if (ec) {
            throw std::runtime_error("ArchivePreparer 初始化失败: 无法创建工作区 '" +
                                     workspace_root + "': " + ec.message());
        }
    }

    bool ArchivePreparer::CreateStaging(const std::string& submission_id, StagingDir& out, std::string& error)
    {
        // mkdtemp 保证同一 submission_id 的并发任务也不会共用目录
        std::string tmpl = (workspace_root_ / (submission_id + "-XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            error = FormatSystemError("mkdtemp " + tmpl);
            return false;
        }
        out = StagingDir(fs::path(buf.data()));

        std::error_code ec;
        fs::create_directory(out.path() / kProjectDirName, ec);
        if (ec) {
            error = "无法创建项目目录: " + ec.message();
            return false;
        }
        return true;
    }

    bool ArchivePreparer::IsSafeEntryName(const std::string& name)
    {
        if (name.empty()) return false;
        if (name.front() == '/') return false;
        if (name.find('\\') != std::string::npos) return false;
        // "C:foo" 之类的盘符前缀
        if (name.size() >= 2 && name[1] == ':') return false;

        int depth = 0;
        std::istringstream iss(name);
        std::string part;
        while (std::getline(iss, part, '/'))
        {
            if (part.empty() || part == ".") continue;
            if (part == "..") {
                if (--depth < 0) return false;
                continue;
            }
            ++depth;
        }
        return true;
    }

    bool ArchivePreparer::ListEntries(const fs::path& archive,
                                      std::vector<std::string>& entries,
                                      std::string& error)
    {
        CommandResult listed = RunCommand({g_runner_config.unzip_bin, "-Z1", archive.string()},
                                          g_runner_config.create_timeout_ms,
                                          static_cast<std::size_t>(g_runner_config.max_archive_bytes));
        if (!listed.started) {
            error = listed.error_message;
            return false;
        }
        if (listed.timed_out) {
            error = "listing archive timed out";
            return false;
        }
        if (listed.exit_code != 0) {
            std::string detail = FirstLine(listed.err.empty() ? listed.out : listed.err);
            error = "unzip -Z1 exited with " + std::to_string(listed.exit_code) +
                    (detail.empty() ? "" : ": " + detail);
            return false;
        }

        entries.clear();
        std::istringstream iss(listed.out);
        std::string line;
        while (std::getline(iss, line))
        {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) entries.push_back(line);
        }
        return true;
    }

    PrepareResult ArchivePreparer::Prepare(const std::string& submission_id,
                                           const std::string& archive_bytes,
                                           const std::string& entry_point)
    {
        StagingDir staging;
        std::string error;
        if (!CreateStaging(submission_id, staging, error)) {
            std::cerr << "[Archive] " << submission_id << ": " << error << std::endl;
            return Fail(ErrorKind::STAGING_FAILED, "Failed to create staging directory: " + error);
        }

        const fs::path archive_path = staging.path() / kArchiveName;
        const fs::path project_dir = staging.path() / kProjectDirName;

        if (!WriteFile(archive_path, archive_bytes, error)) {
            return Fail(ErrorKind::STAGING_FAILED, error);
        }

        // 1. 解压前先检查条目名, 拒绝绝对路径与 ../ 逃逸
        std::vector<std::string> entries;
        if (!ListEntries(archive_path, entries, error)) {
            std::cerr << "[Archive] " << submission_id << ": 无法读取 archive: " << error << std::endl;
            return Fail(ErrorKind::BAD_ARCHIVE, "Invalid or corrupt zip archive: " + error);
        }
        for (const auto& name : entries) {
            if (!IsSafeEntryName(name)) {
                std::cerr << "[Security] " << submission_id << ": archive 条目越界 '" << name << "'" << std::endl;
                return Fail(ErrorKind::UNSAFE_ARCHIVE, "Archive entry escapes the project root: " + name);
            }
        }

        // 2. 解压 (unzip 退出码 1 只是警告)
        CommandResult extracted = RunCommand(
            {g_runner_config.unzip_bin, "-q", "-o", archive_path.string(), "-d", project_dir.string()},
            g_runner_config.create_timeout_ms);
        if (!extracted.started) {
            return Fail(ErrorKind::STAGING_FAILED, "Failed to run unzip: " + extracted.error_message);
        }
        if (extracted.timed_out) {
            return Fail(ErrorKind::BAD_ARCHIVE, "Extracting archive timed out.");
        }
        if (extracted.exit_code != 0 && extracted.exit_code != 1) {
            std::string detail = FirstLine(extracted.err.empty() ? extracted.out : extracted.err);
            return Fail(ErrorKind::BAD_ARCHIVE, "Failed to extract zip archive (unzip exit " +
                        std::to_string(extracted.exit_code) + ")" + (detail.empty() ? "" : ": " + detail));
        }

        std::error_code ec;
        if (!fs::remove(archive_path, ec) || ec) {
            std::cerr << "[Archive] Cleanup Warning: Failed to remove " << archive_path << ": "
                      << ec.message() << std::endl;
            ec.clear();
        }

        // 3. 符号链接必须指向根目录之内
        fs::path root = fs::canonical(project_dir, ec);
        if (ec) {
            return Fail(ErrorKind::STAGING_FAILED, "Failed to resolve project directory: " + ec.message());
        }
        for (auto it = fs::recursive_directory_iterator(root, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            std::error_code sec;
            if (it->is_symlink(sec) && !IsWithin(root, it->path())) {
                std::cerr << "[Security] " << submission_id << ": 符号链接越界 " << it->path() << std::endl;
                return Fail(ErrorKind::UNSAFE_ARCHIVE, "Archive contains a link outside the project root: " +
                            fs::relative(it->path(), root, sec).string());
            }
        }
        if (ec) {
            return Fail(ErrorKind::BAD_ARCHIVE, "Failed to scan extracted archive: " + ec.message());
        }

        // 4. 入口必须是根目录内的普通文件
        fs::path entry = root / entry_point;
        if (!IsWithin(root, entry) || !fs::is_regular_file(entry, ec)) {
            return Fail(ErrorKind::ENTRY_POINT_NOT_FOUND,
                        "Entry point '" + entry_point + "' not found in archive.");
        }

        GrantReadAccess(root);

        PrepareResult result;
        result.ok = true;
        result.project_dir = root.string();
        result.staging = std::move(staging);
        std::cerr << "[Archive] " << submission_id << ": 已解压 " << entries.size()
                  << " 个条目到 " << result.project_dir << std::endl;
        return result;
    }

    PrepareResult ArchivePreparer::MaterializeInline(const std::string& submission_id,
                                                     const std::string& code,
                                                     const std::string& file_name)
    {
        StagingDir staging;
        std::string error;
        if (!CreateStaging(submission_id, staging, error)) {
            std::cerr << "[Archive] " << submission_id << ": " << error << std::endl;
            return Fail(ErrorKind::STAGING_FAILED, "Failed to create staging directory: " + error);
        }

        const fs::path project_dir = staging.path() / kProjectDirName;
        if (!WriteFile(project_dir / file_name, code, error)) {
            return Fail(ErrorKind::STAGING_FAILED, error);
        }
        GrantReadAccess(project_dir);

        PrepareResult result;
        result.ok = true;
        result.project_dir = project_dir.string();
        result.staging = std::move(staging);
        return result;
    }
}
