#ifndef RUNBOX_ARCHIVE_H
#define RUNBOX_ARCHIVE_H

#include "task.h"

#include <filesystem>
#include <string>
#include <vector>

namespace runbox
{
    /**
     * @brief 单个任务的 staging 目录 (作用域哨兵)
     * 独占所有权, 只能移动; 析构或 Release() 时无条件删除整个目录
     */
    class StagingDir
    {
    public:
        StagingDir() = default;
        explicit StagingDir(std::filesystem::path p) : path_(std::move(p)) {}

        StagingDir(const StagingDir&) = delete;
        StagingDir& operator=(const StagingDir&) = delete;

        StagingDir(StagingDir&& other) noexcept : path_(std::move(other.path_))
        {
            other.path_.clear();
        }
        StagingDir& operator=(StagingDir&& other) noexcept
        {
            if (this != &other) {
                Release();
                path_ = std::move(other.path_);
                other.path_.clear();
            }
            return *this;
        }

        ~StagingDir() { Release(); }

        /**
         * @brief 删除目录; 第二次调用为空操作
         */
        void Release();

        bool valid() const { return !path_.empty(); }
        const std::filesystem::path& path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

    struct PrepareResult
    {
        bool ok = false;
        StagingDir staging;         // 整个 staging 树的所有权
        std::string project_dir;    // staging 下的 app/ 目录, 以只读方式挂载为 /app
        ErrorKind error = ErrorKind::NONE;
        std::string error_message;
    };

    /**
     * @brief Archive 准备器
     * 在 workspace_root 下为每个任务创建唯一命名的 staging 目录,
     * 解压 zip 并确认入口文件存在; 交给 Launcher 之后不再持有所有权
     */
    class ArchivePreparer
    {
    public:
        /**
         * @param workspace_root staging 目录的父目录 (例如 /tmp/runbox)
         * @throw std::runtime_error 如果无法创建该目录
         */
        explicit ArchivePreparer(const std::string& workspace_root);

        /**
         * @brief 解压 archive 并解析入口
         * 任何失败路径上 staging 目录都会被删除
         */
        PrepareResult Prepare(const std::string& submission_id,
                              const std::string& archive_bytes,
                              const std::string& entry_point);

        /**
         * @brief 把内联代码写成单文件 staging 目录, 与 archive 共用挂载机制
         */
        PrepareResult MaterializeInline(const std::string& submission_id,
                                        const std::string& code,
                                        const std::string& file_name);

        // 列出 zip 内的条目名 (不解压); 失败返回 false
        bool ListEntries(const std::filesystem::path& archive,
                         std::vector<std::string>& entries,
                         std::string& error);

        // zip 条目名是否能安全解压到根目录之下
        static bool IsSafeEntryName(const std::string& name);

        const std::filesystem::path& workspace_root() const { return workspace_root_; }

    private:
        bool CreateStaging(const std::string& submission_id, StagingDir& out, std::string& error);

        std::filesystem::path workspace_root_;
    };
}

#endif // RUNBOX_ARCHIVE_H
