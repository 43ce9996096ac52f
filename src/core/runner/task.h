#ifndef RUNBOX_TASK_H
#define RUNBOX_TASK_H

#include <string>
#include <variant>
#include <vector>

namespace runbox
{
    enum class Language {
        PYTHON = 0,
        NODE = 1
    };

    /**
     * @brief 错误分类
     * ValidationError: 尚未分配任何沙箱资源即被拒绝
     * PrepError:       archive 解压阶段失败, staging 目录已被清理
     * LaunchError:     隔离运行时无法启动进程
     */
    enum class ErrorCategory {
        NONE = 0,
        VALIDATION_ERROR,
        PREP_ERROR,
        LAUNCH_ERROR
    };

    enum class ErrorKind {
        NONE = 0,

        // ValidationError
        UNSUPPORTED_LANGUAGE,
        CODE_TOO_LONG,
        EMPTY_SOURCE,
        INVALID_ENTRY_POINT,
        INVALID_SUBMISSION_ID,
        ARCHIVE_TOO_LARGE,
        BATCH_TOO_LARGE,
        EMPTY_BATCH,

        // PrepError
        ENTRY_POINT_NOT_FOUND,
        UNSAFE_ARCHIVE,
        BAD_ARCHIVE,
        STAGING_FAILED,

        // LaunchError
        LAUNCH_FAILED
    };

    const char* LanguageName(Language language);
    const char* ErrorKindName(ErrorKind kind);
    const char* ErrorCategoryName(ErrorCategory category);
    ErrorCategory CategoryOf(ErrorKind kind);

    /**
     * @brief 解析语言名 (忽略大小写, 空字符串视为 python)
     * @return false 如果语言不受支持
     */
    bool ParseLanguage(const std::string& raw, Language& language);

    struct TaskLimits {
        int max_code_chars = 5000;
        int timeout_ms = 10000;
        long long memory_limit_bytes = 128LL * 1024 * 1024;
        bool network_enabled = false;   // 始终禁用
    };

    struct InlineSource {
        std::string code;
    };

    // 已解压到 staging 目录的多文件项目
    struct ProjectSource {
        std::string project_dir;
        std::string entry_point;    // 相对 project_dir 的路径
    };

    /**
     * @brief 经过校验的单个提交
     * source 只能是 InlineSource 与 ProjectSource 之一; 构造后不再修改
     */
    struct TaskDescriptor {
        std::string submission_id;
        Language language = Language::PYTHON;
        std::variant<InlineSource, ProjectSource> source;
        TaskLimits limits;

        bool IsInline() const { return std::holds_alternative<InlineSource>(source); }
        const std::string& code() const { return std::get<InlineSource>(source).code; }
        const ProjectSource& project() const { return std::get<ProjectSource>(source); }
    };

    struct RunRequest {
        std::string submission_id;      // 为空时自动生成
        std::string language;
        std::string code;
    };

    struct ArchiveRunRequest {
        std::string submission_id;
        std::string language;
        std::string archive_bytes;
        std::string entry_point;
    };

    struct ValidationResult {
        bool ok = false;
        TaskDescriptor task;
        ErrorKind error = ErrorKind::NONE;
        std::string error_message;
    };

    struct BatchValidationResult {
        bool ok = false;
        std::vector<TaskDescriptor> tasks;
        ErrorKind error = ErrorKind::NONE;
        std::string error_message;
    };

    /**
     * @brief 校验内联代码提交
     * 顺序: 语言 -> 提交 ID -> 代码长度 (按 Unicode 字符计数)
     * 无副作用, 不分配任何沙箱资源
     */
    ValidationResult Validate(const RunRequest& request);

    /**
     * @brief 校验 archive 提交
     * 顺序: 语言 -> 提交 ID -> archive 大小 -> 入口路径
     * 通过后 task.project().project_dir 为空, 由 ArchivePreparer 填充
     */
    ValidationResult Validate(const ArchiveRunRequest& request);

    /**
     * @brief 校验批量提交
     * 空批次 (EMPTY_BATCH) 与超过 max_batch_size (BATCH_TOO_LARGE) 直接拒绝, 否则逐个校验,
     * 第一个失败的任务使整个批次被拒绝
     */
    BatchValidationResult ValidateBatch(const std::vector<RunRequest>& requests);

    // 入口路径必须是相对路径, 且规范化后不能逃出 staging 根目录
    bool IsSafeRelativePath(const std::string& path);

    bool IsValidSubmissionId(const std::string& id);

    std::string GenerateSubmissionId();

    // 按 UTF-8 码点计数 (非法字节各计为一个字符)
    std::size_t CountCodePoints(const std::string& text);

    // 以当前 g_runner_config 生成任务限制
    TaskLimits DefaultLimits();

    // 返回 task 的副本, 其 ProjectSource 指向已准备好的 staging 目录
    TaskDescriptor WithProjectDir(const TaskDescriptor& task, const std::string& project_dir);
}

#endif // RUNBOX_TASK_H
