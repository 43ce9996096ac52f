#include "task.h"
#include "sandbox_internal.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <random>
#include <vector>

namespace runbox
{
    namespace {

        std::string ToLower(const std::string& s)
        {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        bool IsBlank(const std::string& s)
        {
            return std::all_of(s.begin(), s.end(),
                               [](unsigned char c) { return std::isspace(c) != 0; });
        }

        ValidationResult Reject(ErrorKind kind, std::string message)
        {
            ValidationResult result;
            result.ok = false;
            result.error = kind;
            result.error_message = std::move(message);
            return result;
        }

        // 语言与提交 ID 是两类提交共用的前两步校验
        bool CheckCommon(const std::string& raw_language,
                         const std::string& raw_id,
                         ValidationResult& out)
        {
            Language language;
            if (!ParseLanguage(raw_language, language)) {
                out = Reject(ErrorKind::UNSUPPORTED_LANGUAGE, "Unsupported language: " + raw_language);
                return false;
            }
            if (!raw_id.empty() && !IsValidSubmissionId(raw_id)) {
                out = Reject(ErrorKind::INVALID_SUBMISSION_ID,
                             "Invalid submission id (expected [A-Za-z0-9_-]{1,64})");
                return false;
            }
            out.task.language = language;
            out.task.submission_id = raw_id.empty() ? GenerateSubmissionId() : raw_id;
            out.task.limits = DefaultLimits();
            return true;
        }

    } // anonymous namespace

    const char* LanguageName(Language language)
    {
        switch (language)
        {
            case Language::PYTHON: return "python";
            case Language::NODE:   return "node";
        }
        return "unknown";
    }

    const char* ErrorKindName(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::NONE:                  return "None";
            case ErrorKind::UNSUPPORTED_LANGUAGE:  return "UnsupportedLanguage";
            case ErrorKind::CODE_TOO_LONG:         return "CodeTooLong";
            case ErrorKind::EMPTY_SOURCE:          return "EmptySource";
            case ErrorKind::INVALID_ENTRY_POINT:   return "InvalidEntryPoint";
            case ErrorKind::INVALID_SUBMISSION_ID: return "InvalidSubmissionId";
            case ErrorKind::ARCHIVE_TOO_LARGE:     return "ArchiveTooLarge";
            case ErrorKind::BATCH_TOO_LARGE:       return "BatchTooLarge";
            case ErrorKind::EMPTY_BATCH:           return "EmptyBatch";
            case ErrorKind::ENTRY_POINT_NOT_FOUND: return "EntryPointNotFound";
            case ErrorKind::UNSAFE_ARCHIVE:        return "UnsafeArchive";
            case ErrorKind::BAD_ARCHIVE:           return "BadArchive";
            case ErrorKind::STAGING_FAILED:        return "StagingFailed";
            case ErrorKind::LAUNCH_FAILED:         return "LaunchError";
        }
        return "Unknown";
    }

    const char* ErrorCategoryName(ErrorCategory category)
    {
        switch (category)
        {
            case ErrorCategory::NONE:             return "None";
            case ErrorCategory::VALIDATION_ERROR: return "ValidationError";
            case ErrorCategory::PREP_ERROR:       return "PrepError";
            case ErrorCategory::LAUNCH_ERROR:     return "LaunchError";
        }
        return "Unknown";
    }

    ErrorCategory CategoryOf(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::NONE:
                return ErrorCategory::NONE;
            case ErrorKind::ENTRY_POINT_NOT_FOUND:
            case ErrorKind::UNSAFE_ARCHIVE:
            case ErrorKind::BAD_ARCHIVE:
            case ErrorKind::STAGING_FAILED:
                return ErrorCategory::PREP_ERROR;
            case ErrorKind::LAUNCH_FAILED:
                return ErrorCategory::LAUNCH_ERROR;
            default:
                return ErrorCategory::VALIDATION_ERROR;
        }
    }

    bool ParseLanguage(const std::string& raw, Language& language)
    {
        std::string name = ToLower(raw);
        if (name.empty() || name == "python") {
            language = Language::PYTHON;
            return true;
        }
        if (name == "node") {
            language = Language::NODE;
            return true;
        }
        return false;
    }

    std::size_t CountCodePoints(const std::string& text)
    {
        std::size_t count = 0;
        std::size_t i = 0;
        const std::size_t n = text.size();
        while (i < n)
        {
            unsigned char c = static_cast<unsigned char>(text[i]);
            std::size_t len = 1;
            if (c >= 0xF0 && c <= 0xF4) len = 4;
            else if (c >= 0xE0) len = 3;
            else if (c >= 0xC2 && c < 0xE0) len = 2;

            // 截断或非法的续字节序列按单字节计数
            if (len > 1) {
                if (i + len > n) {
                    len = 1;
                } else {
                    for (std::size_t k = 1; k < len; ++k) {
                        if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
                            len = 1;
                            break;
                        }
                    }
                }
            }
            i += len;
            ++count;
        }
        return count;
    }

    bool IsSafeRelativePath(const std::string& path)
    {
        if (path.empty() || path.size() > 200) return false;
        if (path.front() == '/') return false;
        if (path.find('\0') != std::string::npos) return false;
        if (path.find('\\') != std::string::npos) return false;

        std::vector<std::string> parts;
        std::size_t start = 0;
        while (start <= path.size())
        {
            std::size_t end = path.find('/', start);
            if (end == std::string::npos) end = path.size();
            std::string part = path.substr(start, end - start);
            start = end + 1;

            if (part.empty() || part == ".") continue;
            if (part == "..") {
                if (parts.empty()) return false;    // 逃出根目录
                parts.pop_back();
                continue;
            }
            parts.push_back(part);
        }
        return !parts.empty();
    }

    bool IsValidSubmissionId(const std::string& id)
    {
        if (id.empty() || id.length() > 64) return false;
        for (char c : id) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
        }
        return true;
    }

    std::string GenerateSubmissionId()
    {
        static std::atomic<unsigned long long> sequence{0};
        thread_local std::mt19937_64 rng(
            std::random_device{}() ^
            static_cast<unsigned long long>(std::chrono::steady_clock::now().time_since_epoch().count()));

        char buf[48];
        std::snprintf(buf, sizeof(buf), "task-%012llx-%llu",
                      static_cast<unsigned long long>(rng() & 0xFFFFFFFFFFFFULL),
                      sequence.fetch_add(1));
        return buf;
    }

    TaskLimits DefaultLimits()
    {
        TaskLimits limits;
        limits.max_code_chars = g_runner_config.max_code_chars;
        limits.timeout_ms = g_runner_config.timeout_ms;
        limits.memory_limit_bytes = g_runner_config.memory_limit_mb * 1024LL * 1024LL;
        limits.network_enabled = false;
        return limits;
    }

    ValidationResult Validate(const RunRequest& request)
    {
        ValidationResult result;
        if (!CheckCommon(request.language, request.submission_id, result)) {
            return result;
        }

        // 长度检查必须先于任何昂贵资源的分配
        std::size_t chars = CountCodePoints(request.code);
        if (chars > static_cast<std::size_t>(result.task.limits.max_code_chars)) {
            return Reject(ErrorKind::CODE_TOO_LONG,
                          "Code is too long (max " + std::to_string(result.task.limits.max_code_chars) +
                          " characters).");
        }
        if (IsBlank(request.code)) {
            return Reject(ErrorKind::EMPTY_SOURCE, "Field 'code' is required and must be a non-empty string.");
        }

        result.task.source = InlineSource{request.code};
        result.ok = true;
        return result;
    }

    ValidationResult Validate(const ArchiveRunRequest& request)
    {
        ValidationResult result;
        if (!CheckCommon(request.language, request.submission_id, result)) {
            return result;
        }

        if (request.archive_bytes.empty()) {
            return Reject(ErrorKind::EMPTY_SOURCE, "Archive is empty.");
        }
        if (static_cast<long long>(request.archive_bytes.size()) > g_runner_config.max_archive_bytes) {
            return Reject(ErrorKind::ARCHIVE_TOO_LARGE,
                          "Archive is too large (max " + std::to_string(g_runner_config.max_archive_bytes) +
                          " bytes).");
        }
        if (!IsSafeRelativePath(request.entry_point)) {
            return Reject(ErrorKind::INVALID_ENTRY_POINT,
                          "Invalid entry point '" + request.entry_point + "': must be a relative path inside the archive.");
        }

        result.task.source = ProjectSource{"", request.entry_point};
        result.ok = true;
        return result;
    }

    BatchValidationResult ValidateBatch(const std::vector<RunRequest>& requests)
    {
        BatchValidationResult batch;
        if (requests.empty()) {
            batch.error = ErrorKind::EMPTY_BATCH;
            batch.error_message = "Missing tasks list.";
            return batch;
        }
        if (requests.size() > static_cast<std::size_t>(g_runner_config.max_batch_size)) {
            batch.error = ErrorKind::BATCH_TOO_LARGE;
            batch.error_message = "Too many tasks in batch: " + std::to_string(requests.size()) +
                                  " (max " + std::to_string(g_runner_config.max_batch_size) + ").";
            return batch;
        }

        batch.tasks.reserve(requests.size());
        for (std::size_t i = 0; i < requests.size(); ++i)
        {
            ValidationResult v = Validate(requests[i]);
            if (!v.ok) {
                batch.tasks.clear();
                batch.error = v.error;
                batch.error_message = "Task " + std::to_string(i) + ": " + v.error_message;
                return batch;
            }
            batch.tasks.push_back(std::move(v.task));
        }
        batch.ok = true;
        return batch;
    }

    TaskDescriptor WithProjectDir(const TaskDescriptor& task, const std::string& project_dir)
    {
        TaskDescriptor copy = task;
        std::string entry = task.IsInline() ? std::string() : task.project().entry_point;
        copy.source = ProjectSource{project_dir, entry};
        return copy;
    }
}
