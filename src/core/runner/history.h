#ifndef RUNBOX_HISTORY_H
#define RUNBOX_HISTORY_H

#include "sandbox.h"
#include "task.h"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace runbox
{
    struct HistoryEntry {
        std::chrono::system_clock::time_point timestamp;
        Language language = Language::PYTHON;
        std::string code;       // 截断后的源码, archive 运行为 "[zip run] <entry>"
        RunResult result;
    };

    /**
     * @brief 最近执行记录 (内存环形缓冲, 最新的在前)
     * 线程安全; 引擎只写不读, 读取由请求层负责
     */
    class HistoryStore
    {
    public:
        HistoryStore(std::size_t capacity, std::size_t code_chars);

        void Record(Language language, const std::string& code, const RunResult& result);
        void RecordArchive(Language language, const std::string& entry_point, const RunResult& result);

        // 最多 limit 条, 0 表示全部
        std::vector<HistoryEntry> Recent(std::size_t limit = 0) const;

        std::size_t size() const;
        std::size_t capacity() const { return capacity_; }

    private:
        void Push(HistoryEntry entry);

        const std::size_t capacity_;
        const std::size_t code_chars_;
        mutable std::mutex mutex_;
        std::deque<HistoryEntry> entries_;
    };

    // 按码点截断 UTF-8 文本, 不会切断多字节字符
    std::string TruncateCodePoints(const std::string& text, std::size_t max_chars);
}

#endif // RUNBOX_HISTORY_H
