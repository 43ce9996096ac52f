#include "history.h"

namespace runbox
{
    std::string TruncateCodePoints(const std::string& text, std::size_t max_chars)
    {
        std::size_t chars = 0;
        std::size_t i = 0;
        while (i < text.size())
        {
            if (chars == max_chars) return text.substr(0, i);
            ++i;
            // 跳过续字节 10xxxxxx
            while (i < text.size() && (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) ++i;
            ++chars;
        }
        return text;
    }

    HistoryStore::HistoryStore(std::size_t capacity, std::size_t code_chars)
        : capacity_(capacity > 0 ? capacity : 1)
        , code_chars_(code_chars)
    {
    }

    void HistoryStore::Record(Language language, const std::string& code, const RunResult& result)
    {
        HistoryEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.language = language;
        entry.code = TruncateCodePoints(code, code_chars_);
        entry.result = result;
        Push(std::move(entry));
    }

    void HistoryStore::RecordArchive(Language language, const std::string& entry_point, const RunResult& result)
    {
        Record(language, "[zip run] " + entry_point, result);
    }

    void HistoryStore::Push(HistoryEntry entry)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_front(std::move(entry));
        while (entries_.size() > capacity_) {
            entries_.pop_back();
        }
    }

    std::vector<HistoryEntry> HistoryStore::Recent(std::size_t limit) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = entries_.size();
        if (limit > 0 && limit < n) n = limit;
        return std::vector<HistoryEntry>(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(n));
    }

    std::size_t HistoryStore::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }
}
