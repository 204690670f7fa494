#pragma once
#include "backup.hpp"
#include "file_access.hpp"
#include "search.hpp"
#include "session.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace largefile {

constexpr size_t kMaxEditTextLength = 10000;  // characters

enum class EditMatchType { Exact, Fuzzy, None };

const char* edit_match_type_name(EditMatchType type);

struct EditResult {
    bool success = false;
    std::string preview;
    size_t changes_made = 0;
    size_t line_number = 0;
    double similarity_used = 0.0;
    EditMatchType match_type = EditMatchType::None;
    std::optional<std::string> backup_created;
};

// Replacement of content[pos, pos + length)
struct TextChange {
    size_t pos = 0;
    size_t length = 0;
    std::string replacement;
};

// Apply non-overlapping changes sorted by position.
std::string apply_changes(const std::string& content, const std::vector<TextChange>& changes);

// Unified diff of the lines touched by changes.
std::string render_diff(const std::string& file_name, const std::string& content,
                        const std::vector<TextChange>& changes);

// Per-path mutual exclusion for edits within one process. A path's entry
// lives only while some caller holds or waits for it.
class EditLocks {
    struct Entry {
        std::mutex mutex;
        size_t users = 0;  // holders and waiters, guarded by EditLocks::mutex_
    };

public:
    // Holds one path's lock until destroyed. Default-constructed guards hold nothing.
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        ~Guard();
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        friend class EditLocks;
        Guard(EditLocks* owner, std::string path, std::shared_ptr<Entry> entry);
        void release();

        EditLocks* owner_ = nullptr;
        std::string path_;
        std::shared_ptr<Entry> entry_;
    };

    Guard acquire(const std::string& canonical_path);

    // Paths currently held or waited on
    size_t size() const;

private:
    void release(const std::string& path, const std::shared_ptr<Entry>& entry);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> locks_;
};

// Single search/replace per call. Exact occurrences are replaced in place;
// without one, a fuzzy edit rewrites the whole best matching line. Preview
// calls never touch the filesystem. Commits back up the file first and
// abort if that fails.
//
// Without EditLocks, concurrent edits of one file are last-writer-wins.
class EditEngine {
public:
    EditEngine(const FileReader& reader, SessionCache& sessions,
               const SearchEngine& search, const BackupStore& backups,
               EditLocks* locks = nullptr);

    EditResult replace(const std::string& path, const std::string& search_text,
                       const std::string& replace_text, bool fuzzy, bool preview,
                       size_t max_replacements = 1);

    // Throws EditError(InvalidArgument); performs no I/O.
    static void validate(const std::string& search_text, const std::string& replace_text,
                         size_t max_replacements);

private:
    struct EditPlan {
        std::vector<TextChange> changes;
        EditMatchType match_type = EditMatchType::None;
        double score = 0.0;
        size_t line_number = 0;
    };

    EditPlan locate(const std::string& content, const std::string& search_text,
                    const std::string& replace_text, bool fuzzy,
                    size_t max_replacements) const;

    const FileReader& reader_;
    SessionCache& sessions_;
    const SearchEngine& search_;
    const BackupStore& backups_;
    EditLocks* locks_;
};

} // namespace largefile
