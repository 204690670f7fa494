#include "editor.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "path.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace largefile {

const char* edit_match_type_name(EditMatchType type) {
    switch (type) {
        case EditMatchType::Exact: return "exact";
        case EditMatchType::Fuzzy: return "fuzzy";
        case EditMatchType::None:  return "none";
    }
    return "none";
}

std::string apply_changes(const std::string& content, const std::vector<TextChange>& changes) {
    std::string out;
    out.reserve(content.size());
    size_t cursor = 0;
    for (const auto& c : changes) {
        out.append(content, cursor, c.pos - cursor);
        out += c.replacement;
        cursor = c.pos + c.length;
    }
    out.append(content, cursor, std::string::npos);
    return out;
}

namespace {

size_t line_begin(const std::string& content, size_t pos) {
    if (pos == 0) return 0;
    size_t nl = content.rfind('\n', pos - 1);
    return nl == std::string::npos ? 0 : nl + 1;
}

size_t line_end(const std::string& content, size_t pos) {
    size_t nl = content.find('\n', pos);
    return nl == std::string::npos ? content.size() : nl + 1;
}

struct Hunk {
    size_t begin = 0;
    size_t end = 0;
    std::vector<TextChange> changes;  // positions relative to begin
};

} // namespace

std::string render_diff(const std::string& file_name, const std::string& content,
                        const std::vector<TextChange>& changes) {
    std::vector<Hunk> hunks;
    for (const auto& c : changes) {
        size_t last = c.length > 0 ? c.pos + c.length - 1 : c.pos;
        size_t b = line_begin(content, c.pos);
        size_t e = line_end(content, last);
        if (!hunks.empty() && b < hunks.back().end) {
            hunks.back().end = std::max(hunks.back().end, e);
        } else {
            hunks.push_back(Hunk{b, e, {}});
        }
        TextChange rel = c;
        rel.pos -= hunks.back().begin;
        hunks.back().changes.push_back(std::move(rel));
    }

    std::ostringstream out;
    out << "--- a/" << file_name << "\n";
    out << "+++ b/" << file_name << "\n";

    size_t scanned = 0;
    size_t line_no = 1;
    long delta = 0;
    for (const auto& h : hunks) {
        line_no += static_cast<size_t>(
            std::count(content.begin() + static_cast<long>(scanned),
                       content.begin() + static_cast<long>(h.begin), '\n'));
        scanned = h.begin;

        std::string old_text = content.substr(h.begin, h.end - h.begin);
        auto old_lines = split_lines(old_text);
        auto new_lines = split_lines(apply_changes(old_text, h.changes));

        long new_start = static_cast<long>(line_no) + delta;
        out << "@@ -" << line_no << "," << old_lines.size()
            << " +" << new_start << "," << new_lines.size() << " @@\n";
        for (const auto& l : old_lines) out << "-" << strip_line_ending(l) << "\n";
        for (const auto& l : new_lines) out << "+" << strip_line_ending(l) << "\n";

        delta += static_cast<long>(new_lines.size()) - static_cast<long>(old_lines.size());
    }
    return out.str();
}

EditLocks::Guard::Guard(EditLocks* owner, std::string path, std::shared_ptr<Entry> entry)
    : owner_(owner), path_(std::move(path)), entry_(std::move(entry)) {}

EditLocks::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), path_(std::move(other.path_)), entry_(std::move(other.entry_)) {
    other.owner_ = nullptr;
}

EditLocks::Guard& EditLocks::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        path_ = std::move(other.path_);
        entry_ = std::move(other.entry_);
        other.owner_ = nullptr;
    }
    return *this;
}

EditLocks::Guard::~Guard() { release(); }

void EditLocks::Guard::release() {
    if (!owner_) return;
    owner_->release(path_, entry_);
    owner_ = nullptr;
    entry_.reset();
}

EditLocks::Guard EditLocks::acquire(const std::string& canonical_path) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = locks_[canonical_path];
        if (!slot) slot = std::make_shared<Entry>();
        ++slot->users;
        entry = slot;
    }
    entry->mutex.lock();
    return Guard(this, canonical_path, std::move(entry));
}

void EditLocks::release(const std::string& path, const std::shared_ptr<Entry>& entry) {
    entry->mutex.unlock();
    std::lock_guard<std::mutex> lock(mutex_);
    if (--entry->users > 0) return;
    auto it = locks_.find(path);
    if (it != locks_.end() && it->second == entry) locks_.erase(it);
}

size_t EditLocks::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

EditEngine::EditEngine(const FileReader& reader, SessionCache& sessions,
                       const SearchEngine& search, const BackupStore& backups,
                       EditLocks* locks)
    : reader_(reader), sessions_(sessions), search_(search), backups_(backups), locks_(locks)
{}

void EditEngine::validate(const std::string& search_text, const std::string& replace_text,
                          size_t max_replacements) {
    if (search_text.empty()) {
        throw EditError(EditError::Kind::InvalidArgument, "search_text must not be empty");
    }
    if (search_text == replace_text) {
        throw EditError(EditError::Kind::InvalidArgument,
                        "search_text and replace_text are identical");
    }
    if (utf8_length(search_text) > kMaxEditTextLength) {
        throw EditError(EditError::Kind::InvalidArgument,
                        "search_text exceeds " + std::to_string(kMaxEditTextLength) +
                        " characters");
    }
    if (utf8_length(replace_text) > kMaxEditTextLength) {
        throw EditError(EditError::Kind::InvalidArgument,
                        "replace_text exceeds " + std::to_string(kMaxEditTextLength) +
                        " characters");
    }
    if (max_replacements == 0) {
        throw EditError(EditError::Kind::InvalidArgument,
                        "max_replacements must be at least 1");
    }
}

EditEngine::EditPlan EditEngine::locate(const std::string& content,
                                        const std::string& search_text,
                                        const std::string& replace_text, bool fuzzy,
                                        size_t max_replacements) const {
    EditPlan plan;

    size_t pos = content.find(search_text);
    if (pos != std::string::npos) {
        plan.match_type = EditMatchType::Exact;
        plan.score = 1.0;
        plan.line_number = static_cast<size_t>(
            std::count(content.begin(), content.begin() + static_cast<long>(pos), '\n')) + 1;
        while (pos != std::string::npos && plan.changes.size() < max_replacements) {
            plan.changes.push_back(TextChange{pos, search_text.size(), replace_text});
            pos = content.find(search_text, pos + search_text.size());
        }
        return plan;
    }

    if (!fuzzy) return plan;

    // Fuzzy fallback rewrites the whole best line, terminator kept
    auto lines = split_lines(content);
    auto best = search_.best_fuzzy(lines, search_text);
    if (!best) return plan;

    size_t offset = 0;
    for (size_t i = 0; i + 1 < best->line_number; ++i) offset += lines[i].size();
    size_t length = strip_line_ending(lines[best->line_number - 1]).size();

    plan.changes.push_back(TextChange{offset, length, replace_text});
    plan.match_type = EditMatchType::Fuzzy;
    plan.score = best->score;
    plan.line_number = best->line_number;
    return plan;
}

EditResult EditEngine::replace(const std::string& path, const std::string& search_text,
                               const std::string& replace_text, bool fuzzy, bool preview,
                               size_t max_replacements) {
    validate(search_text, replace_text, max_replacements);

    std::string canonical = resolve_path(path);
    EditLocks::Guard guard;
    if (locks_) guard = locks_->acquire(canonical);

    auto session = sessions_.load(canonical);
    std::string content = reader_.read(canonical, session->encoding);

    EditPlan plan = locate(content, search_text, replace_text, fuzzy, max_replacements);

    EditResult result;
    if (plan.changes.empty()) {
        result.preview = std::string("No ") + (fuzzy ? "exact or fuzzy " : "exact ") +
                         "match found for: " + utf8_truncate(search_text, 80);
        return result;
    }

    result.success = true;
    result.changes_made = plan.changes.size();
    result.line_number = plan.line_number;
    result.similarity_used = plan.score;
    result.match_type = plan.match_type;
    result.preview = render_diff(std::filesystem::path(canonical).filename().string(),
                                 content, plan.changes);
    if (preview) return result;

    try {
        result.backup_created = backups_.backup(canonical);
    } catch (const AccessError& e) {
        throw EditError(EditError::Kind::BackupFailed,
                        "Backup failed, " + canonical + " was not modified: " + e.what());
    }

    try {
        reader_.write(canonical, apply_changes(content, plan.changes), session->encoding);
    } catch (const AccessError& e) {
        throw EditError(EditError::Kind::WriteFailed,
                        "Write failed, " + canonical + " was not modified: " + e.what());
    }

    sessions_.invalidate(canonical);
    std::cerr << "[edit] " << canonical << ": " << result.changes_made
              << " change(s) at line " << result.line_number << " ("
              << edit_match_type_name(result.match_type) << ")\n";
    return result;
}

} // namespace largefile
