#include "engine.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace largefile {

namespace {

constexpr uint64_t kSmallFileSize = 10000;
constexpr size_t kMaxOutlineHints = 5;

std::vector<std::string> default_hints(uint64_t file_size) {
    if (file_size < kSmallFileSize) return {"def ", "class ", "import ", "function"};
    return {"def ", "class ", "TODO", "FIXME"};
}

std::string clip(const std::string& line, size_t limit, bool* truncated = nullptr) {
    if (utf8_length(line) <= limit) {
        if (truncated) *truncated = false;
        return line;
    }
    if (truncated) *truncated = true;
    return utf8_truncate(line, limit) + "...";
}

void check_mode(const std::string& mode) {
    if (mode != "lines" && mode != "semantic") {
        throw std::invalid_argument("Unknown read mode '" + mode +
                                    "' (expected 'lines' or 'semantic')");
    }
}

std::string join(const std::vector<std::string>& lines, size_t first, size_t last) {
    std::string out;
    for (size_t i = first; i <= last && i <= lines.size(); ++i) {
        out += lines[i - 1];
    }
    return out;
}

} // namespace

Engine::Engine(Config config, Capabilities caps)
    : config_(std::move(config)),
      caps_(std::move(caps)),
      reader_(StrategySelector(config_.memory_threshold, config_.mmap_threshold),
              config_.streaming_chunk_size),
      sessions_(reader_, config_.max_line_length, caps_.encoding_detector),
      search_(reader_, caps_.matcher, config_.fuzzy_threshold),
      backups_(reader_, config_.backup_dir),
      editor_(reader_, sessions_, search_, backups_,
              config_.edit_locking ? &locks_ : nullptr)
{}

std::vector<OutlineItem> Engine::outline_for(const FileSession& session) {
    if (!config_.enable_outline || !caps_.outline_provider) return {};
    std::string content = reader_.read(session.canonical_path, session.encoding);
    return outline_with_budget(caps_.outline_provider, session.canonical_path, content,
                               std::chrono::seconds(config_.outline_timeout));
}

FileOverview Engine::overview(const std::string& path) {
    auto session = sessions_.load(path);

    FileOverview ov;
    ov.line_count = session->line_count;
    ov.file_size = session->file_size;
    ov.encoding = session->encoding;
    ov.has_long_lines = session->has_long_lines;
    ov.strategy = session->strategy;
    ov.outline = outline_for(*session);

    ov.search_hints = default_hints(session->file_size);
    size_t added = 0;
    for (const auto& item : ov.outline) {
        if (added == kMaxOutlineHints) break;
        if (item.name.empty()) continue;
        if (std::find(ov.search_hints.begin(), ov.search_hints.end(), item.name) !=
            ov.search_hints.end()) continue;
        ov.search_hints.push_back(item.name);
        ++added;
    }
    return ov;
}

std::vector<SearchResult> Engine::search(const std::string& path, const std::string& pattern,
                                         size_t max_results, size_t context_lines,
                                         bool fuzzy) {
    search_.check_pattern(pattern, fuzzy);

    std::shared_ptr<const FileSession> session;
    try {
        session = sessions_.load(path);
    } catch (const AccessError& e) {
        throw SearchError(SearchError::Kind::Unreadable,
                          "Cannot read " + path + ": " + e.what());
    }

    auto lines = search_.load_lines(session->canonical_path, session->encoding);
    auto matches = search_.match_lines(lines, pattern, fuzzy);
    if (max_results > 0 && matches.size() > max_results) {
        matches.resize(max_results);
    }

    std::vector<OutlineItem> outline;
    if (!matches.empty()) outline = outline_for(*session);

    std::vector<SearchResult> results;
    results.reserve(matches.size());
    for (const auto& m : matches) {
        SearchResult r;
        r.line_number = m.line_number;
        r.match = clip(m.content, config_.truncate_length, &r.truncated);
        r.similarity_score = m.score;
        r.match_type = m.kind;
        if (m.span) r.submatches.push_back(*m.span);
        if (const OutlineItem* item = find_enclosing(outline, m.line_number)) {
            r.semantic_context = item->type + " " + item->name;
        }

        size_t idx = m.line_number - 1;
        size_t before = std::min(context_lines, idx);
        for (size_t i = idx - before; i < idx; ++i) {
            r.context_before.push_back(clip(strip_line_ending(lines[i]), config_.truncate_length));
        }
        for (size_t i = idx + 1; i < lines.size() && i <= idx + context_lines; ++i) {
            r.context_after.push_back(clip(strip_line_ending(lines[i]), config_.truncate_length));
        }
        results.push_back(std::move(r));
    }
    return results;
}

ReadWindow Engine::window(const FileSession& session, size_t anchor, size_t first,
                          size_t last, const std::string& mode) {
    if (mode == "semantic") {
        auto outline = outline_for(session);
        if (const OutlineItem* item = find_enclosing(outline, anchor)) {
            first = std::max<size_t>(item->line_number, 1);
            last = std::max(first, std::min<size_t>(item->end_line, session.line_count));
        }
    }

    ReadWindow w;
    w.mode = mode;
    w.start_line = first;
    w.end_line = last;
    w.total_lines = session.line_count;
    auto slice = reader_.read_line_range(session.canonical_path, session.encoding, first, last);
    for (const auto& line : slice) w.content += line;
    return w;
}

ReadWindow Engine::read_at_line(const std::string& path, size_t line, const std::string& mode) {
    check_mode(mode);
    auto session = sessions_.load(path);
    if (line < 1 || line > session->line_count) {
        throw std::invalid_argument("Line " + std::to_string(line) + " is out of range (file has " +
                                    std::to_string(session->line_count) + " lines)");
    }

    size_t last = std::min<uint64_t>(line + kReadWindowLines - 1, session->line_count);
    ReadWindow w = window(*session, line, line, last, mode);
    w.target_type = "line_number";
    return w;
}

ReadWindow Engine::read_at_pattern(const std::string& path, const std::string& pattern,
                                   const std::string& mode) {
    check_mode(mode);
    search_.check_pattern(pattern, false);
    auto session = sessions_.load(path);
    auto lines = search_.load_lines(session->canonical_path, session->encoding);

    std::optional<SearchMatch> hit;
    auto exact = search_.match_lines(lines, pattern, false);
    if (!exact.empty()) {
        hit = exact.front();
    } else if (search_.fuzzy_available()) {
        hit = search_.best_fuzzy(lines, pattern);
    }
    if (!hit) {
        throw SearchError(SearchError::Kind::NoMatch, "Pattern not found: " + pattern);
    }

    size_t anchor = hit->line_number;
    size_t first = anchor > kPatternWindowRadius ? anchor - kPatternWindowRadius : 1;
    size_t last = std::min<size_t>(anchor + kPatternWindowRadius, lines.size());

    ReadWindow w;
    if (mode == "lines") {
        w.mode = mode;
        w.start_line = first;
        w.end_line = last;
        w.total_lines = session->line_count;
        w.content = join(lines, first, last);
    } else {
        w = window(*session, anchor, first, last, mode);
    }
    w.target_type = "pattern";
    w.match_line = anchor;
    w.similarity_score = hit->score;
    w.pattern = pattern;
    return w;
}

EditResult Engine::edit(const std::string& path, const std::string& search_text,
                        const std::string& replace_text, bool fuzzy, bool preview) {
    return editor_.replace(path, search_text, replace_text, fuzzy, preview);
}

} // namespace largefile
