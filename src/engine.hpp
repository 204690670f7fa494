#pragma once
#include "backup.hpp"
#include "config.hpp"
#include "editor.hpp"
#include "encoding.hpp"
#include "file_access.hpp"
#include "matcher.hpp"
#include "outline.hpp"
#include "search.hpp"
#include "session.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace largefile {

constexpr size_t kReadWindowLines = 20;
constexpr size_t kPatternWindowRadius = 10;

struct FileOverview {
    uint64_t line_count = 0;
    uint64_t file_size = 0;
    std::string encoding;
    bool has_long_lines = false;
    AccessStrategy strategy = AccessStrategy::Memory;
    std::vector<OutlineItem> outline;
    std::vector<std::string> search_hints;
};

struct SearchResult {
    size_t line_number = 0;
    std::string match;          // truncated to truncate_length characters
    bool truncated = false;
    std::vector<std::string> context_before;
    std::vector<std::string> context_after;
    std::string semantic_context;  // "<type> <name>" of the enclosing outline item, or empty
    double similarity_score = 1.0;
    MatchKind match_type = MatchKind::Exact;
    std::vector<MatchSpan> submatches;
};

struct ReadWindow {
    std::string content;
    size_t start_line = 0;
    size_t end_line = 0;
    uint64_t total_lines = 0;
    std::string target_type;    // "line_number" or "pattern"
    std::string mode;
    std::optional<size_t> match_line;
    std::optional<double> similarity_score;
    std::string pattern;
};

// Optional collaborators. A null pointer means the capability is absent.
struct Capabilities {
    std::shared_ptr<Matcher> matcher = std::make_shared<IndelMatcher>();
    std::shared_ptr<EncodingDetector> encoding_detector =
        std::make_shared<BomEncodingDetector>();
    std::shared_ptr<OutlineProvider> outline_provider;
};

// Owns the reader, session cache, search and edit engines for one process
// and implements the four boundary operations on top of them.
class Engine {
public:
    explicit Engine(Config config, Capabilities caps = Capabilities{});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    FileOverview overview(const std::string& path);

    std::vector<SearchResult> search(const std::string& path, const std::string& pattern,
                                     size_t max_results, size_t context_lines, bool fuzzy);

    ReadWindow read_at_line(const std::string& path, size_t line, const std::string& mode);
    ReadWindow read_at_pattern(const std::string& path, const std::string& pattern,
                               const std::string& mode);

    EditResult edit(const std::string& path, const std::string& search_text,
                    const std::string& replace_text, bool fuzzy, bool preview);

    const Config& config() const { return config_; }
    const FileReader& reader() const { return reader_; }
    SessionCache& sessions() { return sessions_; }
    const SearchEngine& search_engine() const { return search_; }
    EditEngine& editor() { return editor_; }

private:
    std::vector<OutlineItem> outline_for(const FileSession& session);
    ReadWindow window(const FileSession& session, size_t anchor, size_t first, size_t last,
                      const std::string& mode);

    Config config_;
    Capabilities caps_;
    FileReader reader_;
    SessionCache sessions_;
    SearchEngine search_;
    BackupStore backups_;
    EditLocks locks_;
    EditEngine editor_;
};

} // namespace largefile
