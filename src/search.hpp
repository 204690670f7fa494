#pragma once
#include "encoding.hpp"
#include "file_access.hpp"
#include "matcher.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace largefile {

enum class MatchKind { Exact, Fuzzy };

const char* match_kind_name(MatchKind kind);

struct MatchSpan {
    size_t start = 0;  // code point offsets, end exclusive
    size_t end = 0;
};

struct SearchMatch {
    size_t line_number = 0;     // 1-based
    std::string content;        // line without terminator
    double score = 1.0;
    MatchKind kind = MatchKind::Exact;
    std::optional<MatchSpan> span;
};

// Line-oriented exact and fuzzy matching. Exact matches always score 1.0
// and win over a fuzzy match on the same line. Results are ordered by line
// number, then by descending score.
class SearchEngine {
public:
    SearchEngine(const FileReader& reader, std::shared_ptr<Matcher> matcher,
                 double fuzzy_threshold);

    // max_results == 0 means unlimited; truncation happens after merging.
    std::vector<SearchMatch> find(const std::string& path, const std::string& pattern,
                                  bool fuzzy,
                                  const std::string& encoding = kDefaultEncoding,
                                  size_t max_results = 0) const;

    // Lines of path, read errors reported as SearchError.
    std::vector<std::string> load_lines(const std::string& path,
                                        const std::string& encoding) const;

    std::vector<SearchMatch> match_lines(const std::vector<std::string>& lines,
                                         const std::string& pattern, bool fuzzy) const;

    // Highest scoring line at or above the threshold; earliest line on ties.
    std::optional<SearchMatch> best_fuzzy(const std::vector<std::string>& lines,
                                          const std::string& pattern) const;

    // Throws SearchError(InvalidPattern or MatcherUnavailable); no I/O.
    void check_pattern(const std::string& pattern, bool fuzzy) const;

    bool fuzzy_available() const { return matcher_ != nullptr; }
    double fuzzy_threshold() const { return fuzzy_threshold_; }

private:
    std::vector<SearchMatch> exact_matches(const std::vector<std::string>& lines,
                                           const std::string& pattern) const;
    std::vector<SearchMatch> fuzzy_matches(const std::vector<std::string>& lines,
                                           const std::string& pattern) const;

    const FileReader& reader_;
    std::shared_ptr<Matcher> matcher_;
    double fuzzy_threshold_;
};

} // namespace largefile
