#include "search.hpp"
#include "errors.hpp"
#include "path.hpp"
#include "util.hpp"
#include <algorithm>
#include <unordered_set>

namespace largefile {

const char* match_kind_name(MatchKind kind) {
    return kind == MatchKind::Exact ? "exact" : "fuzzy";
}

SearchEngine::SearchEngine(const FileReader& reader, std::shared_ptr<Matcher> matcher,
                           double fuzzy_threshold)
    : reader_(reader), matcher_(std::move(matcher)), fuzzy_threshold_(fuzzy_threshold)
{}

void SearchEngine::check_pattern(const std::string& pattern, bool fuzzy) const {
    if (pattern.empty()) {
        throw SearchError(SearchError::Kind::InvalidPattern, "Search pattern must not be empty");
    }
    if (fuzzy && !matcher_) {
        throw SearchError(SearchError::Kind::MatcherUnavailable,
                          "Fuzzy matching is unavailable: no similarity matcher configured");
    }
}

std::vector<SearchMatch> SearchEngine::find(const std::string& path,
                                            const std::string& pattern, bool fuzzy,
                                            const std::string& encoding,
                                            size_t max_results) const {
    check_pattern(pattern, fuzzy);
    auto lines = load_lines(resolve_path(path), encoding);
    auto matches = match_lines(lines, pattern, fuzzy);
    if (max_results > 0 && matches.size() > max_results) {
        matches.resize(max_results);
    }
    return matches;
}

std::vector<std::string> SearchEngine::load_lines(const std::string& path,
                                                  const std::string& encoding) const {
    try {
        return reader_.read_lines(path, encoding);
    } catch (const AccessError& e) {
        throw SearchError(SearchError::Kind::Unreadable,
                          "Cannot read " + path + ": " + e.what());
    }
}

std::vector<SearchMatch> SearchEngine::match_lines(const std::vector<std::string>& lines,
                                                   const std::string& pattern,
                                                   bool fuzzy) const {
    check_pattern(pattern, fuzzy);

    auto matches = exact_matches(lines, pattern);
    if (!fuzzy) return matches;

    std::unordered_set<size_t> exact_lines;
    for (const auto& m : matches) exact_lines.insert(m.line_number);

    for (auto& m : fuzzy_matches(lines, pattern)) {
        if (exact_lines.count(m.line_number) == 0) {
            matches.push_back(std::move(m));
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
        [](const SearchMatch& a, const SearchMatch& b) {
            if (a.line_number != b.line_number) return a.line_number < b.line_number;
            return a.score > b.score;
        });
    return matches;
}

std::optional<SearchMatch> SearchEngine::best_fuzzy(const std::vector<std::string>& lines,
                                                    const std::string& pattern) const {
    check_pattern(pattern, true);

    std::optional<SearchMatch> best;
    for (auto& m : fuzzy_matches(lines, pattern)) {
        if (!best || m.score > best->score) best = std::move(m);
    }
    return best;
}

std::vector<SearchMatch> SearchEngine::exact_matches(const std::vector<std::string>& lines,
                                                     const std::string& pattern) const {
    std::vector<SearchMatch> matches;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string content = strip_line_ending(lines[i]);
        size_t pos = content.find(pattern);
        if (pos == std::string::npos) continue;

        SearchMatch m;
        m.line_number = i + 1;
        m.score = 1.0;
        m.kind = MatchKind::Exact;
        size_t start = utf8_char_offset(content, pos);
        m.span = MatchSpan{start, start + utf8_length(pattern)};
        m.content = std::move(content);
        matches.push_back(std::move(m));
    }
    return matches;
}

std::vector<SearchMatch> SearchEngine::fuzzy_matches(const std::vector<std::string>& lines,
                                                     const std::string& pattern) const {
    std::vector<SearchMatch> matches;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string content = strip_line_ending(lines[i]);
        double score = matcher_->ratio(pattern, trim(content), fuzzy_threshold_);
        if (score < fuzzy_threshold_ || score <= 0.0) continue;

        SearchMatch m;
        m.line_number = i + 1;
        m.score = score;
        m.kind = MatchKind::Fuzzy;
        m.content = std::move(content);
        matches.push_back(std::move(m));
    }
    return matches;
}

} // namespace largefile
