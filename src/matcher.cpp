#include "matcher.hpp"
#include "encoding.hpp"
#include <algorithm>
#include <vector>

namespace largefile {

namespace {

size_t lcs_length(const std::u32string& a, const std::u32string& b) {
    const std::u32string& shorter = a.size() <= b.size() ? a : b;
    const std::u32string& longer = a.size() <= b.size() ? b : a;

    std::vector<size_t> prev(shorter.size() + 1, 0);
    std::vector<size_t> cur(shorter.size() + 1, 0);
    for (char32_t c : longer) {
        for (size_t j = 1; j <= shorter.size(); ++j) {
            if (shorter[j - 1] == c) {
                cur[j] = prev[j - 1] + 1;
            } else {
                cur[j] = std::max(prev[j], cur[j - 1]);
            }
        }
        std::swap(prev, cur);
    }
    return prev[shorter.size()];
}

} // namespace

double IndelMatcher::ratio(const std::string& a, const std::string& b,
                           double score_cutoff) const {
    std::u32string ua = utf8_to_u32(a);
    std::u32string ub = utf8_to_u32(b);
    size_t total = ua.size() + ub.size();
    if (total == 0) return 1.0;

    // Best case: the shorter string is a subsequence of the longer one
    double upper = 2.0 * static_cast<double>(std::min(ua.size(), ub.size())) /
                   static_cast<double>(total);
    if (upper < score_cutoff) return 0.0;

    double score = 2.0 * static_cast<double>(lcs_length(ua, ub)) /
                   static_cast<double>(total);
    return score < score_cutoff ? 0.0 : score;
}

} // namespace largefile
