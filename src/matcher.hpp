#pragma once
#include <string>

namespace largefile {

// Similarity scoring used by fuzzy search and fuzzy edits.
class Matcher {
public:
    virtual ~Matcher() = default;

    // Similarity of a and b in [0, 1]. Scores below score_cutoff may be
    // reported as 0.
    virtual double ratio(const std::string& a, const std::string& b,
                         double score_cutoff = 0.0) const = 0;
};

// Normalized indel similarity over code points: 2 * LCS / (|a| + |b|).
// Two empty strings score 1.0.
class IndelMatcher : public Matcher {
public:
    double ratio(const std::string& a, const std::string& b,
                 double score_cutoff = 0.0) const override;
};

} // namespace largefile
