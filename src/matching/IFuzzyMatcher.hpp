#pragma once

#include <optional>
#include <string>
#include <vector>

namespace matching
{

/**
 * @brief Result of a fuzzy matching operation.
 */
struct MatchResult
{
    double score;        // Combined similarity score in [0.0, 1.0]
    std::string matched; // The original candidate text that was matched
};

/**
 * @brief Abstract interface for fuzzy name matchers.
 *
 * Implementations normalize both sides before scoring and always report the original
 * (non-normalized) candidate text.
 */
class IFuzzyMatcher
{
public:
    virtual ~IFuzzyMatcher() = default;

    /**
     * @brief Find the best matching candidate at or above the threshold.
     *
     * A candidate replaces the current best only when its score is strictly greater, so ties
     * resolve to the earliest candidate. The running best starts at 0.0: a candidate scoring
     * 0.0 is never returned, even with a threshold of 0.0.
     *
     * @param query The query string to match against candidates
     * @param candidates List of candidate strings to search
     * @param threshold Minimum similarity score [0.0, 1.0] required for a match
     * @return The best match if score >= threshold, otherwise std::nullopt
     */
    virtual std::optional<MatchResult> findBestMatch(const std::string& query,
                                                      const std::vector<std::string>& candidates,
                                                      double threshold) const = 0;

    /**
     * @brief Find all candidates matching at or above the threshold.
     *
     * @return Matches sorted by score (descending); equal scores keep candidate order
     */
    virtual std::vector<MatchResult> findMatches(const std::string& query,
                                                  const std::vector<std::string>& candidates,
                                                  double threshold) const = 0;

    /**
     * @brief Calculate similarity between two raw strings.
     *
     * @return Similarity score in [0.0, 1.0]; 0.0 when either string is empty
     */
    virtual double similarity(const std::string& s1, const std::string& s2) const = 0;
};

} // namespace matching
