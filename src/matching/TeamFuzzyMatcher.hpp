#pragma once

#include "IFuzzyMatcher.hpp"
#include "ITextNormalizer.hpp"
#include "ScoreCombiner.hpp"
#include "SimilarityMetrics.hpp"

#include <memory>
#include <utility>

namespace matching
{

/**
 * @brief Multi-metric fuzzy matcher for team names.
 *
 * This implementation:
 * - Normalizes both sides with an ITextNormalizer (TeamNameNormalizer by default)
 * - Scores the normalized forms with every metric in kAllMetrics
 * - Combines the metric scores with a ScoreCombiner
 * - Normalizes candidates on every call; nothing is cached between calls
 *
 * Example:
 * @code
 * TeamFuzzyMatcher matcher;
 * auto best = matcher.findBestMatch("Kaunas Zalgiris", {"Kauno Zalgiris", "Real Madrid"}, 0.75);
 * // best->matched == "Kauno Zalgiris"
 * @endcode
 */
class TeamFuzzyMatcher : public IFuzzyMatcher
{
public:
    TeamFuzzyMatcher();
    TeamFuzzyMatcher(std::unique_ptr<ITextNormalizer> normalizer, ScoreCombiner combiner, std::size_t ngram_size = 2);
    ~TeamFuzzyMatcher() override;

    TeamFuzzyMatcher(const TeamFuzzyMatcher&) = delete;
    TeamFuzzyMatcher& operator=(const TeamFuzzyMatcher&) = delete;

    std::optional<MatchResult> findBestMatch(const std::string& query, const std::vector<std::string>& candidates,
                                              double threshold) const override;

    std::vector<MatchResult> findMatches(const std::string& query, const std::vector<std::string>& candidates,
                                          double threshold) const override;

    double similarity(const std::string& s1, const std::string& s2) const override;

    /// Per-metric scores of two raw strings, in kAllMetrics order
    std::vector<std::pair<Metric, double>> explain(const std::string& s1, const std::string& s2) const;

    const ITextNormalizer& normalizer() const { return *normalizer_; }

private:
    double scoreNormalized(const std::u32string& a, const std::u32string& b) const;

    std::unique_ptr<ITextNormalizer> normalizer_;
    ScoreCombiner combiner_;
    std::size_t ngram_size_;
};

} // namespace matching
