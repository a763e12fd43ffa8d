#include "TeamFuzzyMatcher.hpp"
#include "Diagnostics.hpp"
#include "TeamNameNormalizer.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace matching
{

TeamFuzzyMatcher::TeamFuzzyMatcher()
    : TeamFuzzyMatcher(std::make_unique<TeamNameNormalizer>(), ScoreCombiner())
{
}

TeamFuzzyMatcher::TeamFuzzyMatcher(std::unique_ptr<ITextNormalizer> normalizer, ScoreCombiner combiner,
                                   std::size_t ngram_size)
    : normalizer_(normalizer ? std::move(normalizer) : std::make_unique<TeamNameNormalizer>())
    , combiner_(std::move(combiner))
    , ngram_size_(ngram_size == 0 ? 2 : ngram_size)
{
}

TeamFuzzyMatcher::~TeamFuzzyMatcher() = default;

std::optional<MatchResult> TeamFuzzyMatcher::findBestMatch(const std::string& query,
                                                             const std::vector<std::string>& candidates,
                                                             double threshold) const
{
    if (candidates.empty() || query.empty())
    {
        return std::nullopt;
    }

    // Normalize query once
    const std::u32string normalized_query = utf8ToUtf32(normalizer_->normalize(query));

    double best_score = 0.0;
    const std::string* best_match = nullptr;

    for (const auto& candidate : candidates)
    {
        if (candidate.empty())
        {
            continue;
        }

        const std::u32string normalized_candidate = utf8ToUtf32(normalizer_->normalize(candidate));
        double score = scoreNormalized(normalized_query, normalized_candidate);

        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "[TeamFuzzyMatcher] " << Diagnostics::Preview(query) << " vs "
                                                   << Diagnostics::Preview(candidate) << " = " << score;
        }

        if (score > best_score && score >= threshold)
        {
            best_score = score;
            best_match = &candidate; // Original (non-normalized) text
        }
    }

    if (best_match == nullptr)
    {
        return std::nullopt;
    }

    return MatchResult{ best_score, *best_match };
}

std::vector<MatchResult> TeamFuzzyMatcher::findMatches(const std::string& query,
                                                         const std::vector<std::string>& candidates,
                                                         double threshold) const
{
    std::vector<MatchResult> results;

    if (candidates.empty() || query.empty())
    {
        return results;
    }

    const std::u32string normalized_query = utf8ToUtf32(normalizer_->normalize(query));

    for (const auto& candidate : candidates)
    {
        if (candidate.empty())
        {
            continue;
        }

        double score = scoreNormalized(normalized_query, utf8ToUtf32(normalizer_->normalize(candidate)));
        if (score >= threshold)
        {
            results.push_back(MatchResult{ score, candidate });
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const MatchResult& a, const MatchResult& b) { return a.score > b.score; });

    return results;
}

double TeamFuzzyMatcher::similarity(const std::string& s1, const std::string& s2) const
{
    if (s1.empty() || s2.empty())
    {
        return 0.0;
    }
    if (s1 == s2)
    {
        return 1.0;
    }

    return scoreNormalized(utf8ToUtf32(normalizer_->normalize(s1)), utf8ToUtf32(normalizer_->normalize(s2)));
}

std::vector<std::pair<Metric, double>> TeamFuzzyMatcher::explain(const std::string& s1, const std::string& s2) const
{
    const std::u32string a = utf8ToUtf32(normalizer_->normalize(s1));
    const std::u32string b = utf8ToUtf32(normalizer_->normalize(s2));

    std::vector<std::pair<Metric, double>> breakdown;
    breakdown.reserve(kAllMetrics.size());
    for (Metric metric : kAllMetrics)
    {
        breakdown.emplace_back(metric, computeMetric(metric, a, b, ngram_size_));
    }
    return breakdown;
}

double TeamFuzzyMatcher::scoreNormalized(const std::u32string& a, const std::u32string& b) const
{
    // Identical normalized forms score exactly 1.0
    if (a == b)
    {
        return 1.0;
    }

    std::vector<double> scores;
    scores.reserve(kAllMetrics.size());
    for (Metric metric : kAllMetrics)
    {
        scores.push_back(computeMetric(metric, a, b, ngram_size_));
    }
    return combiner_.combine(scores);
}

} // namespace matching
