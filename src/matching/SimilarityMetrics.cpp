#include "SimilarityMetrics.hpp"
#include "TextUtils.hpp"

#include <rapidfuzz/distance.hpp>
#include <rapidfuzz/fuzz.hpp>

#include <algorithm>
#include <iterator>
#include <set>
#include <unordered_set>
#include <vector>

namespace matching
{

namespace
{

std::unordered_set<std::u32string> ngramSet(const std::u32string& text, std::size_t n)
{
    std::unordered_set<std::u32string> grams;
    if (text.size() < n)
    {
        grams.insert(text);
        return grams;
    }
    for (std::size_t i = 0; i + n <= text.size(); ++i)
    {
        grams.insert(text.substr(i, n));
    }
    return grams;
}

std::u32string joinSorted(const std::set<std::u32string>& tokens)
{
    return joinTokens(std::vector<std::u32string>(tokens.begin(), tokens.end()));
}

double clampUnit(double value)
{
    return std::clamp(value, 0.0, 1.0);
}

} // anonymous namespace

std::string_view metricName(Metric metric)
{
    switch (metric)
    {
    case Metric::EditDistanceRatio:
        return "edit_distance_ratio";
    case Metric::Jaro:
        return "jaro";
    case Metric::NgramJaccard:
        return "ngram_jaccard";
    case Metric::TokenSortRatio:
        return "token_sort_ratio";
    case Metric::TokenSetRatio:
        return "token_set_ratio";
    case Metric::SequenceRatio:
        return "sequence_ratio";
    }
    return "unknown";
}

std::size_t editDistance(const std::u32string& a, const std::u32string& b)
{
    return static_cast<std::size_t>(rapidfuzz::levenshtein_distance(a, b));
}

double editDistanceRatio(const std::u32string& a, const std::u32string& b)
{
    // 1 - distance / max length; both empty is 1.0
    return clampUnit(rapidfuzz::levenshtein_normalized_similarity(a, b));
}

double jaroSimilarity(const std::u32string& a, const std::u32string& b)
{
    if (a.empty() || b.empty())
        return 0.0;
    return clampUnit(rapidfuzz::jaro_similarity(a, b));
}

double ngramJaccard(const std::u32string& a, const std::u32string& b, std::size_t n)
{
    if (a.empty() && b.empty())
        return 1.0;
    if (a.empty() || b.empty())
        return 0.0;
    if (n == 0)
        n = 1;

    const auto grams_a = ngramSet(a, n);
    const auto grams_b = ngramSet(b, n);
    const auto& smaller = grams_a.size() < grams_b.size() ? grams_a : grams_b;
    const auto& larger = grams_a.size() < grams_b.size() ? grams_b : grams_a;

    std::size_t shared = 0;
    for (const auto& gram : smaller)
    {
        if (larger.count(gram) > 0)
            ++shared;
    }

    const std::size_t union_size = grams_a.size() + grams_b.size() - shared;
    return union_size > 0 ? static_cast<double>(shared) / static_cast<double>(union_size) : 0.0;
}

double tokenSortRatio(const std::u32string& a, const std::u32string& b)
{
    auto tokens_a = splitTokens(a);
    auto tokens_b = splitTokens(b);
    std::sort(tokens_a.begin(), tokens_a.end());
    std::sort(tokens_b.begin(), tokens_b.end());
    return editDistanceRatio(joinTokens(tokens_a), joinTokens(tokens_b));
}

double tokenSetRatio(const std::u32string& a, const std::u32string& b)
{
    const auto split_a = splitTokens(a);
    const auto split_b = splitTokens(b);
    const std::set<std::u32string> set_a(split_a.begin(), split_a.end());
    const std::set<std::u32string> set_b(split_b.begin(), split_b.end());

    if (set_a.empty() && set_b.empty())
        return 1.0;
    if (set_a.empty() || set_b.empty())
        return 0.0;

    std::set<std::u32string> shared;
    std::set_intersection(set_a.begin(), set_a.end(), set_b.begin(), set_b.end(),
                          std::inserter(shared, shared.end()));

    const std::u32string joined_shared = joinSorted(shared);
    const std::u32string joined_a = joinSorted(set_a);
    const std::u32string joined_b = joinSorted(set_b);

    return std::max({ editDistanceRatio(joined_shared, joined_a), editDistanceRatio(joined_shared, joined_b),
                      editDistanceRatio(joined_a, joined_b) });
}

double sequenceRatio(const std::u32string& a, const std::u32string& b)
{
    if (a.empty() && b.empty())
        return 1.0;
    // rapidfuzz scores are in [0, 100]
    return clampUnit(rapidfuzz::fuzz::ratio(a, b) / 100.0);
}

double computeMetric(Metric metric, const std::u32string& a, const std::u32string& b, std::size_t ngram_size)
{
    switch (metric)
    {
    case Metric::EditDistanceRatio:
        return editDistanceRatio(a, b);
    case Metric::Jaro:
        return jaroSimilarity(a, b);
    case Metric::NgramJaccard:
        return ngramJaccard(a, b, ngram_size);
    case Metric::TokenSortRatio:
        return tokenSortRatio(a, b);
    case Metric::TokenSetRatio:
        return tokenSetRatio(a, b);
    case Metric::SequenceRatio:
        return sequenceRatio(a, b);
    }
    return 0.0;
}

} // namespace matching
