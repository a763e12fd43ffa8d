#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace matching
{

/**
 * @brief Pairwise similarity metrics over normalized code-point strings.
 *
 * Every ratio is symmetric and lies in [0.0, 1.0]. Inputs are expected to be the output of
 * an ITextNormalizer decoded to UTF-32; nothing here normalizes again.
 */
enum class Metric
{
    EditDistanceRatio, // 1 - levenshtein / max length
    Jaro,              // Classic Jaro similarity
    NgramJaccard,      // Jaccard index of overlapping character n-grams
    TokenSortRatio,    // Edit-distance ratio after sorting whitespace tokens
    TokenSetRatio,     // Best edit-distance ratio among token-set intersection/difference forms
    SequenceRatio      // Reference block-matching ratio (rapidfuzz Indel similarity)
};

constexpr std::size_t kMetricCount = 6;

constexpr std::array<Metric, kMetricCount> kAllMetrics = {
    Metric::EditDistanceRatio, Metric::Jaro,          Metric::NgramJaccard,
    Metric::TokenSortRatio,    Metric::TokenSetRatio, Metric::SequenceRatio
};

std::string_view metricName(Metric metric);

/// Unit-cost Levenshtein distance
std::size_t editDistance(const std::u32string& a, const std::u32string& b);

double editDistanceRatio(const std::u32string& a, const std::u32string& b);

double jaroSimilarity(const std::u32string& a, const std::u32string& b);

double ngramJaccard(const std::u32string& a, const std::u32string& b, std::size_t n = 2);

double tokenSortRatio(const std::u32string& a, const std::u32string& b);

double tokenSetRatio(const std::u32string& a, const std::u32string& b);

double sequenceRatio(const std::u32string& a, const std::u32string& b);

/// Dispatch by metric; ngram_size only affects Metric::NgramJaccard
double computeMetric(Metric metric, const std::u32string& a, const std::u32string& b, std::size_t ngram_size = 2);

} // namespace matching
