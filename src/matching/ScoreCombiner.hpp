#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace matching
{

/**
 * @brief Weighted aggregation of per-metric scores into one confidence value.
 *
 * Weights are fixed at construction. They are checked once by validateWeights() (the
 * standardizer does so when it is created); combine() trusts them.
 */
class ScoreCombiner
{
public:
    /// Edit, Jaro, Jaccard, token-sort, token-set, sequence (see SimilarityMetrics.hpp)
    static std::vector<double> DefaultWeights();

    ScoreCombiner();
    explicit ScoreCombiner(std::vector<double> weights);

    /**
     * @brief Check that weights are non-negative, match the expected count and sum to 1.0.
     *
     * @param weights Candidate weights
     * @param expected_count Number of metrics the weights must cover
     * @param out_error Filled with a description when validation fails
     */
    static bool validateWeights(const std::vector<double>& weights, std::size_t expected_count,
                                std::string& out_error);

    /// Weighted sum of scores clamped to [0.0, 1.0]. Extra scores beyond the weight count are ignored.
    double combine(const std::vector<double>& scores) const;

    const std::vector<double>& weights() const { return weights_; }

private:
    std::vector<double> weights_;
};

} // namespace matching
