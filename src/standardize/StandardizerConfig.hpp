#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace standardize
{

/**
 * @brief Tunables of the standardization policy.
 *
 * Scores in [auto_add_threshold, match_threshold) form the gray zone where a name is
 * neither matched nor added, so auto_add_threshold must not exceed match_threshold.
 */
struct StandardizerConfig
{
    double match_threshold = 0.75;
    double auto_add_threshold = 0.70;
    std::size_t ngram_size = 2;
    std::vector<double> weights; // Empty selects ScoreCombiner::DefaultWeights()

    /// Weights in effect (defaults when none were configured)
    std::vector<double> effectiveWeights() const;

    bool validate(std::string& out_error) const;
};

} // namespace standardize
