#include "StandardizerConfig.hpp"
#include "../matching/ScoreCombiner.hpp"
#include "../matching/SimilarityMetrics.hpp"

#include <cmath>
#include <sstream>

namespace standardize
{

namespace
{

bool inUnitRange(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // anonymous namespace

std::vector<double> StandardizerConfig::effectiveWeights() const
{
    return weights.empty() ? matching::ScoreCombiner::DefaultWeights() : weights;
}

bool StandardizerConfig::validate(std::string& out_error) const
{
    if (!inUnitRange(match_threshold))
    {
        std::ostringstream oss;
        oss << "matching threshold must be within [0, 1] (got " << match_threshold << ")";
        out_error = oss.str();
        return false;
    }

    if (!inUnitRange(auto_add_threshold))
    {
        std::ostringstream oss;
        oss << "auto-add threshold must be within [0, 1] (got " << auto_add_threshold << ")";
        out_error = oss.str();
        return false;
    }

    if (auto_add_threshold > match_threshold)
    {
        std::ostringstream oss;
        oss << "auto-add threshold (" << auto_add_threshold << ") must not exceed the matching threshold ("
            << match_threshold << ")";
        out_error = oss.str();
        return false;
    }

    if (ngram_size == 0)
    {
        out_error = "n-gram size must be at least 1";
        return false;
    }

    return matching::ScoreCombiner::validateWeights(effectiveWeights(), matching::kMetricCount, out_error);
}

} // namespace standardize
