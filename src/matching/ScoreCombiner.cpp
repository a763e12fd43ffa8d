#include "ScoreCombiner.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace matching
{

namespace
{
constexpr double kWeightSumTolerance = 1e-6;
}

std::vector<double> ScoreCombiner::DefaultWeights()
{
    return { 0.05, 0.10, 0.10, 0.35, 0.35, 0.05 };
}

ScoreCombiner::ScoreCombiner()
    : weights_(DefaultWeights())
{
}

ScoreCombiner::ScoreCombiner(std::vector<double> weights)
    : weights_(std::move(weights))
{
}

bool ScoreCombiner::validateWeights(const std::vector<double>& weights, std::size_t expected_count,
                                    std::string& out_error)
{
    if (weights.size() != expected_count)
    {
        std::ostringstream oss;
        oss << "expected " << expected_count << " metric weights, got " << weights.size();
        out_error = oss.str();
        return false;
    }

    double sum = 0.0;
    for (std::size_t i = 0; i < weights.size(); ++i)
    {
        if (!std::isfinite(weights[i]) || weights[i] < 0.0)
        {
            std::ostringstream oss;
            oss << "metric weight #" << i << " must be a non-negative number (got " << weights[i] << ")";
            out_error = oss.str();
            return false;
        }
        sum += weights[i];
    }

    if (std::fabs(sum - 1.0) > kWeightSumTolerance)
    {
        std::ostringstream oss;
        oss << "metric weights must sum to 1.0 (got " << sum << ")";
        out_error = oss.str();
        return false;
    }

    return true;
}

double ScoreCombiner::combine(const std::vector<double>& scores) const
{
    const std::size_t count = std::min(scores.size(), weights_.size());
    double total = 0.0;
    for (std::size_t i = 0; i < count; ++i)
    {
        total += scores[i] * weights_[i];
    }
    return std::clamp(total, 0.0, 1.0);
}

} // namespace matching
