#pragma once

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace standardize
{

enum class MatchStatus
{
    Empty,        // Blank input, nothing to resolve
    ExactMatch,   // Case-insensitive equality with a registry entry
    FuzzyMatch,   // Best candidate reached the matching threshold
    AutoAdded,    // Nothing similar enough existed; the name was added to the registry
    NoMatchNoAdd  // Gray zone or auto-add disabled; name returned unchanged
};

std::string_view toString(MatchStatus status);

/**
 * @brief How a single standardization call was resolved.
 *
 * score is 1.0 for exact matches, the combined score for fuzzy matches and the best
 * existing score for the two no-match outcomes.
 */
struct MatchDecision
{
    MatchStatus status = MatchStatus::Empty;
    double score = 0.0;
    std::optional<std::string> matched_name;
    std::optional<double> best_existing_score;
    std::optional<std::string> best_existing_name;
    std::optional<double> auto_add_threshold;
};

struct StandardizationResult
{
    std::string canonical_name;
    MatchDecision decision;
};

/// {"status": ..., "score": ..., optional fields only when set}
nlohmann::ordered_json toJson(const MatchDecision& decision);

} // namespace standardize
