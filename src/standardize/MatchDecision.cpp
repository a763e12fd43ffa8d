#include "MatchDecision.hpp"

#include <nlohmann/json.hpp>

namespace standardize
{

std::string_view toString(MatchStatus status)
{
    switch (status)
    {
    case MatchStatus::Empty:
        return "empty";
    case MatchStatus::ExactMatch:
        return "exact_match";
    case MatchStatus::FuzzyMatch:
        return "fuzzy_match";
    case MatchStatus::AutoAdded:
        return "auto_added";
    case MatchStatus::NoMatchNoAdd:
        return "no_match_no_add";
    }
    return "unknown";
}

nlohmann::ordered_json toJson(const MatchDecision& decision)
{
    nlohmann::ordered_json details;
    details["status"] = std::string(toString(decision.status));
    details["score"] = decision.score;

    if (decision.matched_name)
        details["matched_name"] = *decision.matched_name;
    if (decision.best_existing_score)
        details["best_existing_score"] = *decision.best_existing_score;
    if (decision.best_existing_name)
        details["best_existing_name"] = *decision.best_existing_name;
    else if (decision.best_existing_score)
        details["best_existing_name"] = nullptr;
    if (decision.auto_add_threshold)
        details["auto_add_threshold"] = *decision.auto_add_threshold;

    return details;
}

} // namespace standardize
