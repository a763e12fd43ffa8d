#include "TeamStandardizer.hpp"
#include "../matching/Diagnostics.hpp"
#include "../matching/TeamNameNormalizer.hpp"
#include "../matching/TextUtils.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <utility>

using matching::Diagnostics;

namespace standardize
{

std::string_view toString(AddOutcome outcome)
{
    switch (outcome)
    {
    case AddOutcome::Added:
        return "added";
    case AddOutcome::EmptyName:
        return "empty_name";
    case AddOutcome::Duplicate:
        return "duplicate";
    case AddOutcome::SimilarExists:
        return "similar_exists";
    }
    return "unknown";
}

nlohmann::ordered_json toJson(const RegistryStatistics& stats)
{
    nlohmann::ordered_json out;
    out["total_teams"] = stats.total_teams;
    out["sports"] = nlohmann::ordered_json::object();
    for (const auto& [category, count] : stats.categories)
        out["sports"][category] = count;
    out["empty_names"] = stats.empty_names;
    out["newly_added_this_session"] = stats.session_additions;
    out["configuration"] = {
        {"match_threshold", stats.match_threshold},
        {"auto_add_threshold", stats.auto_add_threshold},
    };
    return out;
}

std::unique_ptr<TeamStandardizer> TeamStandardizer::create(registry::TeamRegistry& registry,
                                                           const StandardizerConfig& config, std::string* out_error)
{
    std::string error;
    if (!config.validate(error))
    {
        PLOG_ERROR_(Diagnostics::kLogInstance) << "[TeamStandardizer] Invalid configuration: " << error;
        if (out_error)
            *out_error = error;
        return nullptr;
    }

    return std::make_unique<TeamStandardizer>(CreateKey{}, registry, config);
}

TeamStandardizer::TeamStandardizer(CreateKey, registry::TeamRegistry& registry, StandardizerConfig config)
    : registry_(registry)
    , config_(std::move(config))
    , matcher_(std::make_unique<matching::TeamFuzzyMatcher>(std::make_unique<matching::TeamNameNormalizer>(),
                                                            matching::ScoreCombiner(config_.effectiveWeights()),
                                                            config_.ngram_size))
{
    PLOG_DEBUG_(Diagnostics::kLogInstance) << "[TeamStandardizer] threshold=" << config_.match_threshold
                                           << " auto_add_threshold=" << config_.auto_add_threshold
                                           << " registry=" << registry_.size() << " entries";
}

StandardizationResult TeamStandardizer::standardize(const std::string& raw_name, const std::string& category,
                                                    bool auto_add)
{
    StandardizationResult result;
    const std::string name = matching::toValidUtf8(matching::trim(raw_name));
    if (name.empty())
    {
        result.decision.status = MatchStatus::Empty;
        return result;
    }

    if (auto exact = registry_.findExact(category, name))
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[TeamStandardizer] Exact match: " << Diagnostics::Preview(name)
                                               << " -> " << Diagnostics::Preview(*exact);
        result.canonical_name = *exact;
        result.decision.status = MatchStatus::ExactMatch;
        result.decision.score = 1.0;
        result.decision.matched_name = std::move(*exact);
        return result;
    }

    const auto& candidates = registry_.lookup(category);
    if (auto match = matcher_->findBestMatch(name, candidates, config_.match_threshold))
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[TeamStandardizer] Fuzzy match: " << Diagnostics::Preview(name)
                                              << " -> " << Diagnostics::Preview(match->matched)
                                              << " (score: " << match->score << ")";
        result.canonical_name = match->matched;
        result.decision.status = MatchStatus::FuzzyMatch;
        result.decision.score = match->score;
        result.decision.matched_name = std::move(match->matched);
        return result;
    }

    double best_score = 0.0;
    std::optional<std::string> best_name;
    if (auto best = matcher_->findBestMatch(name, candidates, 0.0))
    {
        best_score = best->score;
        best_name = std::move(best->matched);
    }

    result.canonical_name = name;
    result.decision.score = best_score;
    result.decision.best_existing_score = best_score;
    result.decision.best_existing_name = best_name;

    if (auto_add && best_score < config_.auto_add_threshold)
    {
        addEntry(category, name);
        PLOG_INFO_(Diagnostics::kLogInstance) << "[TeamStandardizer] Auto-added " << Diagnostics::Preview(name)
                                              << " to " << Diagnostics::Preview(category)
                                              << " (best existing: " << best_score << ")";
        result.decision.status = MatchStatus::AutoAdded;
        return result;
    }

    PLOG_WARNING_(Diagnostics::kLogInstance) << "[TeamStandardizer] No match for " << Diagnostics::Preview(name)
                                             << " in " << Diagnostics::Preview(category)
                                             << " (best existing: " << best_score << ")";
    result.decision.status = MatchStatus::NoMatchNoAdd;
    result.decision.auto_add_threshold = config_.auto_add_threshold;
    return result;
}

ManualAddResult TeamStandardizer::addManually(const std::string& name, const std::string& category, bool force)
{
    ManualAddResult result;
    const std::string trimmed = matching::toValidUtf8(matching::trim(name));
    if (trimmed.empty())
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[TeamStandardizer] Refusing to add an empty team name";
        result.outcome = AddOutcome::EmptyName;
        return result;
    }

    if (auto exact = registry_.findExact(category, trimmed))
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[TeamStandardizer] " << Diagnostics::Preview(trimmed)
                                                 << " already exists in " << Diagnostics::Preview(category);
        result.outcome = AddOutcome::Duplicate;
        result.existing_name = std::move(*exact);
        return result;
    }

    if (!force)
    {
        if (auto similar = matcher_->findBestMatch(trimmed, registry_.lookup(category), config_.match_threshold))
        {
            PLOG_WARNING_(Diagnostics::kLogInstance) << "[TeamStandardizer] Similar team exists: "
                                                     << Diagnostics::Preview(similar->matched)
                                                     << " (score: " << similar->score << ")";
            result.outcome = AddOutcome::SimilarExists;
            result.existing_name = std::move(similar->matched);
            result.similarity = similar->score;
            return result;
        }
    }

    addEntry(category, trimmed);
    PLOG_INFO_(Diagnostics::kLogInstance) << "[TeamStandardizer] Manually added " << Diagnostics::Preview(trimmed)
                                          << " to " << Diagnostics::Preview(category);
    result.outcome = AddOutcome::Added;
    return result;
}

RegistryStatistics TeamStandardizer::statistics() const
{
    RegistryStatistics stats;
    stats.total_teams = registry_.size();
    stats.session_additions = session_additions_.size();
    stats.match_threshold = config_.match_threshold;
    stats.auto_add_threshold = config_.auto_add_threshold;

    for (const auto& entry : registry_.entries())
    {
        if (matching::trim(entry.name).empty())
        {
            ++stats.empty_names;
            continue;
        }
        std::string key = registry::TeamRegistry::categoryKey(entry.category);
        if (key.empty())
            key = "unknown";
        ++stats.categories[key];
    }
    return stats;
}

registry::CanonicalEntry TeamStandardizer::addEntry(const std::string& category, const std::string& name)
{
    auto entry = registry_.add(category, name);
    session_additions_.push_back(entry);
    return entry;
}

} // namespace standardize
