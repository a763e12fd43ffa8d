#pragma once

#include "MatchDecision.hpp"
#include "StandardizerConfig.hpp"
#include "../matching/TeamFuzzyMatcher.hpp"
#include "../registry/TeamRegistry.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace standardize
{

enum class AddOutcome
{
    Added,
    EmptyName,
    Duplicate,    // Exact (case-insensitive) name already registered
    SimilarExists // A name at or above the matching threshold is registered
};

std::string_view toString(AddOutcome outcome);

struct ManualAddResult
{
    AddOutcome outcome = AddOutcome::EmptyName;
    std::string existing_name; // Set for Duplicate and SimilarExists
    double similarity = 0.0;   // Set for SimilarExists
};

struct RegistryStatistics
{
    std::size_t total_teams = 0;
    std::map<std::string, std::size_t> categories; // Category key -> named entries
    std::size_t empty_names = 0;
    std::size_t session_additions = 0;
    double match_threshold = 0.0;
    double auto_add_threshold = 0.0;
};

nlohmann::ordered_json toJson(const RegistryStatistics& stats);

/**
 * @brief Decides what canonical name a raw team name maps to.
 *
 * Resolution order for a non-blank name within a category:
 * 1. Case-insensitive exact match against the category's names
 * 2. Best fuzzy match at or above the matching threshold
 * 3. Otherwise, when auto-add is requested and the best score is below the auto-add
 *    threshold, the trimmed name becomes a new canonical entry
 * 4. Otherwise the trimmed name is returned unchanged
 *
 * The registry is borrowed and must outlive the standardizer. Additions made through
 * this instance are remembered until resetSessionAdditions().
 */
class TeamStandardizer
{
    struct CreateKey
    {
        explicit CreateKey() = default;
    };

public:
    /**
     * @brief Build a standardizer after validating @p config.
     *
     * @return nullptr when the configuration is invalid; @p out_error receives the reason
     */
    static std::unique_ptr<TeamStandardizer> create(registry::TeamRegistry& registry,
                                                    const StandardizerConfig& config = {},
                                                    std::string* out_error = nullptr);

    /// Only reachable through create(); @p config is trusted to be valid
    TeamStandardizer(CreateKey, registry::TeamRegistry& registry, StandardizerConfig config);

    StandardizationResult standardize(const std::string& raw_name, const std::string& category,
                                      bool auto_add = true);

    /// Add a team outside the matching flow; @p force skips the similarity check only
    ManualAddResult addManually(const std::string& name, const std::string& category, bool force = false);

    const std::vector<registry::CanonicalEntry>& sessionAdditions() const { return session_additions_; }
    void resetSessionAdditions() { session_additions_.clear(); }

    RegistryStatistics statistics() const;

    const StandardizerConfig& config() const { return config_; }
    const matching::TeamFuzzyMatcher& matcher() const { return *matcher_; }
    registry::TeamRegistry& registry() { return registry_; }
    const registry::TeamRegistry& registry() const { return registry_; }

private:
    registry::CanonicalEntry addEntry(const std::string& category, const std::string& name);

    registry::TeamRegistry& registry_;
    StandardizerConfig config_;
    std::unique_ptr<matching::TeamFuzzyMatcher> matcher_;
    std::vector<registry::CanonicalEntry> session_additions_;
};

} // namespace standardize
